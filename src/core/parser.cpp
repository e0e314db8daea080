#include "core/parser.hpp"

#include <iterator>
#include <utility>

namespace penkit {

std::expected<CommandLine, ParseError> Parser::parse(std::string_view line) const {
    auto tokens = tokenizer_.tokenize(line);
    if (!tokens.has_value()) {
        return std::unexpected(std::move(tokens.error()));
    }

    CommandLine command;
    if (tokens->empty()) {
        return command;
    }

    command.name = std::move(tokens->front());
    command.args.assign(std::make_move_iterator(tokens->begin() + 1), std::make_move_iterator(tokens->end()));
    return command;
}

} // namespace penkit
