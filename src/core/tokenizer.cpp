#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace penkit {

std::expected<std::vector<std::string>, ParseError> Tokenizer::tokenize(std::string_view input) const {
    std::vector<std::string> tokens;
    std::string token;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // Distinguishes an explicit empty argument ("") from no token at all.
    bool token_started = false;

    auto flush_token = [&]() {
        if (token_started) {
            tokens.push_back(std::move(token));
            token.clear();
            token_started = false;
        }
    };

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && current != '\\' && current != '"') {
                token.push_back('\\');
            }
            token.push_back(current);
            token_started = true;
            escaped = false;
            continue;
        }

        if (current == '\\' && !single_quoted) {
            escaped = true;
            continue;
        }

        if (current == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
            token_started = true;
            continue;
        }

        if (current == '"' && !single_quoted) {
            double_quoted = !double_quoted;
            token_started = true;
            continue;
        }

        const bool in_quotes = single_quoted || double_quoted;

        if (!in_quotes && std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        token.push_back(current);
        token_started = true;
    }

    if (single_quoted || double_quoted) {
        return std::unexpected(ParseError{"unterminated quote"});
    }

    if (escaped) {
        return std::unexpected(ParseError{"trailing backslash"});
    }

    flush_token();
    return tokens;
}

} // namespace penkit
