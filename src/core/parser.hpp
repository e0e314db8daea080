#pragma once

#include <expected>
#include <string_view>

#include "core/command.hpp"
#include "core/tokenizer.hpp"

namespace penkit {

class Parser {
  public:
    // A blank line parses to an empty CommandLine.
    [[nodiscard]] std::expected<CommandLine, ParseError> parse(std::string_view line) const;

  private:
    Tokenizer tokenizer_;
};

} // namespace penkit
