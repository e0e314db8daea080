#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace penkit {

struct ParseError {
    std::string message;
};

class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<std::string>, ParseError> tokenize(std::string_view input) const;
};

} // namespace penkit
