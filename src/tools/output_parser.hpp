#pragma once

#include <string_view>

#include <yaml-cpp/yaml.h>

namespace penkit {

// Normalizes raw tool output into a structured payload. Implementations must not have
// side effects and must not throw: content they cannot make sense of comes back with
// "parsed: false" and the raw text attached.
class OutputParser {
  public:
    virtual ~OutputParser() = default;

    [[nodiscard]] virtual YAML::Node parse(std::string_view standard_output, std::string_view standard_error) const = 0;
};

// nmap greppable output (-oG -).
class NmapGrepableParser final : public OutputParser {
  public:
    [[nodiscard]] YAML::Node parse(std::string_view standard_output, std::string_view standard_error) const override;
};

// sqlmap console output.
class SqlmapTextParser final : public OutputParser {
  public:
    [[nodiscard]] YAML::Node parse(std::string_view standard_output, std::string_view standard_error) const override;
};

class RawLinesParser final : public OutputParser {
  public:
    [[nodiscard]] YAML::Node parse(std::string_view standard_output, std::string_view standard_error) const override;
};

[[nodiscard]] YAML::Node unparsed_payload(std::string_view standard_output, std::string_view standard_error,
                                          std::string_view reason);

} // namespace penkit
