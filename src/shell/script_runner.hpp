#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace penkit {

class ShellInterpreter;

struct ScriptReport {
    std::size_t executed{0};
    std::size_t failures{0};
    // Line of the first failing command.
    std::optional<std::size_t> failed_line;
    bool exit_requested{false};

    [[nodiscard]] bool ok() const noexcept { return failures == 0; }
};

class ScriptRunner {
  public:
    explicit ScriptRunner(ShellInterpreter &interpreter);

    // Throws ScriptError when the file cannot be read.
    ScriptReport run_file(const std::string &path, bool continue_on_error, std::ostream &out, std::ostream &err);

    ScriptReport run_stream(std::istream &input, std::string_view source, bool continue_on_error, std::ostream &out,
                            std::ostream &err);

  private:
    ShellInterpreter &interpreter_;
};

} // namespace penkit
