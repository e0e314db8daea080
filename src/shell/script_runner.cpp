#include "shell/script_runner.hpp"

#include <fstream>
#include <istream>
#include <ostream>

#include "core/errors.hpp"
#include "shell/shell_interpreter.hpp"

namespace penkit {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

} // namespace

ScriptRunner::ScriptRunner(ShellInterpreter &interpreter) : interpreter_(interpreter) {}

ScriptReport ScriptRunner::run_file(const std::string &path, bool continue_on_error, std::ostream &out,
                                    std::ostream &err) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ScriptError("cannot read script '" + path + "'");
    }

    return run_stream(input, path, continue_on_error, out, err);
}

ScriptReport ScriptRunner::run_stream(std::istream &input, std::string_view source, bool continue_on_error,
                                      std::ostream &out, std::ostream &err) {
    ScriptReport report;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;

        const auto command = trim(line);
        if (command.empty() || command.front() == '#') {
            continue;
        }

        ++report.executed;
        const auto status = interpreter_.execute(command, out, err);

        if (status == CommandStatus::Exit) {
            report.exit_requested = true;
            return report;
        }

        if (status == CommandStatus::Error) {
            ++report.failures;
            if (!report.failed_line.has_value()) {
                report.failed_line = line_number;
            }

            if (!continue_on_error) {
                err << "script " << source << ": line " << line_number << ": command failed" << std::endl;
                return report;
            }
        }
    }

    if (input.bad()) {
        throw ScriptError("error reading script '" + std::string(source) + "'");
    }

    if (report.failures > 0) {
        err << "script " << source << ": " << report.failures << " command(s) failed" << std::endl;
    }

    return report;
}

} // namespace penkit
