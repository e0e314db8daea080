#include "plugins/plugin.hpp"

#include <utility>

#include "core/errors.hpp"

namespace penkit {

ModuleInstance::ModuleInstance(const Plugin &plugin) : plugin_(&plugin), options_(plugin.descriptor.options) {}

const std::string &ModuleInstance::name() const noexcept { return plugin_->descriptor.name; }

const Plugin &ModuleInstance::plugin() const noexcept { return *plugin_; }

OptionSet &ModuleInstance::options() noexcept { return options_; }

const OptionSet &ModuleInstance::options() const noexcept { return options_; }

ModuleReport ModuleInstance::run(ModuleContext &context) const { return plugin_->run(options_, context); }

std::string substitute_options(std::string_view text, const OptionSet &options) {
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('{', pos);
        if (open == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }

        const auto close = text.find('}', open + 1);
        if (close == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }

        result.append(text.substr(pos, open - pos));

        const auto name = text.substr(open + 1, close - open - 1);
        if (options.declares(name)) {
            result += options.get_string(name);
        } else {
            result.append(text.substr(open, close - open + 1));
        }

        pos = close + 1;
    }

    return result;
}

ModuleReport report_from_tool(ToolOutput output) {
    ModuleReport report;
    report.payload = YAML::Clone(output.payload);

    const bool parsed = report.payload["parsed"] && report.payload["parsed"].as<bool>(false);
    report.success = output.exit_code == 0 && parsed;

    if (output.exit_code != 0) {
        report.error = output.command + " exited with code " + std::to_string(output.exit_code);
    } else if (!parsed) {
        report.error = "tool output could not be parsed";
    }

    report.tool = std::move(output);
    return report;
}

bool is_valid_timeout(std::int64_t seconds) noexcept { return seconds >= 1 && seconds <= max_tool_timeout.count(); }

std::chrono::seconds checked_timeout(std::int64_t seconds) {
    if (!is_valid_timeout(seconds)) {
        throw InvalidOptionError("timeout must be between 1 and " + std::to_string(max_tool_timeout.count()) +
                                 " seconds, got " + std::to_string(seconds));
    }

    return std::chrono::seconds(seconds);
}

ModuleReport report_from_timeout(const ExecutionTimeoutError &error) {
    ModuleReport report;
    report.success = false;
    report.error = error.what();

    report.payload["parsed"] = false;
    report.payload["result"] = "timeout";
    report.payload["error"] = std::string(error.what());

    ToolOutput partial;
    partial.standard_output = error.partial_stdout();
    partial.standard_error = error.partial_stderr();
    partial.exit_code = -1;
    report.tool = std::move(partial);

    return report;
}

} // namespace penkit
