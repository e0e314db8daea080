#include "shell/shell_interpreter.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <variant>

#include <yaml-cpp/yaml.h>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/value.hpp"
#include "plugins/plugin_registry.hpp"
#include "session/session_manager.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace {

struct HelpEntry {
    std::string_view usage;
    std::string_view summary;
};

constexpr HelpEntry help_entries[] = {
    {"use <module>", "Select a module and push it on the context stack"},
    {"set <option> <value>", "Set an option of the current module"},
    {"set -g <name> <value>", "Set a session variable"},
    {"unset <option>", "Restore an option to its default"},
    {"show modules|options|history|tools|variables|commands", "Display information"},
    {"show targets|findings", "Display the targets and findings of the session"},
    {"info [module]", "Describe a module and its options"},
    {"run", "Run the current module"},
    {"back", "Leave the current module"},
    {"sessions create|switch|remove <id>", "Manage sessions"},
    {"sessions list", "List sessions"},
    {"targets [list]", "List targets of the session"},
    {"targets add <name> [address] [hostname]", "Add a target"},
    {"findings [list [target-id]]", "List findings, optionally for one target"},
    {"findings add <target-id> <severity> <name>", "Record a finding by hand"},
    {"config [get <key> | set <key> <value> | save]", "Inspect or change configuration"},
    {"help", "Show this help"},
    {"exit", "Leave penkit"},
};

[[nodiscard]] CommandStatus usage(std::ostream &err, std::string_view text) {
    err << "error: usage: " << text << std::endl;
    return CommandStatus::Error;
}

[[nodiscard]] std::string join_from(const std::vector<std::string> &args, std::size_t first) {
    std::string joined;
    for (std::size_t i = first; i < args.size(); ++i) {
        if (i > first) {
            joined += ' ';
        }
        joined += args[i];
    }
    return joined;
}

[[nodiscard]] std::uint64_t parse_target_id(const std::string &text) {
    const auto value = coerce_value(ValueType::Int, text);
    if (!value.has_value() || std::get<std::int64_t>(*value) <= 0) {
        throw InvalidOptionError("invalid target id '" + text + "'");
    }

    return static_cast<std::uint64_t>(std::get<std::int64_t>(*value));
}

[[nodiscard]] std::string format_seconds(std::chrono::milliseconds elapsed) {
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(2) << static_cast<double>(elapsed.count()) / 1000.0 << "s";
    return stream.str();
}

} // namespace

ShellInterpreter::ShellInterpreter(SessionManager &sessions, ConfigStore &config, const PluginRegistry &registry,
                                   const ToolCatalog &tools)
    : sessions_(sessions), config_(config), registry_(registry), tools_(tools) {
    register_commands();
}

void ShellInterpreter::register_commands() {
    commands_["use"] = [this](const auto &args, auto &out, auto &err) { return command_use(args, out, err); };
    commands_["set"] = [this](const auto &args, auto &out, auto &err) { return command_set(args, out, err); };
    commands_["unset"] = [this](const auto &args, auto &out, auto &err) { return command_unset(args, out, err); };
    commands_["show"] = [this](const auto &args, auto &out, auto &err) { return command_show(args, out, err); };
    commands_["run"] = [this](const auto &args, auto &out, auto &err) { return command_run(args, out, err); };
    commands_["back"] = [this](const auto &args, auto &out, auto &err) { return command_back(args, out, err); };
    commands_["sessions"] = [this](const auto &args, auto &out, auto &err) { return command_sessions(args, out, err); };
    commands_["targets"] = [this](const auto &args, auto &out, auto &err) { return command_targets(args, out, err); };
    commands_["findings"] = [this](const auto &args, auto &out, auto &err) {
        return command_findings(args, out, err);
    };
    commands_["info"] = [this](const auto &args, auto &out, auto &err) { return command_info(args, out, err); };
    commands_["config"] = [this](const auto &args, auto &out, auto &err) { return command_config(args, out, err); };
    commands_["help"] = [this](const auto &args, auto &out, auto &err) { return command_help(args, out, err); };
    commands_["exit"] = [this](const auto &args, auto &out, auto &err) { return command_exit(args, out, err); };
}

CommandStatus ShellInterpreter::execute(std::string_view line, std::ostream &out, std::ostream &err) {
    auto parsed = parser_.parse(line);
    if (parsed.has_value() && parsed->empty()) {
        return CommandStatus::Ok;
    }

    history_.emplace_back(line);

    if (!parsed.has_value()) {
        err << "error: " << parsed.error().message << std::endl;
        return CommandStatus::Error;
    }

    auto it = commands_.find(parsed->name);
    if (it == commands_.end()) {
        err << "error: unknown command '" << parsed->name << "' (try 'help')" << std::endl;
        return CommandStatus::Error;
    }

    try {
        return it->second(parsed->args, out, err);
    } catch (const PenkitError &error) {
        err << "error: " << error.what() << std::endl;
    } catch (const std::exception &error) {
        err << "error: " << parsed->name << ": " << error.what() << std::endl;
    }

    return CommandStatus::Error;
}

bool ShellInterpreter::is_command(std::string_view name) const { return commands_.contains(std::string(name)); }

std::vector<std::string> ShellInterpreter::names() const {
    std::vector<std::string> result;
    result.reserve(commands_.size());

    for (const auto &[name, _] : commands_) {
        result.push_back(name);
    }

    std::sort(result.begin(), result.end());
    return result;
}

const std::vector<std::string> &ShellInterpreter::history() const noexcept { return history_; }

std::string ShellInterpreter::prompt() const {
    const auto &session = sessions_.current();
    std::string context = session.id();

    if (const auto *active = session.active(); active != nullptr) {
        context += ":" + active->name();
    }

    return "penkit (" + context + ") > ";
}

CommandStatus ShellInterpreter::command_use(const std::vector<std::string> &args, std::ostream &out,
                                            std::ostream &err) {
    if (args.size() != 1) {
        return usage(err, "use <module>");
    }

    const auto &instance = sessions_.use(args.front());
    out << "using " << instance.name() << std::endl;
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_set(const std::vector<std::string> &args, std::ostream &out,
                                            std::ostream &err) {
    if (!args.empty() && args.front() == "-g") {
        if (args.size() < 3) {
            return usage(err, "set -g <name> <value>");
        }

        const auto value = join_from(args, 2);
        sessions_.set_variable(args[1], value);
        out << args[1] << " => " << value << " (session)" << std::endl;
        return CommandStatus::Ok;
    }

    if (args.size() < 2) {
        return usage(err, "set <option> <value>");
    }

    const auto value = join_from(args, 1);
    sessions_.set_option(args.front(), value);
    out << args.front() << " => " << value << std::endl;
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_unset(const std::vector<std::string> &args, std::ostream &out,
                                              std::ostream &err) {
    if (!args.empty() && args.front() == "-g") {
        if (args.size() != 2) {
            return usage(err, "unset -g <name>");
        }

        if (!sessions_.unset_variable(args[1])) {
            err << "error: variable '" << args[1] << "' is not set" << std::endl;
            return CommandStatus::Error;
        }

        out << "unset " << args[1] << std::endl;
        return CommandStatus::Ok;
    }

    if (args.size() != 1) {
        return usage(err, "unset <option>");
    }

    sessions_.unset_option(args.front());
    out << "unset " << args.front() << std::endl;
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_show(const std::vector<std::string> &args, std::ostream &out,
                                             std::ostream &err) {
    if (args.size() != 1) {
        return usage(err, "show modules|options|history|tools|variables|commands|targets|findings");
    }

    const auto &what = args.front();
    if (what == "modules") {
        show_modules(out);
    } else if (what == "options") {
        show_options(out);
    } else if (what == "history") {
        show_history(out);
    } else if (what == "tools") {
        show_tools(out);
    } else if (what == "variables") {
        show_variables(out);
    } else if (what == "commands") {
        show_commands(out);
    } else if (what == "targets") {
        show_targets(out);
    } else if (what == "findings") {
        show_findings(out);
    } else {
        return usage(err, "show modules|options|history|tools|variables|commands|targets|findings");
    }

    return CommandStatus::Ok;
}

void ShellInterpreter::show_modules(std::ostream &out) const {
    out << std::left << std::setw(20) << "Name" << std::setw(10) << "Version" << std::setw(16) << "Author"
        << "Description" << '\n';

    for (const auto &descriptor : registry_.list()) {
        out << std::left << std::setw(20) << descriptor.name << std::setw(10) << descriptor.version << std::setw(16)
            << (descriptor.author.empty() ? "-" : descriptor.author) << descriptor.description << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_options(std::ostream &out) const {
    const auto options = sessions_.options();
    const auto *active = sessions_.current().active();

    out << "Module options (" << active->name() << "):\n\n";
    out << "  " << std::left << std::setw(20) << "Name" << std::setw(24) << "Value" << std::setw(10) << "Required"
        << "Description" << '\n';

    for (const auto &option : options) {
        const std::string value = option.value.has_value() ? to_string(*option.value) : "";
        out << "  " << std::left << std::setw(20) << option.name << std::setw(24) << value << std::setw(10)
            << (option.required ? "yes" : "no") << option.description << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_history(std::ostream &out) const {
    const auto &history = sessions_.current().history();
    if (history.empty()) {
        out << "no results in session " << sessions_.current_id() << std::endl;
        return;
    }

    for (const auto &result : history) {
        out << '#' << result.sequence << "  " << std::left << std::setw(16) << result.module
            << (result.success ? "ok      " : "failed  ") << "exit=" << result.exit_code << "  "
            << format_seconds(result.elapsed);

        if (result.payload["result"]) {
            out << "  " << result.payload["result"].as<std::string>("");
        }
        out << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_tools(std::ostream &out) const {
    for (const auto *tool : tools_.list()) {
        out << std::left << std::setw(16) << tool->descriptor().name << std::setw(12)
            << mode_name(tool->descriptor().mode) << tool->describe_route() << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_variables(std::ostream &out) const {
    const auto &variables = sessions_.variables();
    if (variables.empty()) {
        out << "no session variables" << std::endl;
        return;
    }

    for (const auto &[name, value] : variables) {
        out << name << " = " << value << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_commands(std::ostream &out) const {
    for (std::size_t i = 0; i < history_.size(); ++i) {
        out << "    " << i + 1 << "  " << history_[i] << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_targets(std::ostream &out) const {
    const auto &targets = sessions_.targets();
    if (targets.empty()) {
        out << "no targets in session " << sessions_.current_id() << std::endl;
        return;
    }

    out << std::left << std::setw(6) << "Id" << std::setw(20) << "Name" << std::setw(32) << "Address" << std::setw(20)
        << "Hostname" << "Status" << '\n';

    for (const auto &target : targets) {
        out << std::left << std::setw(6) << target.id << std::setw(20) << target.name << std::setw(32)
            << target.address << std::setw(20) << target.hostname << target.status << '\n';
    }

    out.flush();
}

void ShellInterpreter::show_findings(std::ostream &out, std::optional<std::uint64_t> target_id) const {
    const auto findings = sessions_.findings(target_id);
    if (findings.empty()) {
        out << "no findings in session " << sessions_.current_id() << std::endl;
        return;
    }

    for (const auto *finding : findings) {
        out << '#' << finding->id << "  target " << finding->target_id << "  " << std::left << std::setw(10)
            << finding->severity << finding->name;

        if (!finding->description.empty()) {
            out << " - " << finding->description;
        }
        if (!finding->source.empty()) {
            out << " [" << finding->source << ']';
        }
        out << '\n';
    }

    out.flush();
}

CommandStatus ShellInterpreter::command_run(const std::vector<std::string> &args, std::ostream &out,
                                            std::ostream &err) {
    if (!args.empty()) {
        return usage(err, "run");
    }

    const auto &result = sessions_.run();
    render_result(result, out);

    if (!result.success) {
        err << "error: " << result.module << " failed: " << result.error << std::endl;
        return CommandStatus::Error;
    }

    return CommandStatus::Ok;
}

void ShellInterpreter::render_result(const ExecutionResult &result, std::ostream &out) {
    out << (result.success ? "[+] " : "[-] ") << result.module << " #" << result.sequence << " finished in "
        << format_seconds(result.elapsed);

    if (result.exit_code >= 0) {
        out << " (exit code " << result.exit_code << ")";
    }
    out << '\n';

    if (!result.command.empty()) {
        out << "command: " << result.command << '\n';
    }

    YAML::Emitter emitter;
    emitter << result.payload;
    out << emitter.c_str() << std::endl;
}

CommandStatus ShellInterpreter::command_back(const std::vector<std::string> &args, std::ostream &out,
                                             std::ostream &err) {
    if (!args.empty()) {
        return usage(err, "back");
    }

    if (!sessions_.back()) {
        out << "no module selected" << std::endl;
    }

    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_sessions(const std::vector<std::string> &args, std::ostream &out,
                                                 std::ostream &err) {
    if (args.size() == 1 && args.front() == "list") {
        for (const auto *session : sessions_.list()) {
            const bool is_current = session->id() == sessions_.current_id();
            out << (is_current ? "* " : "  ") << std::left << std::setw(16) << session->id() << std::setw(18)
                << state_name(session->state()) << session->history().size() << " result(s)\n";
        }
        out.flush();
        return CommandStatus::Ok;
    }

    if (args.size() != 2) {
        return usage(err, "sessions create|switch|remove <id> | sessions list");
    }

    const auto &action = args[0];
    const auto &id = args[1];

    if (action == "create") {
        sessions_.create(id);
        sessions_.switch_to(id);
        out << "created session " << id << std::endl;
    } else if (action == "switch") {
        sessions_.switch_to(id);
        out << "switched to session " << id << std::endl;
    } else if (action == "remove") {
        sessions_.remove(id);
        out << "removed session " << id << std::endl;
    } else {
        return usage(err, "sessions create|switch|remove <id> | sessions list");
    }

    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_targets(const std::vector<std::string> &args, std::ostream &out,
                                                std::ostream &err) {
    if (args.empty() || (args.size() == 1 && args.front() == "list")) {
        show_targets(out);
        return CommandStatus::Ok;
    }

    if (args.front() != "add" || args.size() < 2 || args.size() > 4) {
        return usage(err, "targets [list] | targets add <name> [address] [hostname]");
    }

    const auto &target = sessions_.add_target(args[1], args.size() > 2 ? args[2] : "", args.size() > 3 ? args[3] : "");
    out << "added target #" << target.id << " " << target.name << std::endl;
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_findings(const std::vector<std::string> &args, std::ostream &out,
                                                 std::ostream &err) {
    if (args.empty() || (args.size() == 1 && args.front() == "list")) {
        show_findings(out);
        return CommandStatus::Ok;
    }

    if (args.size() == 2 && args.front() == "list") {
        show_findings(out, parse_target_id(args[1]));
        return CommandStatus::Ok;
    }

    if (args.front() != "add" || args.size() < 4) {
        return usage(err, "findings [list [target-id]] | findings add <target-id> <severity> <name>");
    }

    const auto &finding = sessions_.add_finding(parse_target_id(args[1]), args[2], join_from(args, 3));
    out << "added finding #" << finding.id << " " << finding.name << std::endl;
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_info(const std::vector<std::string> &args, std::ostream &out,
                                             std::ostream &err) {
    if (args.size() > 1) {
        return usage(err, "info [module]");
    }

    std::string name;
    if (!args.empty()) {
        name = args.front();
    } else if (const auto *active = sessions_.current().active(); active != nullptr) {
        name = active->name();
    } else {
        return usage(err, "info <module>");
    }

    const auto &descriptor = registry_.lookup(name).descriptor;
    out << descriptor.name << " - " << descriptor.description << '\n';
    out << "Version: " << descriptor.version << '\n';
    out << "Author: " << (descriptor.author.empty() ? "unknown" : descriptor.author) << '\n';

    if (descriptor.options.empty()) {
        out << "\nNo options available" << std::endl;
        return CommandStatus::Ok;
    }

    out << "\nOptions:\n";
    for (const auto &option : descriptor.options) {
        out << "  " << std::left << std::setw(20) << option.name << std::setw(8) << type_name(option.type)
            << std::setw(24) << (option.default_value.has_value() ? to_string(*option.default_value) : "")
            << (option.required ? "required  " : "          ") << option.description << '\n';
    }

    out.flush();
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_config(const std::vector<std::string> &args, std::ostream &out,
                                               std::ostream &err) {
    if (args.empty()) {
        for (const auto &entry : config_.entries()) {
            out << std::left << std::setw(34) << entry.key << std::setw(30) << to_string(entry.value) << '('
                << layer_name(entry.source) << ")\n";
        }
        out.flush();
        return CommandStatus::Ok;
    }

    const auto &action = args.front();

    if (action == "get" && args.size() == 2) {
        const auto entry = config_.entry(args[1]);
        out << entry.key << " = " << to_string(entry.value) << " (" << layer_name(entry.source) << ")" << std::endl;
        return CommandStatus::Ok;
    }

    if (action == "set" && args.size() >= 3) {
        config_.set(args[1], join_from(args, 2));
        out << args[1] << " => " << to_string(config_.get(args[1])) << std::endl;
        return CommandStatus::Ok;
    }

    if (action == "save" && args.size() == 1) {
        config_.save();
        out << "configuration saved to " << config_.user_file_path() << std::endl;
        return CommandStatus::Ok;
    }

    return usage(err, "config [get <key> | set <key> <value> | save]");
}

CommandStatus ShellInterpreter::command_help(const std::vector<std::string> & /*args*/, std::ostream &out,
                                             std::ostream & /*err*/) {
    out << "Commands:\n";
    for (const auto &entry : help_entries) {
        out << "  " << std::left << std::setw(52) << entry.usage << entry.summary << '\n';
    }

    out.flush();
    return CommandStatus::Ok;
}

CommandStatus ShellInterpreter::command_exit(const std::vector<std::string> & /*args*/, std::ostream & /*out*/,
                                             std::ostream & /*err*/) {
    return CommandStatus::Exit;
}

} // namespace penkit
