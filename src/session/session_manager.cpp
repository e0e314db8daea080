#include "session/session_manager.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"
#include "plugins/plugin_registry.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace fs = std::filesystem;

namespace {

// Marks the session as running for the lifetime of the guard.
class RunningGuard {
  public:
    explicit RunningGuard(Session &session) : session_(session) { session_.set_running(true); }
    ~RunningGuard() { session_.set_running(false); }

    RunningGuard(const RunningGuard &) = delete;
    RunningGuard &operator=(const RunningGuard &) = delete;

  private:
    Session &session_;
};

[[nodiscard]] std::string join(const std::vector<std::string> &items, std::string_view separator) {
    std::string joined;
    for (const auto &item : items) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += item;
    }
    return joined;
}

[[nodiscard]] std::string iso_timestamp(std::chrono::system_clock::time_point point) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
    std::tm parts{};
    gmtime_r(&seconds, &parts);

    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return std::string(buffer, written);
}

[[nodiscard]] YAML::Node error_payload(const std::string &message) {
    YAML::Node payload;
    payload["parsed"] = false;
    payload["result"] = "error";
    payload["error"] = message;
    return payload;
}

} // namespace

SessionManager::SessionManager(const PluginRegistry &registry, const ConfigStore &config, const ToolCatalog &tools,
                               Logger &logger)
    : registry_(registry), config_(config), tools_(tools), logger_(logger) {
    create(default_session_id);
}

Session *SessionManager::find(std::string_view id) const {
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [id](const std::unique_ptr<Session> &session) { return session->id() == id; });
    return it == sessions_.end() ? nullptr : it->get();
}

Session &SessionManager::create(std::string_view id) {
    if (id.empty()) {
        throw SessionError("session id must not be empty");
    }

    if (!is_safe_path_component(id)) {
        throw SessionError("session id '" + std::string(id) + "' may only contain letters, digits, '_', '-' and '.'");
    }

    if (find(id) != nullptr) {
        throw DuplicateSessionError("session '" + std::string(id) + "' already exists");
    }

    sessions_.push_back(std::make_unique<Session>(std::string(id)));
    if (current_id_.empty()) {
        current_id_ = std::string(id);
    }

    logger_.debug("created session " + std::string(id));
    return *sessions_.back();
}

void SessionManager::switch_to(std::string_view id) {
    if (find(id) == nullptr) {
        throw NotFoundError("unknown session '" + std::string(id) + "'");
    }

    current_id_ = std::string(id);
}

void SessionManager::remove(std::string_view id) {
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [id](const std::unique_ptr<Session> &session) { return session->id() == id; });
    if (it == sessions_.end()) {
        throw NotFoundError("unknown session '" + std::string(id) + "'");
    }

    if ((*it)->id() == current_id_) {
        throw SessionError("cannot remove the current session '" + current_id_ + "'");
    }

    sessions_.erase(it);
}

std::vector<const Session *> SessionManager::list() const {
    std::vector<const Session *> result;
    result.reserve(sessions_.size());

    for (const auto &session : sessions_) {
        result.push_back(session.get());
    }

    return result;
}

Session &SessionManager::current() { return *find(current_id_); }

const Session &SessionManager::current() const { return *find(current_id_); }

const std::string &SessionManager::current_id() const noexcept { return current_id_; }

ModuleInstance &SessionManager::use(std::string_view module_name) {
    const Plugin &plugin = registry_.lookup(module_name);
    ModuleInstance instance(plugin);

    auto &session = current();
    for (const auto &[name, value] : session.variables()) {
        if (!instance.options().declares(name)) {
            continue;
        }

        try {
            instance.options().set(name, value);
        } catch (const InvalidOptionError &error) {
            logger_.warning("variable " + name + " not applied to " + plugin.descriptor.name + ": " + error.what());
        }
    }

    session.push(std::move(instance));
    return *session.active();
}

bool SessionManager::back() { return current().pop(); }

ModuleInstance &SessionManager::active_module() {
    auto *active = current().active();
    if (active == nullptr) {
        throw NoModuleSelectedError();
    }
    return *active;
}

const ModuleInstance &SessionManager::active_module() const {
    const auto *active = current().active();
    if (active == nullptr) {
        throw NoModuleSelectedError();
    }
    return *active;
}

void SessionManager::set_option(std::string_view name, std::string_view value) {
    active_module().options().set(name, value);
}

void SessionManager::unset_option(std::string_view name) { active_module().options().unset(name); }

std::vector<ResolvedOption> SessionManager::options() const { return active_module().options().resolved(); }

void SessionManager::set_variable(std::string_view name, std::string_view value) {
    if (name.empty()) {
        throw InvalidOptionError("variable name must not be empty");
    }

    current().set_variable(std::string(name), std::string(value));
}

bool SessionManager::unset_variable(std::string_view name) { return current().unset_variable(name); }

const std::map<std::string, std::string, std::less<>> &SessionManager::variables() const {
    return current().variables();
}

const ExecutionResult &SessionManager::run() {
    auto &session = current();
    const auto &module = active_module();

    if (const auto missing = module.options().missing_required(); !missing.empty()) {
        throw MissingRequiredOptionError("missing required option(s): " + join(missing, ", "));
    }

    ExecutionResult result;
    result.module = module.name();
    result.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    {
        RunningGuard guard(session);
        ModuleContext context{config_, tools_, logger_};

        try {
            ModuleReport report = module.run(context);

            result.payload = report.payload;
            result.success = report.success;
            result.error = report.error;

            if (report.tool.has_value()) {
                result.command = report.tool->command;
                result.standard_output = report.tool->standard_output;
                result.standard_error = report.tool->standard_error;
                result.exit_code = report.tool->exit_code;
            }

            if (!result.payload.IsMap() || !result.payload["result"]) {
                result.success = false;
                if (result.error.empty()) {
                    result.error = "module returned no result";
                }
                YAML::Node wrapped = error_payload(result.error);
                if (result.payload.IsDefined() && !result.payload.IsNull()) {
                    wrapped["payload"] = result.payload;
                }
                result.payload = wrapped;
            }
        } catch (const std::exception &error) {
            logger_.warning(result.module + " failed: " + error.what());
            result.success = false;
            result.error = error.what();
            result.payload = error_payload(result.error);
        }
    }

    result.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    const auto &stored = session.append(std::move(result));
    record_findings(session, stored);
    archive(session, stored);
    return stored;
}

const Target &SessionManager::add_target(std::string name, std::string address, std::string hostname) {
    if (name.empty()) {
        throw InvalidOptionError("target name must not be empty");
    }

    auto &session = current();
    const auto &target = session.add_target(Target{
        .name = std::move(name),
        .address = std::move(address),
        .hostname = std::move(hostname),
        .status = "manual",
    });
    save_summary(session);
    return target;
}

const std::vector<Target> &SessionManager::targets() const { return current().targets(); }

const Finding &SessionManager::add_finding(std::uint64_t target_id, std::string severity, std::string name) {
    if (name.empty()) {
        throw InvalidOptionError("finding name must not be empty");
    }

    auto &session = current();
    const auto &finding = session.add_finding(Finding{
        .target_id = target_id,
        .name = std::move(name),
        .severity = std::move(severity),
    });
    save_summary(session);
    return finding;
}

std::vector<const Finding *> SessionManager::findings(std::optional<std::uint64_t> target_id) const {
    return current().findings(target_id);
}

std::uint64_t SessionManager::target_for(Session &session, const std::string &address, const std::string &hostname,
                                         const std::string &status) {
    if (address.empty()) {
        return 0;
    }

    if (const auto *existing = session.find_target(address); existing != nullptr) {
        return existing->id;
    }

    const auto named = [&](const std::string &name) -> const Target * {
        for (const auto &target : session.targets()) {
            if (target.name == name) {
                return &target;
            }
        }
        return nullptr;
    };

    std::string name = hostname.empty() ? address : hostname;
    if (named(name) != nullptr) {
        name = address;
    }
    if (const auto *same = named(name); same != nullptr) {
        return same->id;
    }

    const auto &target = session.add_target(Target{
        .name = std::move(name),
        .address = address,
        .hostname = hostname,
        .status = status,
    });
    logger_.debug("added target " + target.name + " to session " + session.id());
    return target.id;
}

void SessionManager::record_findings(Session &session, const ExecutionResult &result) {
    if (!result.success) {
        return;
    }

    const YAML::Node &payload = result.payload;
    const std::string source = result.module + " #" + std::to_string(result.sequence);
    std::size_t added = 0;

    const auto add = [&](std::uint64_t target_id, std::string name, std::string description, std::string severity) {
        if (target_id == 0 || session.has_finding(target_id, name, description)) {
            return;
        }

        session.add_finding(Finding{
            .target_id = target_id,
            .name = std::move(name),
            .description = std::move(description),
            .severity = std::move(severity),
            .source = source,
        });
        ++added;
    };

    if (const auto hosts = payload["hosts"]; hosts.IsDefined() && hosts.IsSequence()) {
        for (const auto &host : hosts) {
            const auto ip = host["ip"].as<std::string>("");
            const auto hostname = host["hostname"].as<std::string>("");
            const auto target_id =
                target_for(session, ip.empty() ? hostname : ip, hostname, host["status"].as<std::string>("up"));

            const auto add_port = [&](const YAML::Node &port) {
                std::string name = "open port " + port["port"].as<std::string>("?") + "/" +
                                   port["protocol"].as<std::string>("tcp");
                if (const auto service = port["service"].as<std::string>(""); !service.empty()) {
                    name += " (" + service + ")";
                }
                add(target_id, std::move(name), port["version"].as<std::string>(""), "info");
            };

            for (const auto &port : host["ports"]) {
                if (port["state"].as<std::string>("") == "open") {
                    add_port(port);
                }
            }

            for (const auto &port : host["open_ports"]) {
                add_port(port);
            }
        }
    }

    if (const auto vulnerabilities = payload["vulnerabilities"];
        vulnerabilities.IsDefined() && vulnerabilities.IsSequence()) {
        const auto target_url = payload["target_url"].as<std::string>("");

        for (const auto &vulnerability : vulnerabilities) {
            const auto url = target_url.empty() ? vulnerability["url"].as<std::string>("") : target_url;
            const auto target_id = target_for(session, url, "", "vulnerable");

            auto severity = vulnerability["severity"].as<std::string>("high");
            if (!is_known_severity(severity)) {
                severity = "high";
            }

            const auto parameter = vulnerability["parameter"].as<std::string>("");
            add(target_id, vulnerability["title"].as<std::string>("vulnerability"),
                parameter.empty() ? "" : "parameter " + parameter, std::move(severity));
        }
    }

    if (added > 0) {
        logger_.info(std::to_string(added) + " new finding(s) from " + source);
    }
}

void SessionManager::archive(const Session &session, const ExecutionResult &result) const {
    if (!config_.get_bool("sessions.save_results")) {
        return;
    }

    const fs::path directory = fs::path(expand_home(config_.get_string("sessions.path"))) / session.id() / "results";
    const fs::path file = directory / (result.module + "_" + std::to_string(result.sequence) + ".yaml");

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        logger_.warning("cannot create " + directory.string() + ": " + ec.message());
        return;
    }

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "session" << YAML::Value << session.id();
    emitter << YAML::Key << "sequence" << YAML::Value << result.sequence;
    emitter << YAML::Key << "module" << YAML::Value << result.module;
    emitter << YAML::Key << "started_at" << YAML::Value << iso_timestamp(result.started_at);
    emitter << YAML::Key << "command" << YAML::Value << result.command;
    emitter << YAML::Key << "exit_code" << YAML::Value << result.exit_code;
    emitter << YAML::Key << "elapsed_ms" << YAML::Value << result.elapsed.count();
    emitter << YAML::Key << "success" << YAML::Value << result.success;
    emitter << YAML::Key << "error" << YAML::Value << result.error;
    emitter << YAML::Key << "stdout" << YAML::Value << YAML::Literal << result.standard_output;
    emitter << YAML::Key << "stderr" << YAML::Value << YAML::Literal << result.standard_error;
    emitter << YAML::Key << "payload" << YAML::Value << result.payload;
    emitter << YAML::EndMap;

    std::ofstream output(file, std::ios::trunc);
    output << emitter.c_str() << '\n';
    if (!output.good()) {
        logger_.warning("cannot write result archive " + file.string());
        return;
    }

    logger_.debug("archived result to " + file.string());
    save_summary(session);
}

void SessionManager::save_summary(const Session &session) const {
    if (!config_.get_bool("sessions.save_results")) {
        return;
    }

    const fs::path directory = fs::path(expand_home(config_.get_string("sessions.path"))) / session.id();
    const fs::path file = directory / "session.yaml";

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        logger_.warning("cannot create " + directory.string() + ": " + ec.message());
        return;
    }

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "id" << YAML::Value << session.id();
    emitter << YAML::Key << "created_at" << YAML::Value << iso_timestamp(session.created_at());
    emitter << YAML::Key << "updated_at" << YAML::Value << iso_timestamp(session.updated_at());
    emitter << YAML::Key << "results" << YAML::Value << session.history().size();

    emitter << YAML::Key << "targets" << YAML::Value << YAML::BeginSeq;
    for (const auto &target : session.targets()) {
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "id" << YAML::Value << target.id;
        emitter << YAML::Key << "name" << YAML::Value << target.name;
        emitter << YAML::Key << "address" << YAML::Value << target.address;
        emitter << YAML::Key << "hostname" << YAML::Value << target.hostname;
        emitter << YAML::Key << "description" << YAML::Value << target.description;
        emitter << YAML::Key << "status" << YAML::Value << target.status;
        emitter << YAML::Key << "created_at" << YAML::Value << iso_timestamp(target.created_at);
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;

    emitter << YAML::Key << "findings" << YAML::Value << YAML::BeginSeq;
    for (const auto *finding : session.findings()) {
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "id" << YAML::Value << finding->id;
        emitter << YAML::Key << "target_id" << YAML::Value << finding->target_id;
        emitter << YAML::Key << "name" << YAML::Value << finding->name;
        emitter << YAML::Key << "description" << YAML::Value << finding->description;
        emitter << YAML::Key << "severity" << YAML::Value << finding->severity;
        emitter << YAML::Key << "status" << YAML::Value << finding->status;
        emitter << YAML::Key << "source" << YAML::Value << finding->source;
        emitter << YAML::Key << "created_at" << YAML::Value << iso_timestamp(finding->created_at);
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;
    emitter << YAML::EndMap;

    std::ofstream output(file, std::ios::trunc);
    output << emitter.c_str() << '\n';
    if (!output.good()) {
        logger_.warning("cannot write session summary " + file.string());
    }
}

} // namespace penkit
