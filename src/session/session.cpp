#include "session/session.hpp"

#include <algorithm>
#include <utility>

#include "core/errors.hpp"

namespace penkit {

std::string_view state_name(SessionState state) noexcept {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::ModuleSelected:
        return "module selected";
    case SessionState::Running:
        return "running";
    }

    return "idle";
}

bool is_known_severity(std::string_view severity) noexcept {
    return severity == "info" || severity == "low" || severity == "medium" || severity == "high" ||
           severity == "critical";
}

Session::Session(std::string id)
    : id_(std::move(id)), created_at_(std::chrono::system_clock::now()), updated_at_(created_at_) {}

const std::string &Session::id() const noexcept { return id_; }

std::chrono::system_clock::time_point Session::created_at() const noexcept { return created_at_; }

std::chrono::system_clock::time_point Session::updated_at() const noexcept { return updated_at_; }

SessionState Session::state() const noexcept {
    if (running_) {
        return SessionState::Running;
    }

    return stack_.empty() ? SessionState::Idle : SessionState::ModuleSelected;
}

void Session::push(ModuleInstance instance) { stack_.push_back(std::move(instance)); }

bool Session::pop() {
    if (stack_.empty()) {
        return false;
    }

    stack_.pop_back();
    return true;
}

ModuleInstance *Session::active() noexcept { return stack_.empty() ? nullptr : &stack_.back(); }

const ModuleInstance *Session::active() const noexcept { return stack_.empty() ? nullptr : &stack_.back(); }

std::size_t Session::depth() const noexcept { return stack_.size(); }

std::vector<std::string> Session::stack_names() const {
    std::vector<std::string> names;
    names.reserve(stack_.size());

    for (const auto &instance : stack_) {
        names.push_back(instance.name());
    }

    return names;
}

void Session::set_variable(const std::string &name, std::string value) { variables_[name] = std::move(value); }

bool Session::unset_variable(std::string_view name) {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return false;
    }

    variables_.erase(it);
    return true;
}

const std::map<std::string, std::string, std::less<>> &Session::variables() const noexcept { return variables_; }

const ExecutionResult &Session::append(ExecutionResult result) {
    result.sequence = next_sequence_++;
    result.payload = YAML::Clone(result.payload);
    history_.push_back(std::move(result));
    updated_at_ = std::chrono::system_clock::now();
    return history_.back();
}

const std::vector<ExecutionResult> &Session::history() const noexcept { return history_; }

const Target &Session::add_target(Target target) {
    const bool taken = std::any_of(targets_.begin(), targets_.end(),
                                   [&](const Target &existing) { return existing.name == target.name; });
    if (taken) {
        throw DuplicateNameError("target '" + target.name + "' already exists in session " + id_);
    }

    target.id = targets_.size() + 1;
    target.created_at = std::chrono::system_clock::now();
    updated_at_ = target.created_at;
    targets_.push_back(std::move(target));
    return targets_.back();
}

const std::vector<Target> &Session::targets() const noexcept { return targets_; }

const Target *Session::find_target(std::uint64_t id) const noexcept {
    for (const auto &target : targets_) {
        if (target.id == id) {
            return &target;
        }
    }

    return nullptr;
}

const Target *Session::find_target(std::string_view address) const noexcept {
    if (address.empty()) {
        return nullptr;
    }

    for (const auto &target : targets_) {
        if (target.address == address) {
            return &target;
        }
    }

    for (const auto &target : targets_) {
        if (target.hostname == address) {
            return &target;
        }
    }

    return nullptr;
}

const Finding &Session::add_finding(Finding finding) {
    if (find_target(finding.target_id) == nullptr) {
        throw NotFoundError("unknown target #" + std::to_string(finding.target_id));
    }

    if (!is_known_severity(finding.severity)) {
        throw InvalidOptionError("severity must be info, low, medium, high or critical, got '" + finding.severity +
                                 "'");
    }

    finding.id = findings_.size() + 1;
    finding.created_at = std::chrono::system_clock::now();
    updated_at_ = finding.created_at;
    findings_.push_back(std::move(finding));
    return findings_.back();
}

std::vector<const Finding *> Session::findings(std::optional<std::uint64_t> target_id) const {
    std::vector<const Finding *> result;

    for (const auto &finding : findings_) {
        if (!target_id.has_value() || finding.target_id == *target_id) {
            result.push_back(&finding);
        }
    }

    return result;
}

bool Session::has_finding(std::uint64_t target_id, std::string_view name, std::string_view description) const {
    return std::any_of(findings_.begin(), findings_.end(), [&](const Finding &finding) {
        return finding.target_id == target_id && finding.name == name && finding.description == description;
    });
}

void Session::set_running(bool running) noexcept { running_ = running; }

} // namespace penkit
