#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace penkit {

class PenkitError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Registry integrity.
class ContractError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class DuplicateNameError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

// Unknown module, session or option name.
class NotFoundError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class InvalidOptionError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class MissingRequiredOptionError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class NoModuleSelectedError : public PenkitError {
  public:
    NoModuleSelectedError() : PenkitError("no module selected") {}
};

class ToolNotFoundError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class ExecutionTimeoutError : public PenkitError {
  public:
    ExecutionTimeoutError(const std::string &message, std::string partial_stdout, std::string partial_stderr)
        : PenkitError(message), partial_stdout_(std::move(partial_stdout)), partial_stderr_(std::move(partial_stderr)) {}

    [[nodiscard]] const std::string &partial_stdout() const noexcept { return partial_stdout_; }
    [[nodiscard]] const std::string &partial_stderr() const noexcept { return partial_stderr_; }

  private:
    std::string partial_stdout_;
    std::string partial_stderr_;
};

class UnknownKeyError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class ConfigError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class SessionError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

class DuplicateSessionError : public SessionError {
  public:
    using SessionError::SessionError;
};

class ScriptError : public PenkitError {
  public:
    using PenkitError::PenkitError;
};

} // namespace penkit
