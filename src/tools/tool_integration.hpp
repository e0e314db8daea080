#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "execution/process_executor.hpp"
#include "tools/output_parser.hpp"

namespace penkit {

class ConfigStore;
class Logger;
class PathResolver;

enum class ExecutionMode {
    Native,
    Container,
    Auto,
};

[[nodiscard]] std::string_view mode_name(ExecutionMode mode) noexcept;
[[nodiscard]] std::optional<ExecutionMode> mode_from_name(std::string_view name) noexcept;

struct ToolDescriptor {
    std::string name;
    std::string binary_name;
    std::vector<std::string> version_args{"--version"};
    std::vector<std::string> default_args;
    std::string container_image;
    // Network and volume flags handed to the container runtime unchanged.
    std::vector<std::string> container_options;
    ExecutionMode mode{ExecutionMode::Auto};
};

enum class ExecutionRoute {
    Native,
    Container,
};

struct ToolOutput {
    std::string command;
    ExecutionRoute route{ExecutionRoute::Native};
    std::string standard_output;
    std::string standard_error;
    int exit_code{0};
    std::chrono::milliseconds elapsed{0};
    YAML::Node payload;
};

[[nodiscard]] std::string quote_command(const std::vector<std::string> &argv);

class ToolIntegration {
  public:
    ToolIntegration(ToolDescriptor descriptor,
                    std::unique_ptr<OutputParser> parser,
                    const ConfigStore &config,
                    const PathResolver &path_resolver,
                    Logger &logger);

    [[nodiscard]] const ToolDescriptor &descriptor() const noexcept;

    // Throws ToolNotFoundError when neither route is usable and ExecutionTimeoutError
    // (with the partial output) when the timeout elapses. Non-zero exit codes are returned as data.
    [[nodiscard]] ToolOutput execute(const std::vector<std::string> &args, std::chrono::milliseconds timeout) const;

    [[nodiscard]] YAML::Node parse_output(std::string_view standard_output, std::string_view standard_error) const;

    // First line of the native binary's version output, if it can be run.
    [[nodiscard]] std::optional<std::string> version() const;

    [[nodiscard]] std::string describe_route() const;

  private:
    struct Invocation {
        ExecutionRoute route;
        std::vector<std::string> argv;
    };

    ToolDescriptor descriptor_;
    std::unique_ptr<OutputParser> parser_;
    const ConfigStore &config_;
    const PathResolver &path_resolver_;
    Logger &logger_;
    ProcessExecutor process_executor_;

    [[nodiscard]] Invocation resolve(const std::vector<std::string> &args) const;
    [[nodiscard]] std::string native_binary() const;
    [[nodiscard]] std::string container_image() const;
    [[nodiscard]] bool use_container() const;
    [[nodiscard]] std::string config_key(std::string_view field) const;
};

} // namespace penkit
