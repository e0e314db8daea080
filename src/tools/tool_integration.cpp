#include "tools/tool_integration.hpp"

#include <sstream>
#include <utility>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"

namespace penkit {

namespace {

constexpr std::chrono::seconds version_timeout{10};

} // namespace

std::string_view mode_name(ExecutionMode mode) noexcept {
    switch (mode) {
    case ExecutionMode::Native:
        return "native";
    case ExecutionMode::Container:
        return "container";
    case ExecutionMode::Auto:
        return "auto";
    }

    return "auto";
}

std::optional<ExecutionMode> mode_from_name(std::string_view name) noexcept {
    if (name == "native") {
        return ExecutionMode::Native;
    }

    if (name == "container") {
        return ExecutionMode::Container;
    }

    if (name == "auto") {
        return ExecutionMode::Auto;
    }

    return std::nullopt;
}

std::string quote_command(const std::vector<std::string> &argv) {
    std::string result;

    for (const auto &arg : argv) {
        if (!result.empty()) {
            result.push_back(' ');
        }

        if (!arg.empty() && arg.find_first_of(" \t'\"\\$") == std::string::npos) {
            result += arg;
            continue;
        }

        result.push_back('\'');
        for (const char c : arg) {
            if (c == '\'') {
                result += "'\\''";
            } else {
                result.push_back(c);
            }
        }
        result.push_back('\'');
    }

    return result;
}

ToolIntegration::ToolIntegration(ToolDescriptor descriptor,
                                 std::unique_ptr<OutputParser> parser,
                                 const ConfigStore &config,
                                 const PathResolver &path_resolver,
                                 Logger &logger)
    : descriptor_(std::move(descriptor)),
      parser_(parser != nullptr ? std::move(parser) : std::make_unique<RawLinesParser>()),
      config_(config),
      path_resolver_(path_resolver),
      logger_(logger),
      process_executor_() {}

const ToolDescriptor &ToolIntegration::descriptor() const noexcept { return descriptor_; }

std::string ToolIntegration::config_key(std::string_view field) const {
    return "tools." + descriptor_.name + "." + std::string(field);
}

std::string ToolIntegration::native_binary() const {
    const auto path_key = config_key("path");
    if (config_.contains(path_key)) {
        const auto configured = expand_home(config_.get_string(path_key));
        if (!configured.empty() && PathResolver::is_executable(configured)) {
            return configured;
        }

        if (!configured.empty()) {
            logger_.warning(path_key + " points to '" + configured + "', which is not executable");
        }
    }

    return path_resolver_.find_command_path(descriptor_.binary_name);
}

std::string ToolIntegration::container_image() const {
    const auto image_key = config_key("container_image");
    if (config_.contains(image_key)) {
        return config_.get_string(image_key);
    }

    return descriptor_.container_image;
}

bool ToolIntegration::use_container() const {
    const auto flag_key = config_key("use_container");
    if (config_.contains(flag_key)) {
        return config_.get_bool(flag_key);
    }

    return descriptor_.mode == ExecutionMode::Container;
}

ToolIntegration::Invocation ToolIntegration::resolve(const std::vector<std::string> &args) const {
    const bool container_allowed = descriptor_.mode != ExecutionMode::Native;
    const bool native_allowed = descriptor_.mode != ExecutionMode::Container;

    if (native_allowed && !(container_allowed && use_container())) {
        const auto binary = native_binary();
        if (!binary.empty()) {
            Invocation invocation{.route = ExecutionRoute::Native, .argv = {binary}};
            invocation.argv.insert(invocation.argv.end(), descriptor_.default_args.begin(), descriptor_.default_args.end());
            invocation.argv.insert(invocation.argv.end(), args.begin(), args.end());
            return invocation;
        }

        logger_.debug(descriptor_.binary_name + " not found on PATH");
    }

    const auto image = container_image();
    if (container_allowed && !image.empty()) {
        const auto runtime_name = config_.get_string("tools.container_runtime");
        const auto runtime = path_resolver_.find_command_path(runtime_name);
        if (runtime.empty()) {
            throw ToolNotFoundError(descriptor_.name + ": container runtime '" + runtime_name + "' not found");
        }

        Invocation invocation{.route = ExecutionRoute::Container, .argv = {runtime, "run", "--rm"}};
        invocation.argv.insert(
            invocation.argv.end(), descriptor_.container_options.begin(), descriptor_.container_options.end());
        invocation.argv.push_back(image);
        invocation.argv.insert(invocation.argv.end(), descriptor_.default_args.begin(), descriptor_.default_args.end());
        invocation.argv.insert(invocation.argv.end(), args.begin(), args.end());
        return invocation;
    }

    if (!native_allowed) {
        throw ToolNotFoundError(descriptor_.name + ": no container image configured");
    }

    throw ToolNotFoundError(descriptor_.name + ": '" + descriptor_.binary_name +
                            "' not found and no container image configured");
}

ToolOutput ToolIntegration::execute(const std::vector<std::string> &args, std::chrono::milliseconds timeout) const {
    const auto invocation = resolve(args);
    const auto command = quote_command(invocation.argv);

    logger_.info("running " + command);

    auto process = process_executor_.execute(invocation.argv, timeout);
    if (process.timed_out) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        std::ostringstream message;
        message << descriptor_.name << " timed out after ";
        if (seconds > 0) {
            message << seconds << "s";
        } else {
            message << timeout.count() << "ms";
        }

        logger_.warning(message.str());
        throw ExecutionTimeoutError(
            message.str(), std::move(process.standard_output), std::move(process.standard_error));
    }

    logger_.debug(descriptor_.name + " exited with code " + std::to_string(process.exit_code));

    ToolOutput output;
    output.command = command;
    output.route = invocation.route;
    output.exit_code = process.exit_code;
    output.elapsed = process.elapsed;
    output.payload = parse_output(process.standard_output, process.standard_error);
    output.standard_output = std::move(process.standard_output);
    output.standard_error = std::move(process.standard_error);
    return output;
}

YAML::Node ToolIntegration::parse_output(std::string_view standard_output, std::string_view standard_error) const {
    return parser_->parse(standard_output, standard_error);
}

std::optional<std::string> ToolIntegration::version() const {
    const auto binary = native_binary();
    if (binary.empty() || descriptor_.mode == ExecutionMode::Container) {
        return std::nullopt;
    }

    std::vector<std::string> argv{binary};
    argv.insert(argv.end(), descriptor_.version_args.begin(), descriptor_.version_args.end());

    const auto process = process_executor_.execute(argv, version_timeout);
    if (process.timed_out || process.exit_code != 0) {
        return std::nullopt;
    }

    const auto &text = process.standard_output.empty() ? process.standard_error : process.standard_output;
    std::istringstream stream(text);
    std::string first_line;
    std::getline(stream, first_line);
    return first_line;
}

std::string ToolIntegration::describe_route() const {
    try {
        const auto invocation = resolve({});
        if (invocation.route == ExecutionRoute::Native) {
            return "native " + invocation.argv.front();
        }

        return "container " + container_image();
    } catch (const ToolNotFoundError &error) {
        return std::string("unavailable (") + error.what() + ")";
    }
}

} // namespace penkit
