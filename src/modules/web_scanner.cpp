#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"
#include "log/logger.hpp"
#include "modules/builtin_modules.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace {

[[nodiscard]] OptionSchema web_scanner_options() {
    return {
        {"target_url", ValueType::String, std::nullopt, true, "URL to test"},
        {"data", ValueType::String, Value{std::string()}, false, "POST body"},
        {"cookie", ValueType::String, Value{std::string()}, false, "Cookie header value"},
        {"user_agent", ValueType::String, Value{std::string("PenKit Web Scanner")}, false, "User-Agent header"},
        {"scan_level", ValueType::Int, Value{std::int64_t{1}}, false, "sqlmap level (1-5)"},
        {"risk_level", ValueType::Int, Value{std::int64_t{1}}, false, "sqlmap risk (1-3)"},
        {"forms", ValueType::Bool, Value{true}, false, "Test forms on the target page"},
        {"crawl_depth", ValueType::Int, Value{std::int64_t{0}}, false, "Crawl depth, 0 disables crawling"},
        {"threads", ValueType::Int, Value{std::int64_t{1}}, false, "Concurrent requests"},
        {"timeout", ValueType::Int, Value{std::int64_t{1800}}, false, "Seconds before the scan is killed"},
        {"scan_type", ValueType::String, Value{std::string("quick")}, false, "quick or thorough"},
    };
}

[[nodiscard]] std::vector<std::string> build_sqlmap_args(const OptionSet &options) {
    const auto scan_type = options.get_string("scan_type");
    if (scan_type != "quick" && scan_type != "thorough") {
        throw InvalidOptionError("scan_type must be quick or thorough, got '" + scan_type + "'");
    }

    auto level = options.get_int("scan_level");
    auto risk = options.get_int("risk_level");
    auto forms = options.get_bool("forms");

    if (level < 1 || level > 5) {
        throw InvalidOptionError("scan_level must be between 1 and 5");
    }
    if (risk < 1 || risk > 3) {
        throw InvalidOptionError("risk_level must be between 1 and 3");
    }

    if (scan_type == "thorough") {
        level = std::max<std::int64_t>(level, 3);
        risk = std::max<std::int64_t>(risk, 2);
        forms = true;
    }

    std::vector<std::string> args{"-u", options.get_string("target_url")};

    const auto add_text = [&](const char *flag, const char *option) {
        if (auto value = options.get_string(option); !value.empty()) {
            args.push_back(flag);
            args.push_back(std::move(value));
        }
    };

    add_text("--data", "data");
    add_text("--cookie", "cookie");
    add_text("--user-agent", "user_agent");

    args.push_back("--level");
    args.push_back(std::to_string(level));
    args.push_back("--risk");
    args.push_back(std::to_string(risk));

    if (forms) {
        args.push_back("--forms");
    }

    if (const auto depth = options.get_int("crawl_depth"); depth > 0) {
        args.push_back("--crawl");
        args.push_back(std::to_string(depth));
    }

    if (const auto threads = options.get_int("threads"); threads > 1) {
        args.push_back("--threads");
        args.push_back(std::to_string(threads));
    }

    return args;
}

void add_vulnerability_summary(YAML::Node &payload, const OptionSet &options) {
    payload["target_url"] = options.get_string("target_url");
    payload["scan_type"] = options.get_string("scan_type");

    std::map<std::string, int> by_type;
    std::size_t count = 0;
    for (const auto &vulnerability : payload["vulnerabilities"]) {
        ++by_type[vulnerability["type"].as<std::string>("unknown")];
        ++count;
    }

    payload["vulnerability_count"] = count;

    YAML::Node types(YAML::NodeType::Map);
    for (const auto &[type, total] : by_type) {
        types[type] = total;
    }
    payload["vulnerability_types"] = types;
}

[[nodiscard]] ModuleReport run_web_scan(const OptionSet &options, ModuleContext &context) {
    const auto args = build_sqlmap_args(options);
    const auto timeout = checked_timeout(options.get_int("timeout"));
    const auto &sqlmap = context.tools.get("sqlmap");

    context.logger.info("testing " + options.get_string("target_url"));

    ModuleReport report;
    try {
        report = report_from_tool(sqlmap.execute(args, timeout));
    } catch (const ExecutionTimeoutError &error) {
        return report_from_timeout(error);
    }

    if (report.payload["vulnerabilities"]) {
        add_vulnerability_summary(report.payload, options);
    }

    return report;
}

} // namespace

Plugin web_scanner_plugin() {
    return Plugin{
        .descriptor =
            PluginDescriptor{
                .name = "web_scanner",
                .description = "Scan web applications for vulnerabilities",
                .version = "0.1.0",
                .author = "PenKit Team",
                .options = web_scanner_options(),
            },
        .run = run_web_scan,
    };
}

} // namespace penkit
