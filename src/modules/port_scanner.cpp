#include <chrono>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"
#include "log/logger.hpp"
#include "modules/builtin_modules.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace {

[[nodiscard]] OptionSchema port_scanner_options() {
    return {
        {"target", ValueType::String, std::nullopt, true, "Host, range or CIDR to scan"},
        {"ports", ValueType::String, Value{std::string("1-1000")}, false, "Port list or range"},
        {"scan_type", ValueType::String, Value{std::string("tcp")}, false, "tcp, syn or udp"},
        {"timing", ValueType::Int, Value{std::int64_t{4}}, false, "nmap timing template (0-5)"},
        {"service_detection", ValueType::Bool, Value{true}, false, "Detect service versions"},
        {"script_scan", ValueType::Bool, Value{false}, false, "Run default NSE scripts"},
        {"show_only_open", ValueType::Bool, Value{false}, false, "Only report open ports"},
        {"output_format", ValueType::String, Value{std::string("normal")}, false, "normal or minimal"},
        {"timeout", ValueType::Int, Value{std::int64_t{600}}, false, "Seconds before the scan is killed"},
    };
}

[[nodiscard]] std::vector<std::string> build_nmap_args(const OptionSet &options) {
    std::vector<std::string> args{"-oG", "-"};

    if (const auto ports = options.get_string("ports"); !ports.empty()) {
        args.push_back("-p");
        args.push_back(ports);
    }

    const auto scan_type = options.get_string("scan_type");
    if (scan_type == "tcp") {
        args.push_back("-sT");
    } else if (scan_type == "syn") {
        args.push_back("-sS");
    } else if (scan_type == "udp") {
        args.push_back("-sU");
    } else {
        throw InvalidOptionError("scan_type must be tcp, syn or udp, got '" + scan_type + "'");
    }

    if (options.get_bool("service_detection")) {
        args.push_back("-sV");
    }

    if (options.get_bool("script_scan")) {
        args.push_back("-sC");
    }

    const auto timing = options.get_int("timing");
    if (timing < 0 || timing > 5) {
        throw InvalidOptionError("timing must be between 0 and 5");
    }
    args.push_back("-T" + std::to_string(timing));

    if (options.get_bool("show_only_open")) {
        args.push_back("--open");
    }

    args.push_back(options.get_string("target"));
    return args;
}

// Keeps only open ports, one entry per host.
[[nodiscard]] YAML::Node minimal_payload(const YAML::Node &payload, const std::string &target) {
    YAML::Node minimal;
    minimal["parsed"] = payload["parsed"];
    minimal["result"] = payload["result"];
    minimal["target"] = target;

    YAML::Node hosts(YAML::NodeType::Sequence);
    for (const auto &host : payload["hosts"]) {
        YAML::Node entry;
        entry["ip"] = host["ip"];
        entry["hostname"] = host["hostname"];

        YAML::Node open_ports(YAML::NodeType::Sequence);
        for (const auto &port : host["ports"]) {
            if (port["state"].as<std::string>("") != "open") {
                continue;
            }

            YAML::Node open;
            open["port"] = port["port"];
            open["protocol"] = port["protocol"];
            open["service"] = port["service"];
            open["version"] = port["version"];
            open_ports.push_back(open);
        }

        entry["open_ports"] = open_ports;
        hosts.push_back(entry);
    }

    minimal["hosts"] = hosts;
    return minimal;
}

[[nodiscard]] ModuleReport run_port_scan(const OptionSet &options, ModuleContext &context) {
    const auto args = build_nmap_args(options);
    const auto timeout = checked_timeout(options.get_int("timeout"));
    const auto &nmap = context.tools.get("nmap");

    context.logger.info("scanning " + options.get_string("target"));

    ModuleReport report;
    try {
        report = report_from_tool(nmap.execute(args, timeout));
    } catch (const ExecutionTimeoutError &error) {
        return report_from_timeout(error);
    }

    if (options.get_string("output_format") == "minimal" && report.payload["hosts"]) {
        report.payload = minimal_payload(report.payload, options.get_string("target"));
    }

    return report;
}

} // namespace

Plugin port_scanner_plugin() {
    return Plugin{
        .descriptor =
            PluginDescriptor{
                .name = "port_scanner",
                .description = "Scan for open ports on target systems",
                .version = "0.1.0",
                .author = "PenKit Team",
                .options = port_scanner_options(),
            },
        .run = run_port_scan,
    };
}

} // namespace penkit
