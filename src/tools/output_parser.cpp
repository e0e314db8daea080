#include "tools/output_parser.hpp"

#include <cctype>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace penkit {

namespace {

[[nodiscard]] std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

[[nodiscard]] std::vector<std::string> split(std::string_view text, std::string_view separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;

    while (true) {
        const auto position = text.find(separator, start);
        if (position == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            return parts;
        }

        parts.emplace_back(text.substr(start, position - start));
        start = position + separator.size();
    }
}

[[nodiscard]] std::vector<std::string> lines_of(std::string_view text) {
    std::vector<std::string> lines;
    std::istringstream stream{std::string(text)};
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

struct NmapPort {
    int port{0};
    std::string state;
    std::string protocol;
    std::string service;
    std::string version;
};

struct NmapHost {
    std::string ip;
    std::string hostname;
    std::string status{"unknown"};
    std::vector<NmapPort> ports;
};

NmapHost &host_for(std::vector<NmapHost> &hosts, const std::string &ip, const std::string &hostname) {
    for (auto &host : hosts) {
        if (host.ip == ip) {
            return host;
        }
    }

    hosts.push_back(NmapHost{.ip = ip, .hostname = hostname});
    return hosts.back();
}

// "Host: 10.0.0.5 (name.example)" -> ip, hostname
void parse_host_field(std::string_view field, std::string &ip, std::string &hostname) {
    const std::string body = trim(field.substr(std::string_view("Host:").size()));
    const auto paren = body.find(" (");

    if (paren == std::string::npos) {
        ip = body;
        hostname.clear();
        return;
    }

    ip = body.substr(0, paren);
    const auto close = body.find(')', paren);
    hostname = body.substr(paren + 2, close == std::string::npos ? std::string::npos : close - paren - 2);
}

// "22/open/tcp//ssh//OpenSSH 8.9p1/"
[[nodiscard]] bool parse_port_entry(std::string_view entry, NmapPort &port) {
    const auto fields = split(trim(entry), "/");
    if (fields.size() < 3) {
        return false;
    }

    try {
        port.port = std::stoi(fields[0]);
    } catch (const std::exception &) {
        return false;
    }

    port.state = fields[1];
    port.protocol = fields[2];
    port.service = fields.size() > 4 ? fields[4] : "";
    port.version = fields.size() > 6 ? fields[6] : "";
    return true;
}

[[nodiscard]] YAML::Node parse_nmap(std::string_view standard_output, std::string_view standard_error) {
    std::vector<NmapHost> hosts;
    std::string version;
    std::string summary;
    bool recognized = false;

    for (const auto &line : lines_of(standard_output)) {
        if (line.starts_with("# Nmap ")) {
            recognized = true;

            if (line.starts_with("# Nmap done")) {
                const auto dash = line.find(" -- ");
                summary = dash == std::string::npos ? trim(line.substr(2)) : trim(line.substr(dash + 4));
            } else {
                const auto scan = line.find(" scan initiated");
                if (scan != std::string::npos) {
                    version = trim(line.substr(7, scan - 7));
                }
            }
            continue;
        }

        if (!line.starts_with("Host: ")) {
            continue;
        }

        recognized = true;
        const auto fields = split(line, "\t");

        std::string ip;
        std::string hostname;
        parse_host_field(fields.front(), ip, hostname);
        if (ip.empty()) {
            continue;
        }

        NmapHost &host = host_for(hosts, ip, hostname);
        if (host.hostname.empty()) {
            host.hostname = hostname;
        }

        for (std::size_t i = 1; i < fields.size(); ++i) {
            const std::string_view field = fields[i];

            if (field.starts_with("Status: ")) {
                std::string status = trim(field.substr(8));
                for (auto &c : status) {
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                host.status = status;
            } else if (field.starts_with("Ports: ")) {
                if (host.status == "unknown") {
                    host.status = "up";
                }

                for (const auto &entry : split(field.substr(7), ", ")) {
                    NmapPort port;
                    if (parse_port_entry(entry, port)) {
                        host.ports.push_back(std::move(port));
                    }
                }
            }
        }
    }

    if (!recognized) {
        return unparsed_payload(standard_output, standard_error, "output is not nmap greppable format");
    }

    YAML::Node payload;
    payload["parsed"] = true;

    YAML::Node scan_info(YAML::NodeType::Map);
    scan_info["version"] = version;
    scan_info["summary"] = summary;
    payload["scan_info"] = scan_info;

    std::size_t hosts_up = 0;
    std::size_t open_ports = 0;
    YAML::Node host_list(YAML::NodeType::Sequence);

    for (const auto &host : hosts) {
        YAML::Node host_node;
        host_node["ip"] = host.ip;
        host_node["hostname"] = host.hostname;
        host_node["status"] = host.status;

        YAML::Node port_list(YAML::NodeType::Sequence);
        for (const auto &port : host.ports) {
            YAML::Node port_node;
            port_node["port"] = port.port;
            port_node["state"] = port.state;
            port_node["protocol"] = port.protocol;
            port_node["service"] = port.service;
            port_node["version"] = port.version;
            port_list.push_back(port_node);

            if (port.state == "open") {
                ++open_ports;
            }
        }
        host_node["ports"] = port_list;
        host_list.push_back(host_node);

        if (host.status == "up") {
            ++hosts_up;
        }
    }

    payload["hosts"] = host_list;
    payload["result"] = std::to_string(hosts_up) + " host(s) up, " + std::to_string(open_ports) + " open port(s)";
    return payload;
}

[[nodiscard]] YAML::Node parse_sqlmap(std::string_view standard_output, std::string_view standard_error) {
    if (trim(standard_output).empty()) {
        return unparsed_payload(standard_output, standard_error, "no output from sqlmap");
    }

    std::string url;
    std::string parameter;
    bool completed = false;
    YAML::Node vulnerabilities(YAML::NodeType::Sequence);

    for (const auto &raw_line : lines_of(standard_output)) {
        const std::string line = trim(raw_line);

        if (const auto marker = line.find("testing URL '"); marker != std::string::npos) {
            const auto start = marker + std::string_view("testing URL '").size();
            url = line.substr(start, line.find('\'', start) - start);
            continue;
        }

        if (line.starts_with("URL:")) {
            url = trim(line.substr(4));
            continue;
        }

        if (line.starts_with("Parameter: ")) {
            parameter = trim(line.substr(11));
            continue;
        }

        if (line.starts_with("Type: ") && !parameter.empty()) {
            const std::string type = trim(line.substr(6));
            YAML::Node vulnerability;
            vulnerability["title"] = "SQL Injection (" + type + ")";
            vulnerability["url"] = url;
            vulnerability["type"] = type;
            vulnerability["parameter"] = parameter;
            vulnerability["severity"] = "high";
            vulnerabilities.push_back(vulnerability);
            continue;
        }

        if (line.starts_with("Title: ") && vulnerabilities.size() > 0) {
            vulnerabilities[vulnerabilities.size() - 1]["technique"] = trim(line.substr(7));
            continue;
        }

        if (const auto marker = line.find("is vulnerable to"); marker != std::string::npos && parameter.empty()) {
            const std::string type = trim(line.substr(marker + std::string_view("is vulnerable to").size()));
            YAML::Node vulnerability;
            vulnerability["title"] = "SQL Injection (" + type + ")";
            vulnerability["url"] = url;
            vulnerability["type"] = type;
            vulnerability["parameter"] = "";
            vulnerability["severity"] = "high";
            vulnerabilities.push_back(vulnerability);
            continue;
        }

        if (line.find("ending @") != std::string::npos || line.find("scan completed") != std::string::npos) {
            completed = true;
        }
    }

    YAML::Node payload;
    payload["parsed"] = true;
    payload["vulnerabilities"] = vulnerabilities;

    YAML::Node summary;
    summary["vulnerabilities_found"] = vulnerabilities.size();
    summary["scan_completed"] = completed;
    payload["summary"] = summary;

    payload["result"] = vulnerabilities.size() == 0
                            ? std::string("no injection point found")
                            : std::to_string(vulnerabilities.size()) + " injection point(s) found";
    return payload;
}

[[nodiscard]] YAML::Node parse_lines(std::string_view standard_output, std::string_view standard_error) {
    YAML::Node payload;
    payload["parsed"] = true;

    YAML::Node lines(YAML::NodeType::Sequence);
    for (const auto &line : lines_of(standard_output)) {
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    payload["lines"] = lines;

    if (!trim(standard_error).empty()) {
        payload["stderr"] = trim(standard_error);
    }

    payload["result"] = std::to_string(lines.size()) + " line(s) of output";
    return payload;
}

template <typename Parse>
[[nodiscard]] YAML::Node guarded(Parse parse, std::string_view standard_output, std::string_view standard_error) {
    try {
        return parse(standard_output, standard_error);
    } catch (const std::exception &error) {
        return unparsed_payload(standard_output, standard_error, error.what());
    }
}

} // namespace

YAML::Node unparsed_payload(std::string_view standard_output, std::string_view standard_error, std::string_view reason) {
    YAML::Node payload;
    payload["parsed"] = false;
    payload["result"] = "unparsed output";
    payload["reason"] = std::string(reason);
    payload["raw_stdout"] = std::string(standard_output);

    if (!standard_error.empty()) {
        payload["raw_stderr"] = std::string(standard_error);
    }

    return payload;
}

YAML::Node NmapGrepableParser::parse(std::string_view standard_output, std::string_view standard_error) const {
    return guarded(parse_nmap, standard_output, standard_error);
}

YAML::Node SqlmapTextParser::parse(std::string_view standard_output, std::string_view standard_error) const {
    return guarded(parse_sqlmap, standard_output, standard_error);
}

YAML::Node RawLinesParser::parse(std::string_view standard_output, std::string_view standard_error) const {
    return guarded(parse_lines, standard_output, standard_error);
}

} // namespace penkit
