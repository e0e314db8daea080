#pragma once

#include <string>
#include <vector>

namespace penkit {

struct CommandLine {
    std::string name;
    std::vector<std::string> args;

    [[nodiscard]] bool empty() const noexcept { return name.empty(); }
};

} // namespace penkit
