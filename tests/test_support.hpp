#pragma once

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace penkit::test_support {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

inline std::string make_temp_dir(std::string_view prefix = "penkit_test") {
    std::string pattern = "/tmp/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

inline void write_file(const fs::path &path, std::string_view content) {
    std::ofstream file(path);
    assert(file.is_open());
    file << content;
}

inline std::string slurp(const fs::path &path) {
    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

inline void make_executable(const fs::path &path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

inline void make_executable_script(const fs::path &path, std::string_view body) {
    write_file(path, body);
    make_executable(path);
}

// Points PATH at dir only, keeping /bin and /usr/bin so scripts can use sh, sleep and cat.
inline void use_path(const fs::path &dir) {
    const std::string value = dir.string() + ":/usr/bin:/bin";
    setenv("PATH", value.c_str(), 1);
}

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace penkit::test_support
