#pragma once

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace asyncpath::testing {

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

class TempDir {
  public:
    explicit TempDir(std::string_view tag) {
        std::string pattern = "/tmp/asyncpath_" + std::string(tag) + "_XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        char *created = mkdtemp(buffer.data());
        assert(created != nullptr);
        path_ = fs::path(created).lexically_normal();
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] const fs::path &path() const noexcept { return path_; }
    [[nodiscard]] std::string string() const { return path_.string(); }

  private:
    fs::path path_;
};

inline void write_file(const fs::path &path, std::string_view content) {
    std::ofstream file(path, std::ios::binary);
    assert(file.is_open());
    file << content;
}

} // namespace asyncpath::testing
