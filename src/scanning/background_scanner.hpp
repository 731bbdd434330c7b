#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>

#include "core/candidate.hpp"
#include "core/options.hpp"

namespace asyncpath {

class MainLoop;

struct DirectorySyscalls {
    DIR *(*opendir_fn)(const char *path);
    dirent *(*readdir_fn)(DIR *dir);
    int (*closedir_fn)(DIR *dir);
    int (*stat_fn)(const char *path, struct stat *buf);
    int (*lstat_fn)(const char *path, struct stat *buf);
};

enum class ScanErrorKind {
    DirectoryOpen,
    DirectoryRead,
    Worker,
};

struct ScanError {
    ScanErrorKind kind;
    std::string message;
};

struct ScanRequest {
    std::string dirname;
    bool include_hidden{false};
    bool trailing_slash{false};
    bool label_trailing_slash{true};
};

using ScanResult = std::expected<std::vector<CandidateEntry>, ScanError>;
using ScanCallback = std::function<void(ScanResult)>;

class BackgroundScanner {
  public:
    explicit BackgroundScanner(MainLoop &loop, const DirectorySyscalls *syscalls = nullptr);

    // Lists `dirname` on a worker thread. `callback` runs exactly once, on
    // the thread draining the loop.
    void scan(const std::string &dirname, bool include_hidden, const Options &options, ScanCallback callback) const;

    [[nodiscard]] static ScanResult
    scan_directory(const ScanRequest &request, const DirectorySyscalls *syscalls = nullptr);

  private:
    MainLoop &loop_;
    const DirectorySyscalls *syscalls_;
};

[[nodiscard]] FileStat file_stat_from(const struct stat &buf) noexcept;

} // namespace asyncpath
