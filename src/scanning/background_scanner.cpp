#include "scanning/background_scanner.hpp"

#include <cerrno>
#include <format>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "runtime/main_loop.hpp"

namespace asyncpath {

namespace {

// Safe to call from concurrent workers.
[[nodiscard]] std::string describe_errno() { return std::error_code(errno, std::generic_category()).message(); }

DIR *posix_opendir(const char *path) { return opendir(path); }

dirent *posix_readdir(DIR *dir) { return readdir(dir); }

int posix_closedir(DIR *dir) { return closedir(dir); }

int posix_stat(const char *path, struct stat *buf) { return ::stat(path, buf); }

int posix_lstat(const char *path, struct stat *buf) { return ::lstat(path, buf); }

const DirectorySyscalls default_syscalls{
    .opendir_fn = &posix_opendir,
    .readdir_fn = &posix_readdir,
    .closedir_fn = &posix_closedir,
    .stat_fn = &posix_stat,
    .lstat_fn = &posix_lstat,
};

[[nodiscard]] FileType file_type_from(mode_t mode) noexcept {
    if (S_ISREG(mode)) {
        return FileType::File;
    }
    if (S_ISDIR(mode)) {
        return FileType::Directory;
    }
    if (S_ISLNK(mode)) {
        return FileType::Link;
    }
    if (S_ISFIFO(mode)) {
        return FileType::Fifo;
    }
    if (S_ISSOCK(mode)) {
        return FileType::Socket;
    }
    if (S_ISCHR(mode)) {
        return FileType::Char;
    }
    if (S_ISBLK(mode)) {
        return FileType::Block;
    }

    return FileType::Unknown;
}

[[nodiscard]] bool is_dangling_link_errno(int error) noexcept {
    return error == ENOENT || error == ENOTDIR || error == ELOOP;
}

[[nodiscard]] bool may_be_link(const dirent &entry) noexcept {
#ifdef _DIRENT_HAVE_D_TYPE
    return entry.d_type == DT_LNK || entry.d_type == DT_UNKNOWN;
#else
    (void)entry;
    return true;
#endif
}

[[nodiscard]] CandidateEntry make_candidate(
    const ScanRequest &request,
    std::string name,
    std::string path,
    FileType type,
    std::optional<FileStat> stat,
    std::optional<FileStat> link_stat) {
    CandidateEntry candidate{
        .name = name,
        .kind = EntryKind::File,
        .label = name,
        .filter_text = name,
        .insert_text = name,
        .word = std::nullopt,
        .absolute_path = std::move(path),
        .type = type,
        .stat = stat,
        .link_stat = link_stat,
        .documentation = std::nullopt,
    };

    if (type == FileType::Directory) {
        candidate.kind = EntryKind::Directory;
        candidate.insert_text = name + "/";
        if (request.label_trailing_slash) {
            candidate.label = name + "/";
        }
        if (!request.trailing_slash) {
            candidate.word = name;
        }
    }

    return candidate;
}

} // namespace

FileStat file_stat_from(const struct stat &buf) noexcept {
    return FileStat{
        .type = file_type_from(buf.st_mode),
        .size = static_cast<std::uintmax_t>(buf.st_size),
        .mode = buf.st_mode,
        .mtime = static_cast<std::int64_t>(buf.st_mtime),
    };
}

BackgroundScanner::BackgroundScanner(MainLoop &loop, const DirectorySyscalls *syscalls)
    : loop_(loop), syscalls_(syscalls != nullptr ? syscalls : &default_syscalls) {}

void BackgroundScanner::scan(
    const std::string &dirname, bool include_hidden, const Options &options, ScanCallback callback) const {
    ScanRequest request{
        .dirname = dirname,
        .include_hidden = include_hidden,
        .trailing_slash = options.trailing_slash,
        .label_trailing_slash = options.label_trailing_slash,
    };

    loop_.spawn(
        [request = std::move(request), syscalls = syscalls_]() { return scan_directory(request, syscalls); },
        [callback = std::move(callback)](WorkerResult<ScanResult> result) {
            if (!result.has_value()) {
                callback(std::unexpected(ScanError{.kind = ScanErrorKind::Worker, .message = result.error().message}));
                return;
            }

            callback(std::move(*result));
        });
}

ScanResult BackgroundScanner::scan_directory(const ScanRequest &request, const DirectorySyscalls *syscalls) {
    const DirectorySyscalls &sys = syscalls != nullptr ? *syscalls : default_syscalls;

    DIR *opened = sys.opendir_fn(request.dirname.c_str());
    if (opened == nullptr) {
        return std::unexpected(ScanError{
            .kind = ScanErrorKind::DirectoryOpen,
            .message = std::format("{}: {}", request.dirname, describe_errno()),
        });
    }

    const std::unique_ptr<DIR, int (*)(DIR *)> dir(opened, sys.closedir_fn);
    std::vector<CandidateEntry> candidates;

    while (true) {
        errno = 0;
        const dirent *entry = sys.readdir_fn(dir.get());
        if (entry == nullptr) {
            if (errno != 0) {
                return std::unexpected(ScanError{
                    .kind = ScanErrorKind::DirectoryRead,
                    .message = std::format("{}: {}", request.dirname, describe_errno()),
                });
            }
            break;
        }

        const std::string_view name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }

        if (!request.include_hidden && name.starts_with('.')) {
            continue;
        }

        std::string path = request.dirname;
        if (path.empty() || path.back() != '/') {
            path += '/';
        }
        path += name;

        struct stat buf {};
        if (sys.stat_fn(path.c_str(), &buf) == 0) {
            const FileStat stat = file_stat_from(buf);
            candidates.push_back(make_candidate(request, std::string(name), std::move(path), stat.type, stat, std::nullopt));
            continue;
        }

        const int stat_error = errno;
        if (!may_be_link(*entry) || sys.lstat_fn(path.c_str(), &buf) != 0 || !S_ISLNK(buf.st_mode)) {
            continue;
        }

        if (is_dangling_link_errno(stat_error)) {
            continue;
        }

        candidates.push_back(
            make_candidate(request, std::string(name), std::move(path), FileType::Link, std::nullopt, file_stat_from(buf)));
    }

    return candidates;
}

} // namespace asyncpath
