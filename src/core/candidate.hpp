#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace asyncpath {

enum class FileType {
    File,
    Directory,
    Link,
    Fifo,
    Socket,
    Char,
    Block,
    Unknown,
};

[[nodiscard]] std::string_view to_string(FileType type) noexcept;

struct FileStat {
    FileType type{FileType::Unknown};
    std::uintmax_t size{0};
    mode_t mode{0};
    std::int64_t mtime{0};
};

enum class EntryKind {
    File,
    Directory,
};

enum class MarkupKind {
    PlainText,
    Markdown,
};

struct Documentation {
    MarkupKind kind{MarkupKind::PlainText};
    std::string value;
};

struct CandidateEntry {
    std::string name;
    EntryKind kind{EntryKind::File};
    std::string label;
    std::string filter_text;
    std::string insert_text;
    std::optional<std::string> word;
    std::string absolute_path;
    FileType type{FileType::Unknown};
    std::optional<FileStat> stat;
    std::optional<FileStat> link_stat;
    std::optional<Documentation> documentation;
};

} // namespace asyncpath
