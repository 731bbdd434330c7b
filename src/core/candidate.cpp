#include "core/candidate.hpp"

namespace asyncpath {

std::string_view to_string(FileType type) noexcept {
    switch (type) {
    case FileType::File:
        return "file";
    case FileType::Directory:
        return "directory";
    case FileType::Link:
        return "link";
    case FileType::Fifo:
        return "fifo";
    case FileType::Socket:
        return "socket";
    case FileType::Char:
        return "char";
    case FileType::Block:
        return "block";
    case FileType::Unknown:
        return "unknown";
    }

    return "unknown";
}

} // namespace asyncpath
