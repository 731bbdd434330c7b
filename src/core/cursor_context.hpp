#pragma once

#include <cstddef>
#include <string>

#include "core/options.hpp"

namespace asyncpath {

struct PathSyntax {
    bool windows{false};

    [[nodiscard]] static constexpr PathSyntax native() noexcept {
#ifdef _WIN32
        return PathSyntax{.windows = true};
#else
        return PathSyntax{.windows = false};
#endif
    }

    [[nodiscard]] constexpr bool is_separator(char c) const noexcept { return c == '/' || (windows && c == '\\'); }
};

// Comment syntax of the buffer being edited.
struct BufferSyntax {
    std::string filetype;
    std::string comment_string;

    [[nodiscard]] bool uses_slash_comments() const {
        if (filetype.empty()) {
            return false;
        }

        return comment_string.find("/*") != std::string::npos || comment_string.find("//") != std::string::npos;
    }
};

struct CompletionRequest {
    std::string line_before_cursor;
    std::size_t offset{0};
    std::string buffer_path;
    BufferSyntax buffer;
    bool command_line_mode{false};
    OptionMap option;
};

struct CursorContext {
    std::string line_before_cursor;
    std::size_t offset{0};
    std::string cwd;
    BufferSyntax buffer;
};

} // namespace asyncpath
