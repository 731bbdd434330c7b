#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "core/cursor_context.hpp"

namespace asyncpath {

// Any byte except / \ : * ? < > ' " ` |
[[nodiscard]] bool is_name_char(char c) noexcept;

// A name character that may end a path segment: not space, '.' or '~'.
[[nodiscard]] bool is_segment_terminator(char c) noexcept;

// Index of the character that introduces the path being typed at the end of
// `line`, or nullopt when the line does not end in path-like text.
[[nodiscard]] std::optional<std::size_t> find_split_point(std::string_view line, PathSyntax syntax);

// Start of the word being completed: the trailing run of non-blank name
// characters.
[[nodiscard]] std::size_t keyword_start(std::string_view line);

// Drops the partial name after the last separator.
[[nodiscard]] std::string_view strip_partial_name(std::string_view text, PathSyntax syntax) noexcept;

// Lexical canonical form: '.' and '..' folded, separators normalized to '/',
// no trailing separator except on a root.
[[nodiscard]] std::string canonicalize(std::string_view path, PathSyntax syntax);

[[nodiscard]] std::string join_path(std::string_view base, std::string_view tail);

} // namespace asyncpath
