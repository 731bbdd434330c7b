#include "core/path_grammar.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <vector>

namespace asyncpath {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view excluded_name_chars = "/\\:*?<>'\"`|";

[[nodiscard]] bool is_introducer(char c, PathSyntax syntax) noexcept {
    return c == '/' || c == '.' || c == '"' || (syntax.windows && c == '\\');
}

[[nodiscard]] bool is_dotdot_introducer(char c, PathSyntax syntax) noexcept {
    if (syntax.windows) {
        return c == '/' || c == '\\';
    }

    return c == '/' || c == '.';
}

} // namespace

bool is_name_char(char c) noexcept { return excluded_name_chars.find(c) == std::string_view::npos; }

bool is_segment_terminator(char c) noexcept { return is_name_char(c) && c != ' ' && c != '.' && c != '~'; }

std::optional<std::size_t> find_split_point(std::string_view line, PathSyntax syntax) {
    const std::size_t length = line.size();

    std::vector<bool> name_tail(length + 1, true);
    for (std::size_t i = length; i > 0; --i) {
        name_tail[i - 1] = name_tail[i] && is_name_char(line[i - 1]);
    }

    // matches[p]: the line from introducer p on is a chain of segments, then
    // a final introducer, then name characters. chains[i]: the name run
    // starting at i holds a segment terminator e with matches[e + 1].
    std::vector<bool> matches(length + 1, false);
    std::vector<bool> chains(length + 1, false);
    std::optional<std::size_t> split;

    for (std::size_t i = length; i > 0; --i) {
        const std::size_t position = i - 1;
        const char c = line[position];

        if (is_introducer(c, syntax)) {
            const bool dotdot = is_dotdot_introducer(c, syntax) && position + 3 <= length &&
                                line[position + 1] == '.' && line[position + 2] == '.' && matches[position + 3];
            matches[position] = name_tail[position + 1] || chains[position + 1] || dotdot;
        }

        if (is_name_char(c)) {
            chains[position] = (is_segment_terminator(c) && matches[position + 1]) || chains[position + 1];
        }

        if (matches[position]) {
            split = position;
        }
    }

    return split;
}

std::size_t keyword_start(std::string_view line) {
    std::size_t start = line.size();
    while (start > 0) {
        const auto c = static_cast<unsigned char>(line[start - 1]);
        if (!is_name_char(line[start - 1]) || std::isspace(c) != 0) {
            break;
        }
        --start;
    }

    return start;
}

std::string_view strip_partial_name(std::string_view text, PathSyntax syntax) noexcept {
    const auto separator = std::find_if(text.rbegin(), text.rend(), [syntax](char c) { return syntax.is_separator(c); });
    if (separator == text.rend()) {
        return text.substr(0, 0);
    }

    return text.substr(0, static_cast<std::size_t>(text.rend() - separator));
}

std::string canonicalize(std::string_view path, PathSyntax syntax) {
    std::string text(path);
    if (syntax.windows) {
        std::ranges::replace(text, '\\', '/');
    }

    std::string normal = fs::path(text).lexically_normal().generic_string();

    const auto is_root = [&normal, syntax]() {
        if (normal == "/") {
            return true;
        }

        return syntax.windows && normal.size() == 3 && normal[1] == ':' && normal[2] == '/';
    };

    while (normal.size() > 1 && normal.back() == '/' && !is_root()) {
        normal.pop_back();
    }

    return normal;
}

std::string join_path(std::string_view base, std::string_view tail) {
    std::string joined(base);
    if (joined.empty() || joined.back() != '/') {
        joined += '/';
    }
    joined += tail;
    return joined;
}

} // namespace asyncpath
