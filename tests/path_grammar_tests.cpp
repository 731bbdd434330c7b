#include <cassert>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "core/path_grammar.hpp"
#include "core/path_resolver.hpp"

using asyncpath::canonicalize;
using asyncpath::CursorContext;
using asyncpath::find_split_point;
using asyncpath::is_name_char;
using asyncpath::is_segment_terminator;
using asyncpath::keyword_start;
using asyncpath::PathResolver;
using asyncpath::PathSyntax;
using asyncpath::strip_partial_name;

namespace {

constexpr PathSyntax posix{.windows = false};
constexpr PathSyntax windows{.windows = true};

void test_name_characters() {
    for (const char c : std::string("/\\:*?<>'\"`|")) {
        assert(!is_name_char(c));
    }

    assert(is_name_char('a'));
    assert(is_name_char(' '));
    assert(is_name_char('.'));
    assert(is_name_char('~'));

    assert(is_segment_terminator('a'));
    assert(!is_segment_terminator(' '));
    assert(!is_segment_terminator('.'));
    assert(!is_segment_terminator('~'));
}

void test_split_point_lands_on_first_introducer_of_the_path() {
    assert(find_split_point("../src/", posix) == 2);
    assert(find_split_point("~/foo/ba", posix) == 1);
    assert(find_split_point("lua/", posix) == 3);
    assert(find_split_point("cd /usr/lo", posix) == 3);
    assert(find_split_point("\"src/ma", posix) == 0);
    assert(find_split_point(".", posix) == 0);
    assert(find_split_point("http://", posix) == 6);
}

void test_split_point_tolerates_parent_segments() {
    // "/.." chains into the rest of the path instead of restarting at it.
    assert(find_split_point("x/../lib/", posix) == 1);
}

void test_split_point_absent_without_path_text() {
    assert(!find_split_point("", posix).has_value());
    assert(!find_split_point("REA", posix).has_value());
    assert(!find_split_point("foo/b:r", posix).has_value());
}

std::string repeated(std::string_view unit, std::size_t count) {
    std::string text;
    for (std::size_t i = 0; i < count; ++i) {
        text += unit;
    }
    return text;
}

void test_split_point_on_long_dotted_lines() {
    using namespace std::chrono_literals;

    const std::string prose = repeated("a.", 2000) + ":";
    const std::string path = repeated("a.", 2000) + "a/b";

    const auto started = std::chrono::steady_clock::now();
    assert(!find_split_point(prose, posix).has_value());
    assert(find_split_point(path, posix) == 1);

    const PathResolver resolver(posix);
    const auto resolved = resolver.resolve(CursorContext{
        .line_before_cursor = prose,
        .offset = 0,
        .cwd = "/home/u",
        .buffer = {},
    });
    assert(resolved == "/home/u");
    assert(std::chrono::steady_clock::now() - started < 50ms);
}

void test_windows_split_accepts_backslash() {
    assert(!find_split_point("C:\\Users\\", posix).has_value());
    assert(find_split_point("C:\\Users\\", windows) == 2);
}

void test_keyword_start() {
    assert(keyword_start("") == 0);
    assert(keyword_start(".lo") == 0);
    assert(keyword_start("lua/.") == 4);
    assert(keyword_start("ls src/ma") == 7);
    assert(keyword_start("echo ") == 5);
}

void test_strip_partial_name() {
    assert(strip_partial_name("foo/ba", posix) == "foo/");
    assert(strip_partial_name("src/", posix) == "src/");
    assert(strip_partial_name("bar1", posix) == "");
    assert(strip_partial_name("a\\b", windows) == "a\\");
    assert(strip_partial_name("a\\b", posix) == "");
}

void test_canonicalize() {
    assert(canonicalize("/home/u/project/../src/", posix) == "/home/u/src");
    assert(canonicalize("/root/./lua/", posix) == "/root/lua");
    assert(canonicalize("/", posix) == "/");
    assert(canonicalize("C:\\Users\\me\\..\\", windows) == "C:/Users");
    assert(canonicalize("C:/", windows) == "C:/");
}

} // namespace

int main() {
    test_name_characters();
    test_split_point_lands_on_first_introducer_of_the_path();
    test_split_point_tolerates_parent_segments();
    test_split_point_absent_without_path_text();
    test_split_point_on_long_dotted_lines();
    test_windows_split_accepts_backslash();
    test_keyword_start();
    test_strip_partial_name();
    test_canonicalize();
    return 0;
}
