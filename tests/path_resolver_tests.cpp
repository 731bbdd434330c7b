#include <cassert>
#include <cstdlib>
#include <optional>
#include <string>

#include "core/path_resolver.hpp"
#include "test_support.hpp"

using asyncpath::BufferSyntax;
using asyncpath::CursorContext;
using asyncpath::PathResolver;
using asyncpath::PathSyntax;
using asyncpath::testing::EnvVarGuard;

namespace {

constexpr PathSyntax posix{.windows = false};

CursorContext context_for(const std::string &line, const std::string &cwd = "/home/u/project") {
    return CursorContext{.line_before_cursor = line, .offset = 0, .cwd = cwd, .buffer = {}};
}

void expect_resolves(const PathResolver &resolver, const CursorContext &context, const std::string &expected,
                     const std::string &rule) {
    const auto resolved = resolver.resolve(context);
    assert(resolved.has_value());
    assert(*resolved == expected);
    assert(resolver.matching_rule(context) == rule);
}

void test_parent_relative_paths() {
    PathResolver resolver(posix);

    expect_resolves(resolver, context_for("../src/"), "/home/u/src", "parent");
    expect_resolves(resolver, context_for("../"), "/home/u", "parent");
    expect_resolves(resolver, context_for("cp ../src/ma"), "/home/u/src", "parent");
}

void test_home_relative_paths() {
    EnvVarGuard guard("HOME");
    setenv("HOME", "/tmp/fakehome", 1);

    PathResolver resolver(posix);
    expect_resolves(resolver, context_for("~/segment/"), "/tmp/fakehome/segment", "home");
    expect_resolves(resolver, context_for("~/"), "/tmp/fakehome", "home");
    expect_resolves(resolver, context_for("vim ~/docs/rea"), "/tmp/fakehome/docs", "home");
}

void test_dot_inputs() {
    PathResolver resolver(posix);

    expect_resolves(resolver, context_for("."), "/home/u/project", "dot-only");
    expect_resolves(resolver, context_for(".git/"), "/home/u/project/.git", "dot-relative");
    expect_resolves(resolver, context_for("./src/ma"), "/home/u/project/src", "current");
    expect_resolves(resolver, context_for(".lo"), "/home/u/project", "hidden-name");
    expect_resolves(resolver, context_for("cat .ba"), "/home/u/project", "hidden-name");
}

void test_quoted_paths_resolve_against_cwd() {
    PathResolver resolver(posix);
    expect_resolves(resolver, context_for("\"src/ma"), "/home/u/project/src", "current");

    const asyncpath::ResolutionInput double_quoted{
        .line = "\"", .prefix = "\"", .dirname = "", .cwd = "/home/u", .syntax = posix};
    assert(asyncpath::rules::current_directory(double_quoted) == "/home/u");

    // A single quote is not an introducer and cannot end a prefix.
    const asyncpath::ResolutionInput single_quoted{
        .line = "'", .prefix = "'", .dirname = "", .cwd = "/home/u", .syntax = posix};
    assert(!asyncpath::rules::current_directory(single_quoted).has_value());
    assert(!resolver.resolve(context_for("cat 'src/")).has_value());
}

void test_environment_variable_paths() {
    EnvVarGuard set_guard("ASYNCPATH_TEST_ROOT");
    EnvVarGuard unset_guard("ASYNCPATH_UNSET_VAR");
    setenv("ASYNCPATH_TEST_ROOT", "/opt/data", 1);
    unsetenv("ASYNCPATH_UNSET_VAR");

    PathResolver resolver(posix);
    expect_resolves(resolver, context_for("$ASYNCPATH_TEST_ROOT/sub/"), "/opt/data/sub", "env-var");
    assert(!resolver.resolve(context_for("$ASYNCPATH_UNSET_VAR/")).has_value());
}

void test_relative_paths_without_dot_prefix() {
    PathResolver resolver(posix);

    expect_resolves(resolver, context_for("lua/", "/root"), "/root/lua", "relative");
    expect_resolves(resolver, context_for("src/foo/ba"), "/home/u/project/src/foo", "relative");
    expect_resolves(resolver, context_for("ls src/"), "/home/u/project/src", "relative");
}

void test_absolute_paths() {
    PathResolver resolver(posix);

    expect_resolves(resolver, context_for("/etc/"), "/etc", "absolute");
    expect_resolves(resolver, context_for("cd /usr/lo"), "/usr", "absolute");
    expect_resolves(resolver, context_for("/"), "/", "absolute");
}

void test_look_alikes_stay_unresolved() {
    PathResolver resolver(posix);

    assert(!resolver.resolve(context_for("http://")).has_value());
    assert(!resolver.resolve(context_for("see https://example.com/")).has_value());
    assert(!resolver.resolve(context_for("</")).has_value());
    assert(!resolver.resolve(context_for("<div></")).has_value());
    assert(!resolver.resolve(context_for("x = 10 /")).has_value());
    assert(!resolver.resolve(context_for("(a + b)/")).has_value());
    assert(!resolver.resolve(context_for("10/")).has_value());
}

void test_slash_comment_depends_on_buffer() {
    PathResolver resolver(posix);

    CursorContext plain = context_for("//");
    expect_resolves(resolver, plain, "/", "absolute");

    CursorContext c_buffer = context_for("//");
    c_buffer.buffer = BufferSyntax{.filetype = "c", .comment_string = "/*%s*/"};
    assert(!resolver.resolve(c_buffer).has_value());

    CursorContext unnamed_type = context_for("//");
    unnamed_type.buffer = BufferSyntax{.filetype = "", .comment_string = "//%s"};
    assert(resolver.resolve(unnamed_type).has_value());
}

void test_guard_policy_is_replaceable() {
    PathResolver permissive(posix, asyncpath::FalsePositivePolicy{});
    expect_resolves(permissive, context_for("</"), "/", "absolute");
}

void test_input_without_path_text() {
    PathResolver resolver(posix);

    expect_resolves(resolver, context_for("REA"), "/home/u/project", "no-split");
    expect_resolves(resolver, context_for(""), "/home/u/project", "no-split");
    expect_resolves(resolver, context_for("foo/b:r"), "/home/u/project/foo", "no-split");
}

void test_resolution_is_idempotent() {
    PathResolver resolver(posix);

    for (const char *line : {"../src/", "lua/", ".", "http://", "cd /usr/lo"}) {
        const auto context = context_for(line);
        assert(resolver.resolve(context) == resolver.resolve(context));
    }
}

void test_windows_drive_letters() {
    PathResolver resolver(PathSyntax{.windows = true});

    expect_resolves(resolver, context_for("C:\\Users\\", "C:/work"), "C:/Users", "drive-letter");
    expect_resolves(resolver, context_for("cd ..\\lib\\", "C:/work/app"), "C:/work/lib", "parent");
}

} // namespace

int main() {
    test_parent_relative_paths();
    test_home_relative_paths();
    test_dot_inputs();
    test_quoted_paths_resolve_against_cwd();
    test_environment_variable_paths();
    test_relative_paths_without_dot_prefix();
    test_absolute_paths();
    test_look_alikes_stay_unresolved();
    test_slash_comment_depends_on_buffer();
    test_guard_policy_is_replaceable();
    test_input_without_path_text();
    test_resolution_is_idempotent();
    test_windows_drive_letters();
    return 0;
}
