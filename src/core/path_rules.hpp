#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/cursor_context.hpp"

namespace asyncpath {

struct ResolutionInput {
    std::string_view line;
    std::string_view prefix;
    std::string_view dirname;
    std::string_view cwd;
    PathSyntax syntax;
    const BufferSyntax *buffer{nullptr};
};

// A heuristic that rejects text ending in '/' which only looks like an
// absolute path.
struct FalsePositiveGuard {
    std::string name;
    std::function<bool(const ResolutionInput &)> rejects;
};

using FalsePositivePolicy = std::vector<FalsePositiveGuard>;

// url-component, url-scheme, html-closing-tag, arithmetic, slash-comment.
[[nodiscard]] FalsePositivePolicy default_false_positive_policy();

// A rule returns the unnormalized directory it resolves to, or nullopt when
// it does not apply.
struct ResolutionRule {
    std::string name;
    std::function<std::optional<std::string>(const ResolutionInput &)> apply;
};

[[nodiscard]] std::vector<ResolutionRule> default_resolution_rules(FalsePositivePolicy policy);

namespace rules {

[[nodiscard]] std::optional<std::string> dot_only(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> dot_relative(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> parent_directory(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> current_directory(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> hidden_name(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> home_directory(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> environment_variable(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> drive_letter(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> relative_path(const ResolutionInput &input);
[[nodiscard]] std::optional<std::string> absolute_path(const ResolutionInput &input, const FalsePositivePolicy &policy);

} // namespace rules

namespace guards {

[[nodiscard]] bool url_component(const ResolutionInput &input);
[[nodiscard]] bool url_scheme(const ResolutionInput &input);
[[nodiscard]] bool html_closing_tag(const ResolutionInput &input);
[[nodiscard]] bool arithmetic(const ResolutionInput &input);
[[nodiscard]] bool slash_comment(const ResolutionInput &input);

} // namespace guards

[[nodiscard]] std::string user_home_directory();

} // namespace asyncpath
