#include "core/path_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include "core/path_grammar.hpp"

namespace asyncpath {

namespace {

[[nodiscard]] bool is_alpha(char c) noexcept { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

[[nodiscard]] bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

[[nodiscard]] bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Whether `prefix` ends in `stem` followed by one separator.
[[nodiscard]] bool ends_with_before_separator(std::string_view prefix, std::string_view stem, PathSyntax syntax) {
    if (prefix.empty() || !syntax.is_separator(prefix.back())) {
        return false;
    }

    return prefix.substr(0, prefix.size() - 1).ends_with(stem);
}

// `^[A-Za-z]+://`
[[nodiscard]] bool starts_with_url_scheme(std::string_view text) {
    std::size_t letters = 0;
    while (letters < text.size() && is_alpha(text[letters])) {
        ++letters;
    }

    return letters > 0 && text.substr(letters).starts_with("://");
}

[[nodiscard]] bool is_numeric_literal(std::string_view token) {
    return std::ranges::all_of(token, [](char c) { return is_digit(c) || c == '.'; }) &&
           std::ranges::any_of(token, [](char c) { return is_digit(c); });
}

[[nodiscard]] bool is_relative_path_word(std::string_view token, PathSyntax syntax) {
    if (token.empty() || token.front() == '/' || token.front() == '~' || token.front() == '$') {
        return false;
    }

    if (!std::ranges::all_of(token, [syntax](char c) { return is_name_char(c) || syntax.is_separator(c); })) {
        return false;
    }

    return !is_numeric_literal(token) && token.back() != ')';
}

} // namespace

std::string user_home_directory() {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }

    std::vector<char> buffer(16384);
    passwd entry{};
    passwd *result = nullptr;
    if (getpwuid_r(getuid(), &entry, buffer.data(), buffer.size(), &result) == 0 && result != nullptr &&
        result->pw_dir != nullptr) {
        return result->pw_dir;
    }

    return "/";
}

namespace rules {

std::optional<std::string> dot_only(const ResolutionInput &input) {
    if (input.line != ".") {
        return std::nullopt;
    }

    return std::string(input.cwd);
}

std::optional<std::string> dot_relative(const ResolutionInput &input) {
    if (!input.line.starts_with('.') || input.line.size() < 2 || !input.syntax.is_separator(input.line.back())) {
        return std::nullopt;
    }

    return join_path(input.cwd, input.line.substr(0, input.line.size() - 1));
}

std::optional<std::string> parent_directory(const ResolutionInput &input) {
    if (!ends_with_before_separator(input.prefix, "..", input.syntax)) {
        return std::nullopt;
    }

    return join_path(join_path(input.cwd, ".."), input.dirname);
}

std::optional<std::string> current_directory(const ResolutionInput &input) {
    const bool dot_separator = ends_with_before_separator(input.prefix, ".", input.syntax);
    const bool quote = input.prefix.ends_with('"');
    if (!dot_separator && !quote) {
        return std::nullopt;
    }

    return join_path(input.cwd, input.dirname);
}

// ".lo" or "cat .ba": a hidden name typed at the start of a word.
std::optional<std::string> hidden_name(const ResolutionInput &input) {
    const std::string_view prefix = input.prefix;
    if (!prefix.ends_with('.')) {
        return std::nullopt;
    }

    if (prefix.size() > 1 && !is_space(prefix[prefix.size() - 2])) {
        return std::nullopt;
    }

    return join_path(input.cwd, input.dirname);
}

std::optional<std::string> home_directory(const ResolutionInput &input) {
    if (!ends_with_before_separator(input.prefix, "~", input.syntax)) {
        return std::nullopt;
    }

    return join_path(user_home_directory(), input.dirname);
}

std::optional<std::string> environment_variable(const ResolutionInput &input) {
    const std::string_view prefix = input.prefix;
    if (prefix.size() < 3 || !input.syntax.is_separator(prefix.back())) {
        return std::nullopt;
    }

    std::size_t name_start = prefix.size() - 1;
    while (name_start > 0 && (is_alpha(prefix[name_start - 1]) || prefix[name_start - 1] == '_')) {
        --name_start;
    }

    if (name_start == prefix.size() - 1 || name_start == 0 || prefix[name_start - 1] != '$') {
        return std::nullopt;
    }

    const std::string name(prefix.substr(name_start, prefix.size() - 1 - name_start));
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }

    return join_path(value, input.dirname);
}

std::optional<std::string> drive_letter(const ResolutionInput &input) {
    const std::string_view prefix = input.prefix;
    if (!input.syntax.windows || prefix.size() < 3 || !input.syntax.is_separator(prefix.back())) {
        return std::nullopt;
    }

    const char letter = prefix[prefix.size() - 3];
    if (prefix[prefix.size() - 2] != ':' || !is_alpha(letter)) {
        return std::nullopt;
    }

    return join_path(std::string{letter, ':'}, input.dirname);
}

std::optional<std::string> relative_path(const ResolutionInput &input) {
    const std::string_view prefix = input.prefix;
    if (!prefix.ends_with('/') || starts_with_url_scheme(prefix)) {
        return std::nullopt;
    }

    const std::string_view relative = prefix.substr(0, prefix.size() - 1);
    const auto blank = std::find_if(relative.rbegin(), relative.rend(), is_space);
    const std::string_view token = relative.substr(static_cast<std::size_t>(relative.rend() - blank));

    if (!is_relative_path_word(token, input.syntax)) {
        return std::nullopt;
    }

    return join_path(join_path(input.cwd, token), input.dirname);
}

std::optional<std::string> absolute_path(const ResolutionInput &input, const FalsePositivePolicy &policy) {
    if (!input.prefix.ends_with('/')) {
        return std::nullopt;
    }

    const bool rejected =
        std::ranges::any_of(policy, [&input](const FalsePositiveGuard &guard) { return guard.rejects(input); });
    if (rejected) {
        return std::nullopt;
    }

    return join_path("/", input.dirname);
}

} // namespace rules

namespace guards {

bool url_component(const ResolutionInput &input) {
    const std::string_view prefix = input.prefix;
    return prefix.size() >= 2 && prefix.back() == '/' && is_alpha(prefix[prefix.size() - 2]);
}

bool url_scheme(const ResolutionInput &input) {
    std::string_view rest = input.prefix;
    for (int slashes = 0; slashes < 2 && rest.ends_with('/'); ++slashes) {
        rest.remove_suffix(1);
        if (rest.size() >= 2 && rest.back() == ':' && is_alpha(rest[rest.size() - 2])) {
            return true;
        }
    }

    return false;
}

bool html_closing_tag(const ResolutionInput &input) { return input.prefix.ends_with("</"); }

bool arithmetic(const ResolutionInput &input) {
    std::string_view rest = input.prefix;
    if (!rest.ends_with('/')) {
        return false;
    }

    rest.remove_suffix(1);
    while (!rest.empty() && is_space(rest.back())) {
        rest.remove_suffix(1);
    }

    return !rest.empty() && (is_digit(rest.back()) || rest.back() == ')');
}

bool slash_comment(const ResolutionInput &input) {
    const bool only_slashes =
        std::ranges::all_of(input.prefix, [](char c) { return c == '/' || is_space(c); });

    return only_slashes && input.buffer != nullptr && input.buffer->uses_slash_comments();
}

} // namespace guards

FalsePositivePolicy default_false_positive_policy() {
    return {
        {.name = "url-component", .rejects = &guards::url_component},
        {.name = "url-scheme", .rejects = &guards::url_scheme},
        {.name = "html-closing-tag", .rejects = &guards::html_closing_tag},
        {.name = "arithmetic", .rejects = &guards::arithmetic},
        {.name = "slash-comment", .rejects = &guards::slash_comment},
    };
}

std::vector<ResolutionRule> default_resolution_rules(FalsePositivePolicy policy) {
    return {
        {.name = "dot-only", .apply = &rules::dot_only},
        {.name = "dot-relative", .apply = &rules::dot_relative},
        {.name = "parent", .apply = &rules::parent_directory},
        {.name = "current", .apply = &rules::current_directory},
        {.name = "hidden-name", .apply = &rules::hidden_name},
        {.name = "home", .apply = &rules::home_directory},
        {.name = "env-var", .apply = &rules::environment_variable},
        {.name = "drive-letter", .apply = &rules::drive_letter},
        {.name = "relative", .apply = &rules::relative_path},
        {.name = "absolute",
         .apply = [policy = std::move(policy)](const ResolutionInput &input) {
             return rules::absolute_path(input, policy);
         }},
    };
}

} // namespace asyncpath
