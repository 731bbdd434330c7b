#include "core/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <string>
#include <system_error>
#include <utility>

#include "core/cursor_context.hpp"

namespace asyncpath {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string type_name(const OptionValue &value) {
    if (std::holds_alternative<bool>(value)) {
        return "boolean";
    }

    if (std::holds_alternative<std::string>(value)) {
        return "string";
    }

    return "function";
}

[[nodiscard]] bool expect_bool(const std::string &name, const OptionValue &value) {
    if (const auto *flag = std::get_if<bool>(&value); flag != nullptr) {
        return *flag;
    }

    throw OptionError(std::format("{}: expected boolean, got {}", name, type_name(value)));
}

[[nodiscard]] CwdProvider expect_function(const std::string &name, const OptionValue &value) {
    if (const auto *provider = std::get_if<CwdProvider>(&value); provider != nullptr && *provider) {
        return *provider;
    }

    throw OptionError(std::format("{}: expected function, got {}", name, type_name(value)));
}

[[nodiscard]] std::string process_directory() {
    std::error_code ec;
    auto current = fs::current_path(ec);
    if (ec) {
        return "/";
    }

    return current.string();
}

} // namespace

std::string buffer_directory(const CompletionRequest &request) {
    if (request.buffer_path.empty()) {
        return process_directory();
    }

    fs::path buffer(request.buffer_path);
    if (buffer.is_relative()) {
        buffer = fs::path(process_directory()) / buffer;
    }

    return buffer.lexically_normal().parent_path().string();
}

Options validate_options(const OptionMap &overrides) {
    Options options;
    options.get_cwd = &buffer_directory;

    for (const auto &[name, value] : overrides) {
        if (name == "trailing_slash") {
            options.trailing_slash = expect_bool(name, value);
        } else if (name == "label_trailing_slash") {
            options.label_trailing_slash = expect_bool(name, value);
        } else if (name == "show_hidden_files_by_default") {
            options.show_hidden_files_by_default = expect_bool(name, value);
        } else if (name == "get_cwd" || name == "cwdProvider") {
            options.get_cwd = expect_function(name, value);
        }
    }

    return options;
}

bool parse_bool_option(const std::string &name, const std::string &value) {
    std::string lowered = value;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }

    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }

    throw OptionError(std::format("{}: expected boolean, got '{}'", name, value));
}

OptionMap options_from_environment() {
    static constexpr std::pair<const char *, const char *> variables[] = {
        {"ASYNCPATH_TRAILING_SLASH", "trailing_slash"},
        {"ASYNCPATH_LABEL_TRAILING_SLASH", "label_trailing_slash"},
        {"ASYNCPATH_SHOW_HIDDEN", "show_hidden_files_by_default"},
    };

    OptionMap overrides;
    for (const auto &[variable, option] : variables) {
        const char *value = std::getenv(variable);
        if (value == nullptr) {
            continue;
        }

        overrides.emplace(option, parse_bool_option(variable, value));
    }

    return overrides;
}

} // namespace asyncpath
