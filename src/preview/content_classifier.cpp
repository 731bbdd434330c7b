#include "preview/content_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>

namespace asyncpath {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 9> shebang_interpreters{{
    {"bash", "bash"},
    {"zsh", "zsh"},
    {"sh", "sh"},
    {"python", "python"},
    {"node", "javascript"},
    {"perl", "perl"},
    {"ruby", "ruby"},
    {"lua", "lua"},
    {"fish", "fish"},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 28> extension_filetypes{{
    {"c", "c"},         {"h", "c"},           {"cc", "cpp"},      {"cpp", "cpp"},   {"cxx", "cpp"},
    {"hh", "cpp"},      {"hpp", "cpp"},       {"py", "python"},   {"lua", "lua"},   {"rs", "rust"},
    {"go", "go"},       {"js", "javascript"}, {"ts", "typescript"}, {"json", "json"}, {"toml", "toml"},
    {"yaml", "yaml"},   {"yml", "yaml"},      {"md", "markdown"}, {"sh", "sh"},     {"bash", "bash"},
    {"zsh", "zsh"},     {"html", "html"},     {"xml", "xml"},     {"css", "css"},   {"java", "java"},
    {"rb", "ruby"},     {"vim", "vim"},       {"cmake", "cmake"},
}};

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

// "#!/usr/bin/env python3" -> "python3", "#!/bin/sh -e" -> "sh"
[[nodiscard]] std::string_view shebang_program(std::string_view line) {
    line.remove_prefix(2);
    while (!line.empty() && line.front() == ' ') {
        line.remove_prefix(1);
    }

    std::string_view command = line.substr(0, line.find(' '));
    command = command.substr(command.rfind('/') + 1);

    if (command == "env") {
        line.remove_prefix(std::min(line.size(), line.find(' ')));
        while (!line.empty() && line.front() == ' ') {
            line.remove_prefix(1);
        }
        command = line.substr(0, line.find(' '));
    }

    return command;
}

[[nodiscard]] std::optional<std::string> classify_shebang(std::string_view first_line) {
    if (!first_line.starts_with("#!")) {
        return std::nullopt;
    }

    const std::string_view program = shebang_program(first_line);
    for (const auto &[interpreter, filetype] : shebang_interpreters) {
        if (program.starts_with(interpreter)) {
            return std::string(filetype);
        }
    }

    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> classify_markup(const std::vector<std::string> &lines) {
    const std::string first = lowercase(lines.front());

    if (first.starts_with("<?xml")) {
        return "xml";
    }

    if (first.starts_with("<!doctype html") || first.starts_with("<html")) {
        return "html";
    }

    if (first.starts_with("diff --git")) {
        return "diff";
    }

    if (lines.size() >= 2 && lines[0].starts_with("--- ") && lines[1].starts_with("+++ ")) {
        return "diff";
    }

    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> classify_extension(std::string_view path) {
    const std::string extension = std::filesystem::path(path).extension().string();
    if (extension.size() < 2) {
        return std::nullopt;
    }

    const std::string key = lowercase(std::string_view(extension).substr(1));
    for (const auto &[suffix, filetype] : extension_filetypes) {
        if (key == suffix) {
            return std::string(filetype);
        }
    }

    return std::nullopt;
}

[[nodiscard]] std::string join_lines(const std::vector<std::string> &lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

} // namespace

std::optional<std::string> classify_content(const std::vector<std::string> &lines, std::string_view path) {
    if (!lines.empty()) {
        if (auto filetype = classify_shebang(lines.front()); filetype.has_value()) {
            return filetype;
        }

        if (auto filetype = classify_markup(lines); filetype.has_value()) {
            return filetype;
        }
    }

    return classify_extension(path);
}

Documentation format_documentation(const PreviewResult &preview, std::string_view path) {
    if (preview.binary) {
        return Documentation{.kind = MarkupKind::PlainText, .value = preview.placeholder};
    }

    const auto filetype = classify_content(preview.lines, path);
    if (!filetype.has_value()) {
        return Documentation{.kind = MarkupKind::PlainText, .value = join_lines(preview.lines)};
    }

    std::string value = "```" + *filetype + "\n";
    value += join_lines(preview.lines);
    value += "\n```";
    return Documentation{.kind = MarkupKind::Markdown, .value = std::move(value)};
}

} // namespace asyncpath
