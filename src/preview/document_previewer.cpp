#include "preview/document_previewer.hpp"

#include <fstream>
#include <ios>
#include <string_view>
#include <utility>

#include "runtime/main_loop.hpp"

namespace asyncpath {

namespace {

[[nodiscard]] PreviewResult placeholder(std::string text) {
    return PreviewResult{.binary = true, .placeholder = std::move(text), .lines = {}, .truncated = false};
}

} // namespace

DocumentPreviewer::DocumentPreviewer(MainLoop &loop) : loop_(loop) {}

void DocumentPreviewer::preview(const std::string &path, int max_lines, PreviewCallback callback) const {
    loop_.spawn([path, max_lines]() { return read_preview(path, max_lines); },
                [callback = std::move(callback)](WorkerResult<PreviewResult> result) {
                    if (!result.has_value()) {
                        callback(std::unexpected(PreviewError{result.error().message}));
                        return;
                    }

                    callback(std::move(*result));
                });
}

PreviewResult DocumentPreviewer::read_preview(const std::string &path, int max_lines) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return placeholder("cannot read this file");
    }

    std::string window(preview_window_bytes, '\0');
    file.read(window.data(), static_cast<std::streamsize>(window.size()));
    window.resize(static_cast<std::size_t>(file.gcount()));

    if (window.empty()) {
        return placeholder("empty file");
    }

    if (window.find('\0') != std::string::npos) {
        return placeholder("binary file");
    }

    const bool more_in_file = file.peek() != std::ifstream::traits_type::eof();

    PreviewResult result;
    std::string_view rest = window;
    while (!rest.empty()) {
        if (max_lines >= 0 && result.lines.size() >= static_cast<std::size_t>(max_lines)) {
            result.truncated = true;
            break;
        }

        const auto newline = rest.find('\n');
        std::string_view line = rest.substr(0, newline);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        result.lines.emplace_back(line);

        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }

    result.truncated = result.truncated || more_in_file;
    return result;
}

} // namespace asyncpath
