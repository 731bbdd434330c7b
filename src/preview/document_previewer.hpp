#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace asyncpath {

class MainLoop;

inline constexpr std::size_t preview_window_bytes = 1024;
inline constexpr int default_preview_lines = 20;

struct PreviewResult {
    bool binary{false};
    std::string placeholder;
    std::vector<std::string> lines;
    bool truncated{false};
};

struct PreviewError {
    std::string message;
};

using PreviewOutcome = std::expected<PreviewResult, PreviewError>;
using PreviewCallback = std::function<void(PreviewOutcome)>;

class DocumentPreviewer {
  public:
    explicit DocumentPreviewer(MainLoop &loop);

    // Reads the head of `path` on a worker thread. A negative `max_lines`
    // keeps every line of the read window.
    void preview(const std::string &path, int max_lines, PreviewCallback callback) const;

    [[nodiscard]] static PreviewResult read_preview(const std::string &path, int max_lines);

  private:
    MainLoop &loop_;
};

} // namespace asyncpath
