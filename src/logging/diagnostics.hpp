#pragma once

#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace asyncpath {

class DiagnosticSink {
  public:
    virtual ~DiagnosticSink() = default;

    virtual void log(std::string_view message) = 0;
};

class NullDiagnosticSink final : public DiagnosticSink {
  public:
    void log(std::string_view /*message*/) override {}
};

class StreamDiagnosticSink final : public DiagnosticSink {
  public:
    explicit StreamDiagnosticSink(std::ostream &out);

    void log(std::string_view message) override;

  private:
    std::mutex mutex_;
    std::ostream &out_;
};

// Appends "[HH:MM:SS] message" lines to a file, truncated with a start banner
// when the sink is created.
class FileDiagnosticSink final : public DiagnosticSink {
  public:
    explicit FileDiagnosticSink(const std::string &path);

    void log(std::string_view message) override;

    [[nodiscard]] bool is_open() const noexcept;

  private:
    std::mutex mutex_;
    std::ofstream file_;
};

[[nodiscard]] std::shared_ptr<DiagnosticSink> make_null_sink();

// A FileDiagnosticSink when ASYNCPATH_DEBUG=1 (path from ASYNCPATH_DEBUG_LOG,
// default /tmp/asyncpath-debug.log), the null sink otherwise.
[[nodiscard]] std::shared_ptr<DiagnosticSink> make_diagnostic_sink_from_env();

} // namespace asyncpath
