#include "logging/diagnostics.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace asyncpath {

namespace {

constexpr const char *default_log_path = "/tmp/asyncpath-debug.log";

[[nodiscard]] std::string local_time(const char *format) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream out;
    out << std::put_time(&local, format);
    return out.str();
}

} // namespace

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &out) : out_(out) {}

void StreamDiagnosticSink::log(std::string_view message) {
    std::lock_guard lock(mutex_);
    out_ << std::format("[{}] {}\n", local_time("%H:%M:%S"), message);
}

FileDiagnosticSink::FileDiagnosticSink(const std::string &path) : file_(path, std::ios::trunc) {
    if (file_.is_open()) {
        file_ << std::format("=== asyncpath debug log started at {} ===\n", local_time("%Y-%m-%d %H:%M:%S"));
        file_.flush();
    }
}

void FileDiagnosticSink::log(std::string_view message) {
    std::lock_guard lock(mutex_);
    if (!file_.is_open()) {
        return;
    }

    file_ << std::format("[{}] {}\n", local_time("%H:%M:%S"), message);
    file_.flush();
}

bool FileDiagnosticSink::is_open() const noexcept { return file_.is_open(); }

std::shared_ptr<DiagnosticSink> make_null_sink() { return std::make_shared<NullDiagnosticSink>(); }

std::shared_ptr<DiagnosticSink> make_diagnostic_sink_from_env() {
    const char *debug = std::getenv("ASYNCPATH_DEBUG");
    if (debug == nullptr || std::string_view(debug) != "1") {
        return make_null_sink();
    }

    const char *path = std::getenv("ASYNCPATH_DEBUG_LOG");
    return std::make_shared<FileDiagnosticSink>(path != nullptr && *path != '\0' ? path : default_log_path);
}

} // namespace asyncpath
