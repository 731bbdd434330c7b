#include "completion/completion_orchestrator.hpp"

#include <filesystem>
#include <format>
#include <system_error>
#include <utility>

#include "preview/content_classifier.hpp"
#include "runtime/main_loop.hpp"

namespace asyncpath {

namespace {

[[nodiscard]] std::string working_directory() {
    std::error_code ec;
    auto current = std::filesystem::current_path(ec);
    return ec ? std::string("/") : current.string();
}

[[nodiscard]] std::string_view describe(ScanErrorKind kind) noexcept {
    switch (kind) {
    case ScanErrorKind::DirectoryOpen:
        return "cannot open directory";
    case ScanErrorKind::DirectoryRead:
        return "cannot read directory";
    case ScanErrorKind::Worker:
        return "worker failed";
    }

    return "scan failed";
}

} // namespace

CompletionOrchestrator::CompletionOrchestrator(
    MainLoop &loop, std::shared_ptr<DiagnosticSink> sink, PathSyntax syntax, const DirectorySyscalls *syscalls)
    : sink_(sink != nullptr ? std::move(sink) : make_null_sink()),
      resolver_(syntax),
      scanner_(loop, syscalls),
      previewer_(loop) {}

CursorContext CompletionOrchestrator::make_context(const CompletionRequest &request, const Options &options) const {
    return CursorContext{
        .line_before_cursor = request.line_before_cursor,
        .offset = request.offset,
        .cwd = request.command_line_mode ? working_directory() : options.get_cwd(request),
        .buffer = request.buffer,
    };
}

bool CompletionOrchestrator::include_hidden(const CursorContext &context, const Options &options) noexcept {
    if (options.show_hidden_files_by_default) {
        return true;
    }

    const std::string &line = context.line_before_cursor;
    const std::size_t offset = context.offset;

    if (offset < line.size() && line[offset] == '.') {
        return true;
    }

    return offset > 0 && offset - 1 < line.size() && line[offset - 1] == '.';
}

void CompletionOrchestrator::complete(const CompletionRequest &request, CompletionCallback callback) const {
    const Options options = validate_options(request.option);
    const CursorContext context = make_context(request, options);

    sink_->log(std::format("complete: input '{}', offset {}, cwd '{}'", context.line_before_cursor, context.offset,
                           context.cwd));

    const auto dirname = resolver_.resolve(context);
    if (!dirname.has_value()) {
        sink_->log("complete: no directory before cursor");
        callback(std::vector<CandidateEntry>{});
        return;
    }

    const bool hidden = include_hidden(context, options);
    sink_->log(std::format("complete: scanning '{}', include hidden {}", *dirname, hidden));

    scanner_.scan(*dirname, hidden, options, [callback = std::move(callback), sink = sink_](ScanResult result) {
        if (!result.has_value()) {
            const ScanError &error = result.error();
            sink->log(std::format("complete: {}: {}", describe(error.kind), error.message));

            if (error.kind == ScanErrorKind::Worker) {
                callback(std::unexpected(CompletionError{std::format("directory scan failed: {}", error.message)}));
            } else {
                callback(std::vector<CandidateEntry>{});
            }
            return;
        }

        sink->log(std::format("complete: {} candidates", result->size()));
        callback(std::move(*result));
    });
}

void CompletionOrchestrator::resolve(CandidateEntry item, DocumentationCallback callback) const {
    if (!item.stat.has_value() || item.stat->type != FileType::File) {
        callback(std::move(item));
        return;
    }

    const std::string path = item.absolute_path;
    sink_->log(std::format("resolve: previewing '{}'", path));

    previewer_.preview(
        path, default_preview_lines, [item = std::move(item), callback = std::move(callback)](PreviewOutcome outcome) {
            if (!outcome.has_value()) {
                callback(std::unexpected(
                    CompletionError{std::format("worker error while fetching file doc: {}", outcome.error().message)}));
                return;
            }

            CandidateEntry documented = item;
            documented.documentation = format_documentation(*outcome, documented.absolute_path);
            callback(std::move(documented));
        });
}

std::vector<std::string> CompletionOrchestrator::trigger_characters() const {
    if (resolver_.syntax().windows) {
        return {"/", ".", "\\"};
    }

    return {"/", "."};
}

} // namespace asyncpath
