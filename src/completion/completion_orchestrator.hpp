#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/candidate.hpp"
#include "core/cursor_context.hpp"
#include "core/path_resolver.hpp"
#include "logging/diagnostics.hpp"
#include "preview/document_previewer.hpp"
#include "scanning/background_scanner.hpp"

namespace asyncpath {

class MainLoop;

struct CompletionError {
    std::string message;
};

using CompletionResult = std::expected<std::vector<CandidateEntry>, CompletionError>;
using CompletionCallback = std::function<void(CompletionResult)>;
using DocumentationResult = std::expected<CandidateEntry, CompletionError>;
using DocumentationCallback = std::function<void(DocumentationResult)>;

class CompletionOrchestrator {
  public:
    explicit CompletionOrchestrator(
        MainLoop &loop,
        std::shared_ptr<DiagnosticSink> sink = make_null_sink(),
        PathSyntax syntax = PathSyntax::native(),
        const DirectorySyscalls *syscalls = nullptr);

    // Throws OptionError when the request's options do not validate.
    void complete(const CompletionRequest &request, CompletionCallback callback) const;

    // Attaches a preview of the entry's file as documentation. Entries that
    // are not regular files come back unchanged.
    void resolve(CandidateEntry item, DocumentationCallback callback) const;

    [[nodiscard]] CursorContext make_context(const CompletionRequest &request, const Options &options) const;
    [[nodiscard]] static bool include_hidden(const CursorContext &context, const Options &options) noexcept;

    [[nodiscard]] std::vector<std::string> trigger_characters() const;

  private:
    std::shared_ptr<DiagnosticSink> sink_;
    PathResolver resolver_;
    BackgroundScanner scanner_;
    DocumentPreviewer previewer_;
};

} // namespace asyncpath
