#include "app/path_complete_app.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <readline/history.h>
#include <readline/readline.h>
#include <sys/stat.h>

#include "core/path_grammar.hpp"

namespace asyncpath {

namespace {

constexpr auto request_timeout = std::chrono::seconds(5);
constexpr std::string_view doc_command = ":doc ";

[[nodiscard]] std::string_view kind_name(EntryKind kind) noexcept {
    return kind == EntryKind::Directory ? "folder" : "file";
}

} // namespace

PathCompleteApp::PathCompleteApp(OptionMap options, std::shared_ptr<DiagnosticSink> sink)
    : loop_(),
      options_(std::move(options)),
      orchestrator_(loop_, std::move(sink)),
      readline_completion_(orchestrator_, loop_, options_) {}

int PathCompleteApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    readline_completion_.install();
    using_history();

    while (true) {
        char *line = readline("path> ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        if (!input.empty()) {
            add_history(input.c_str());
        }

        if (!handle_line(input, std::cout, std::cerr)) {
            break;
        }
    }

    return 0;
}

bool PathCompleteApp::handle_line(const std::string &input, std::ostream &out, std::ostream &err) {
    if (input == "exit") {
        return false;
    }

    if (input.starts_with(doc_command)) {
        print_documentation(input.substr(doc_command.size()), out, err);
    } else {
        print_candidates(input, out, err);
    }

    return true;
}

void PathCompleteApp::print_candidates(const std::string &input, std::ostream &out, std::ostream &err) {
    const CompletionRequest request{
        .line_before_cursor = input,
        .offset = keyword_start(input),
        .buffer_path = {},
        .buffer = {},
        .command_line_mode = true,
        .option = options_,
    };

    // Outlives this call when the request times out.
    auto result = std::make_shared<std::optional<CompletionResult>>();
    orchestrator_.complete(request, [result](CompletionResult delivered) { *result = std::move(delivered); });

    if (!loop_.run_until([&result] { return result->has_value(); }, request_timeout)) {
        err << "completion timed out" << std::endl;
        return;
    }

    const CompletionResult &candidates = **result;
    if (!candidates.has_value()) {
        err << candidates.error().message << std::endl;
        return;
    }

    if (candidates->empty()) {
        out << "no completions" << std::endl;
        return;
    }

    for (const auto &candidate : *candidates) {
        out << std::format("  {:<32} {}\n", candidate.label, kind_name(candidate.kind));
    }
}

void PathCompleteApp::print_documentation(const std::string &path, std::ostream &out, std::ostream &err) {
    struct stat buf {};
    if (::stat(path.c_str(), &buf) != 0) {
        err << std::format("{}: {}", path, std::strerror(errno)) << std::endl;
        return;
    }

    CandidateEntry item;
    item.name = path;
    item.absolute_path = path;
    item.stat = file_stat_from(buf);
    item.type = item.stat->type;

    auto result = std::make_shared<std::optional<DocumentationResult>>();
    orchestrator_.resolve(std::move(item), [result](DocumentationResult delivered) { *result = std::move(delivered); });

    if (!loop_.run_until([&result] { return result->has_value(); }, request_timeout)) {
        err << "preview timed out" << std::endl;
        return;
    }

    const DocumentationResult &documented = **result;
    if (!documented.has_value()) {
        err << documented.error().message << std::endl;
        return;
    }

    const auto &documentation = documented->documentation;
    if (!documentation.has_value()) {
        out << std::format("{} is a {}, nothing to preview", path, to_string(documented->type)) << std::endl;
        return;
    }

    out << documentation->value << std::endl;
}

} // namespace asyncpath
