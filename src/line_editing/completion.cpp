#include "line_editing/completion.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <readline/readline.h>

#include "completion/completion_orchestrator.hpp"
#include "runtime/main_loop.hpp"

namespace asyncpath {

namespace {

// Whitespace plus every byte the path-name grammar excludes. '.' is not a
// break character so hidden names stay whole.
constexpr const char *word_break_characters = " \t\n/\\:*?<>'\"`|";

} // namespace

ReadlineCompletion *ReadlineCompletion::instance_ = nullptr;

ReadlineCompletion::ReadlineCompletion(
    const CompletionOrchestrator &orchestrator, MainLoop &loop, OptionMap options, std::chrono::milliseconds timeout)
    : orchestrator_(orchestrator), loop_(loop), options_(std::move(options)), timeout_(timeout) {}

void ReadlineCompletion::install() {
    instance_ = this;
    rl_attempted_completion_function = &ReadlineCompletion::completion_callback;
    rl_completer_word_break_characters = word_break_characters;
}

char **ReadlineCompletion::completion_callback(const char *text, int start, int end) {
    rl_attempted_completion_over = 1;

    if (instance_ == nullptr || rl_line_buffer == nullptr || start < 0 || end < start) {
        return nullptr;
    }

    return rl_completion_matches(text, &ReadlineCompletion::generator_callback);
}

char *ReadlineCompletion::generator_callback(const char *text, int state) {
    static std::vector<std::string> matches;
    static std::size_t index = 0;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        const std::string line(rl_line_buffer != nullptr ? rl_line_buffer : "",
                               rl_line_buffer != nullptr ? static_cast<std::size_t>(rl_point) : 0);
        const std::string word(text);
        const std::size_t start = line.size() >= word.size() ? line.size() - word.size() : 0;

        matches = instance_->collect_matches(line, start, word);
        index = 0;

        if (matches.size() == 1 && matches.front().ends_with('/')) {
            rl_completion_suppress_append = 1;
        }
    }

    if (index >= matches.size()) {
        return nullptr;
    }

    return ::strdup(matches[index++].c_str());
}

std::vector<std::string> ReadlineCompletion::collect_matches(
    const std::string &line_before_cursor, std::size_t start, const std::string &word) const {
    struct Pending {
        bool done{false};
        std::optional<CompletionResult> result;
    };

    const CompletionRequest request{
        .line_before_cursor = line_before_cursor,
        .offset = start,
        .buffer_path = {},
        .buffer = {},
        .command_line_mode = true,
        .option = options_,
    };

    auto pending = std::make_shared<Pending>();
    orchestrator_.complete(request, [pending](CompletionResult result) {
        pending->result = std::move(result);
        pending->done = true;
    });

    if (!loop_.run_until([&pending] { return pending->done; }, timeout_)) {
        return {};
    }

    if (!pending->result->has_value()) {
        std::cerr << "\n" << pending->result->error().message << std::endl;
        rl_on_new_line();
        return {};
    }

    std::vector<std::string> matches;
    for (const auto &candidate : pending->result->value()) {
        if (candidate.filter_text.starts_with(word)) {
            matches.push_back(candidate.insert_text);
        }
    }

    return matches;
}

} // namespace asyncpath
