#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/cursor_context.hpp"

namespace asyncpath {

class CompletionOrchestrator;
class MainLoop;

class ReadlineCompletion {
  public:
    ReadlineCompletion(
        const CompletionOrchestrator &orchestrator,
        MainLoop &loop,
        OptionMap options,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    void install();

  private:
    const CompletionOrchestrator &orchestrator_;
    MainLoop &loop_;
    OptionMap options_;
    std::chrono::milliseconds timeout_;

    static ReadlineCompletion *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);

    [[nodiscard]] std::vector<std::string>
    collect_matches(const std::string &line_before_cursor, std::size_t start, const std::string &word) const;
};

} // namespace asyncpath
