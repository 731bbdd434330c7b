#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "completion/completion_orchestrator.hpp"
#include "core/options.hpp"
#include "line_editing/completion.hpp"
#include "logging/diagnostics.hpp"
#include "runtime/main_loop.hpp"

namespace asyncpath {

class PathCompleteApp {
  public:
    PathCompleteApp(OptionMap options, std::shared_ptr<DiagnosticSink> sink);

    int run();

    // Returns false when the line asks to leave the prompt.
    bool handle_line(const std::string &input, std::ostream &out, std::ostream &err);

  private:
    MainLoop loop_;
    OptionMap options_;
    CompletionOrchestrator orchestrator_;
    ReadlineCompletion readline_completion_;

    void print_candidates(const std::string &input, std::ostream &out, std::ostream &err);
    void print_documentation(const std::string &path, std::ostream &out, std::ostream &err);
};

} // namespace asyncpath
