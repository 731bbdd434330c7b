#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/cursor_context.hpp"
#include "core/path_rules.hpp"

namespace asyncpath {

using ResolvedDirectory = std::optional<std::string>;

class PathResolver {
  public:
    explicit PathResolver(PathSyntax syntax = PathSyntax::native());
    PathResolver(PathSyntax syntax, FalsePositivePolicy policy);

    [[nodiscard]] ResolvedDirectory resolve(const CursorContext &context) const;

    // Name of the rule that resolves `context`, or nullopt when none does.
    [[nodiscard]] std::optional<std::string> matching_rule(const CursorContext &context) const;

    [[nodiscard]] PathSyntax syntax() const noexcept { return syntax_; }

  private:
    PathSyntax syntax_;
    std::vector<ResolutionRule> rules_;

    struct Match {
        std::string rule;
        std::string directory;
    };

    [[nodiscard]] std::optional<Match> evaluate(const CursorContext &context) const;
    [[nodiscard]] Match resolve_without_split(const CursorContext &context) const;
};

} // namespace asyncpath
