#include "core/path_resolver.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "core/path_grammar.hpp"

namespace asyncpath {

PathResolver::PathResolver(PathSyntax syntax) : PathResolver(syntax, default_false_positive_policy()) {}

PathResolver::PathResolver(PathSyntax syntax, FalsePositivePolicy policy)
    : syntax_(syntax), rules_(default_resolution_rules(std::move(policy))) {}

ResolvedDirectory PathResolver::resolve(const CursorContext &context) const {
    auto match = evaluate(context);
    if (!match.has_value()) {
        return std::nullopt;
    }

    return canonicalize(match->directory, syntax_);
}

std::optional<std::string> PathResolver::matching_rule(const CursorContext &context) const {
    auto match = evaluate(context);
    if (!match.has_value()) {
        return std::nullopt;
    }

    return std::move(match->rule);
}

std::optional<PathResolver::Match> PathResolver::evaluate(const CursorContext &context) const {
    const std::string_view line = context.line_before_cursor;

    const auto split = find_split_point(line, syntax_);
    if (!split.has_value()) {
        return resolve_without_split(context);
    }

    const ResolutionInput input{
        .line = line,
        .prefix = line.substr(0, *split + 1),
        .dirname = strip_partial_name(line.substr(*split + 1), syntax_),
        .cwd = context.cwd,
        .syntax = syntax_,
        .buffer = &context.buffer,
    };

    for (const auto &rule : rules_) {
        if (auto directory = rule.apply(input); directory.has_value()) {
            return Match{.rule = rule.name, .directory = std::move(*directory)};
        }
    }

    return std::nullopt;
}

PathResolver::Match PathResolver::resolve_without_split(const CursorContext &context) const {
    const std::string_view line = context.line_before_cursor;
    const auto separator = std::find_if(line.rbegin(), line.rend(), [this](char c) { return syntax_.is_separator(c); });

    if (separator == line.rend()) {
        return Match{.rule = "no-split", .directory = context.cwd};
    }

    const auto up_to_separator = line.substr(0, static_cast<std::size_t>(line.rend() - separator));
    return Match{.rule = "no-split", .directory = join_path(context.cwd, up_to_separator)};
}

} // namespace asyncpath
