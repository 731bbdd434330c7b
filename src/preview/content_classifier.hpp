#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/candidate.hpp"
#include "preview/document_previewer.hpp"

namespace asyncpath {

// Filetype used to tag a fenced code block, detected from the leading lines
// first and the file extension second.
[[nodiscard]] std::optional<std::string> classify_content(const std::vector<std::string> &lines, std::string_view path);

[[nodiscard]] Documentation format_documentation(const PreviewResult &preview, std::string_view path);

} // namespace asyncpath
