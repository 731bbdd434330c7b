#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>

namespace asyncpath {

struct CompletionRequest;

using CwdProvider = std::function<std::string(const CompletionRequest &)>;
using OptionValue = std::variant<bool, std::string, CwdProvider>;
using OptionMap = std::map<std::string, OptionValue>;

class OptionError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

struct Options {
    bool trailing_slash{false};
    bool label_trailing_slash{true};
    CwdProvider get_cwd;
    bool show_hidden_files_by_default{false};
};

// Directory of the request's buffer, or the process working directory when
// the buffer has no name.
[[nodiscard]] std::string buffer_directory(const CompletionRequest &request);

// Merges overrides over the defaults. Throws OptionError when a known key
// carries a value of the wrong type. Unknown keys are ignored.
[[nodiscard]] Options validate_options(const OptionMap &overrides);

// Reads ASYNCPATH_TRAILING_SLASH, ASYNCPATH_LABEL_TRAILING_SLASH and
// ASYNCPATH_SHOW_HIDDEN. Throws OptionError on an unparsable value.
[[nodiscard]] OptionMap options_from_environment();

[[nodiscard]] bool parse_bool_option(const std::string &name, const std::string &value);

} // namespace asyncpath
