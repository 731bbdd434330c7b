#include <iostream>
#include <utility>

#include "app/path_complete_app.hpp"

int main() {
    asyncpath::OptionMap options;
    try {
        options = asyncpath::options_from_environment();
        (void)asyncpath::validate_options(options);
    } catch (const asyncpath::OptionError &error) {
        std::cerr << "asyncpath: " << error.what() << std::endl;
        return 2;
    }

    asyncpath::PathCompleteApp app(std::move(options), asyncpath::make_diagnostic_sink_from_env());
    return app.run();
}
