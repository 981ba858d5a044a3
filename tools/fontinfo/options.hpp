#pragma once

#include "typecase/core/types.hpp"
#include "typecase/fonts/engine_config.hpp"
#include <string>
#include <vector>

namespace typecase::fontinfo {

struct Options {
    fonts::FontEngineConfig engine;
    bool verbose{false};
    bool show_help{false};
    std::string log_file;        // Empty when not requested
    std::vector<std::string> paths;
};

/// Parse argv. The error is a message for stderr.
[[nodiscard]] Result<Options, std::string> parse_options(int argc, const char* const argv[]);

} // namespace typecase::fontinfo
