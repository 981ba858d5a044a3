#include "options.hpp"
#include <cstdlib>

namespace typecase::fontinfo {

Result<Options, std::string> parse_options(int argc, const char* const argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--size" || arg == "--log-file") {
            if (i + 1 >= argc) {
                return make_error(arg + " requires a value");
            }
            const char* value = argv[++i];

            if (arg == "--log-file") {
                options.log_file = value;
                continue;
            }

            char* end = nullptr;
            const f32 size = std::strtof(value, &end);
            if (end == value || *end != '\0' || !(size > 0)) {
                return make_error("invalid size: " + std::string(value));
            }
            options.engine.pixel_size = size;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return make_error("unknown option: " + arg);
        } else {
            options.paths.push_back(std::move(arg));
        }
    }

    if (!options.show_help && options.paths.empty()) {
        return make_error(std::string("no font files given"));
    }
    return options;
}

} // namespace typecase::fontinfo
