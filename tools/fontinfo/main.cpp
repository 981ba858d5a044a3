/**
 * Font Collection Inspector
 * Usage: typecase-fontinfo [--size N] [--verbose] [--log-file PATH] FILE...
 *
 * Registers each file as an in-memory font and loads the collection through
 * the FreeType engine, the same way a text engine would see it.
 */

#include "options.hpp"
#include "typecase/core/logger.hpp"
#include "typecase/fonts/font_buffer.hpp"
#include "typecase/fonts/memory_font_collection.hpp"
#include "typecase/fonts/freetype_engine.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace typecase;

namespace {

void print_usage() {
    std::cerr << "Usage: typecase-fontinfo [--size N] [--verbose] [--log-file PATH] FILE...\n";
}

bool read_file(const std::string& path, std::vector<u8>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = fontinfo::parse_options(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error() << "\n";
        print_usage();
        return 1;
    }
    if (parsed.value().show_help) {
        print_usage();
        return 0;
    }

    const fontinfo::Options& options = parsed.value();
    const auto& paths = options.paths;

    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    if (!options.log_file.empty()) {
        auto sink = std::make_unique<FileSink>(options.log_file.c_str());
        if (!sink->is_open()) {
            std::cerr << "Error: Cannot open log file: " << options.log_file << "\n";
            return 1;
        }
        sinks.push_back(std::move(sink));
    }
    logging::init(std::move(sinks));
    logging::set_level(options.verbose ? LogLevel::Debug : LogLevel::Warn);

    auto store = std::make_shared<fonts::BufferStore>();
    for (const auto& path : paths) {
        std::vector<u8> bytes;
        if (!read_file(path, bytes)) {
            std::cerr << "Error: Cannot open file: " << path << "\n";
            logging::shutdown();
            return 1;
        }
        store->register_font(std::move(bytes));
    }

    logging::get("fontinfo").info("registered " + std::to_string(store->size()) + " font files");

    auto loader = make_ref<fonts::MemoryFontCollectionLoader>(store);

    // What the engine sees for each file
    std::cout << "=== Files ===\n";
    auto enumerator = loader->create_enumerator({});
    usize index = 0;
    while (enumerator && enumerator.value()->move_next()) {
        auto file = enumerator.value()->get_current_font_file();
        if (!file) {
            break;
        }
        auto analysis = file.value()->analyze();
        std::cout << "  " << paths[index] << ": " << file.value()->reference_key().size << " bytes, "
                  << fonts::font_file_type_name(analysis.file_type)
                  << (analysis.supported ? "" : " (unsupported)") << "\n";
        ++index;
    }

    fonts::freetype::FreeTypeFontEngine engine(options.engine);
    auto faces = engine.load_collection(*loader);
    if (!faces) {
        std::cerr << "Error: " << fonts::freetype::engine_error_name(faces.error().code)
                  << ": " << faces.error().message << "\n";
        logging::shutdown();
        return 1;
    }

    std::cout << "\n=== Faces ===\n";
    std::cout << "Loaded: " << faces.value().size() << "\n";
    for (const auto& face : faces.value()) {
        std::cout << "\n  Family: " << face->family_name() << "\n";
        std::cout << "  Style: " << face->style_name() << "\n";
        std::cout << "  Glyphs: " << face->glyph_count() << "\n";
        std::cout << "  Line height @" << face->pixel_size() << "px: "
                  << face->metrics().line_height() << "\n";
        std::cout << "  Sample width: " << face->measure_text("The quick brown fox") << "\n";
    }

    logging::shutdown();
    return 0;
}
