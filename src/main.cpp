#include "core/types.hpp"
#include "core/config.hpp"
#include "core/delta_e.hpp"
#include "core/pipeline.hpp"
#include "palette/palette_source.hpp"
#include "palette/style_selection.hpp"
#include "cli/args.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace dipc {
namespace {

constexpr int EXIT_VALIDATION = 1;
constexpr int EXIT_OPERATIONAL = 127;

int exit_code_for(const Result& r) {
    return is_operational(r.error) ? EXIT_OPERATIONAL : EXIT_VALIDATION;
}

int report(const Result& r) {
    std::cerr << "Error: " << describe(r) << "\n";
    return exit_code_for(r);
}

std::string swatch(const Rgb& c, bool color) {
    if (!color) return "";
    char buf[48];
    std::snprintf(buf, sizeof(buf), "\x1b[48;2;%d;%d;%dm  \x1b[0m", c.r, c.g, c.b);
    return std::string(buf);
}

void print_palette(const Palette& palette, int verbosity, bool color) {
    std::cout << (palette.name ? *palette.name : std::string("(flat)"))
              << " - " << palette.size() << " colors:\n";

    for (size_t i = 0; i < palette.colors.size(); ++i) {
        if (color) {
            std::cout << swatch(palette.colors[i].color, color);
        } else {
            std::cout << to_hex(palette.colors[i].color) << ' ';
        }
        if (i % 8 == 7) std::cout << "\n";
    }
    if (palette.colors.size() % 8 != 0) std::cout << "\n";

    if (verbosity >= 2) {
        for (const auto& entry : palette.colors) {
            std::cout << "  " << swatch(entry.color, color) << ' ' << to_hex(entry.color)
                      << "  " << entry.name << "\n";
        }
    }
}

int list_builtin_palettes() {
    for (BuiltinPalette builtin : all_builtin_palettes()) {
        Document document;
        Result r = load_palette_document(PaletteSource(builtin), document);
        if (r.failure()) {
            return report(r);
        }
        std::cout << builtin_palette_name(builtin) << "\n";
        for (const auto& [style, value] : document.items()) {
            std::cout << "  " << style << " (" << value.size() << " colors)\n";
        }
    }
    return 0;
}

}  // namespace
}  // namespace dipc

int main(int argc, char* argv[]) {
    dipc::Args args = dipc::parse_args(argc, argv);

    if (args.show_help) {
        dipc::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return dipc::EXIT_VALIDATION;
    }

    dipc::Config config = dipc::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = dipc::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path
                      << ": " << load_error << "\n";
            return dipc::EXIT_VALIDATION;
        }
        config = dipc::merge_config(config, *loaded);
    } else {
        const std::string default_path = dipc::Config::default_config_path();
        std::error_code ec;
        if (std::filesystem::exists(default_path, ec)) {
            std::string load_error;
            if (auto loaded = dipc::Config::load(default_path, &load_error)) {
                config = dipc::merge_config(config, *loaded);
            } else {
                std::cerr << "Warning: Ignoring config file " << default_path << ": " << load_error << "\n";
            }
        }
    }
    config = dipc::apply_cli_overrides(config, args);

    if (args.list) {
        return dipc::list_builtin_palettes();
    }

    if (args.palette.empty()) {
        std::cerr << "Error: No palette specified\n";
        dipc::print_help(argv[0]);
        return dipc::EXIT_VALIDATION;
    }
    if (args.inputs.empty()) {
        std::cerr << "Error: No input files specified\n";
        dipc::print_help(argv[0]);
        return dipc::EXIT_VALIDATION;
    }

    dipc::StyleSelection selection;
    dipc::Result r = dipc::parse_style_selection(config.palette.styles, selection);
    if (r.failure()) {
        return dipc::report(r);
    }

    auto method = dipc::parse_distance_method(config.palette.method);
    if (!method) {
        std::cerr << "Error: Unknown distance method: " << config.palette.method << "\n";
        return dipc::EXIT_VALIDATION;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return dipc::EXIT_VALIDATION;
    }

    dipc::PaletteSource source;
    r = dipc::parse_palette_source(args.palette, source);
    if (r.failure()) {
        return dipc::report(r);
    }

    dipc::Pipeline::Config pipeline_cfg;
    pipeline_cfg.method = *method;
    pipeline_cfg.threads = config.performance.threads;
    pipeline_cfg.jpeg_quality = config.output.jpeg_quality;
    dipc::Pipeline pipeline(pipeline_cfg);

    r = pipeline.prepare(source, selection);
    if (r.failure()) {
        return dipc::report(r);
    }

    if (selection.kind == dipc::StyleSelection::Kind::None) {
        dipc::Document document;
        if (dipc::load_palette_document(source, document).success()) {
            const size_t styles = dipc::count_non_color_objects(document);
            if (styles > 0) {
                std::cerr << "Warning: " << styles << " entries of palette " << args.palette
                          << " are styles, not colors, and read as black with --styles none\n";
            }
        }
    }

    const int verbosity = args.verbosity;
    if (verbosity >= 1) {
        const bool color = isatty(STDOUT_FILENO) != 0;
        std::cout << "Palette: " << pipeline.identifier()
                  << ", styles: " << dipc::style_selection_to_string(selection)
                  << ", method: " << dipc::distance_method_name(*method) << "\n";
        for (const auto& palette : pipeline.palettes()) {
            dipc::print_palette(palette, verbosity, color);
        }
        std::cout << dipc::total_colors(pipeline.resolved_palettes()) << " colors resolved, "
                  << pipeline.lab_palette().size() << " after removing duplicates\n";
    }

    std::vector<std::string> outputs = args.output_files;
    if (outputs.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.output.directory, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory " << config.output.directory
                      << ": " << ec.message() << "\n";
            return dipc::EXIT_OPERATIONAL;
        }
        for (const auto& input : args.inputs) {
            outputs.push_back(pipeline.output_path_for(config.output.directory, input));
        }
    }

    if (verbosity >= 1) {
        pipeline.set_image_callback([](size_t, const std::string& input, const std::string& output) {
            std::cout << input << " -> " << output << "\n";
        });
    }
    if (verbosity >= 3) {
        pipeline.set_frame_callback([](size_t frame, size_t total) {
            std::cout << "  frame " << frame << "/" << total << "\n";
        });
    }

    auto start = std::chrono::steady_clock::now();
    r = pipeline.convert_all(args.inputs, outputs);
    if (r.failure()) {
        return dipc::report(r);
    }

    if (verbosity >= 1) {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::cout << "Converted " << args.inputs.size() << " image(s) in " << elapsed << " seconds\n";
    }

    return 0;
}
