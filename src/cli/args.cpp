#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <climits>

namespace dipc {

static bool parse_int(const char* s, int min_val, int max_val, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    long val = std::strtol(s, &end, 10);
    if (*end != '\0' || val < min_val || val > max_val) return false;
    out = static_cast<int>(val);
    return true;
}

static bool is_verbose_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') return false;
    for (const char* p = arg + 1; *p; ++p) {
        if (*p != 'v') return false;
    }
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    std::vector<std::string> positionals;
    bool options_done = false;

    auto take_value = [&](int& i, const char* name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = std::string("Missing value for ") + name;
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || arg[1] == '\0') {
            positionals.emplace_back(arg);
            continue;
        }

        if (strcmp(arg, "--") == 0) {
            options_done = true;
        }
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }
        else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--list") == 0) {
            args.list = true;
        }
        else if (strcmp(arg, "--verbose") == 0) {
            ++args.verbosity;
        }
        else if (is_verbose_flag(arg)) {
            args.verbosity += static_cast<int>(strlen(arg)) - 1;
        }
        else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--styles") == 0) {
            if (const char* v = take_value(i, arg)) {
                args.styles = v;
                args.styles_set = true;
            }
        }
        else if (strcmp(arg, "-m") == 0 || strcmp(arg, "--method") == 0) {
            if (const char* v = take_value(i, arg)) args.method = v;
        }
        else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (const char* v = take_value(i, arg)) args.output_dir = v;
        }
        else if (strcmp(arg, "-O") == 0 || strcmp(arg, "--output-file") == 0) {
            if (const char* v = take_value(i, arg)) args.output_files.emplace_back(v);
        }
        else if (strcmp(arg, "--config") == 0) {
            if (const char* v = take_value(i, arg)) args.config_path = v;
        }
        else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--threads") == 0) {
            if (const char* v = take_value(i, arg)) {
                if (!parse_int(v, 0, 1024, args.threads)) {
                    args.error = std::string("Invalid thread count: ") + v;
                }
            }
        }
        else {
            args.error = std::string("Unknown option: ") + arg;
        }
    }

    if (!positionals.empty()) {
        args.palette = positionals.front();
        args.inputs.assign(positionals.begin() + 1, positionals.end());
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <PALETTE> <FILE>...\n\n", prog);
    printf("Recolor images so that every pixel uses the closest color of a palette.\n\n");
    printf("PALETTE:\n");
    printf("  A built-in theme name, the path to a JSON theme file, or a JSON object\n");
    printf("  given inline as 'JSON: {...}'. Run with --list to see the built-in themes.\n\n");
    printf("FILE:\n");
    printf("  Images to convert (png, jpg, bmp, tga, ...). Animated GIFs stay animated.\n\n");
    printf("OPTIONS:\n");
    printf("  -s, --styles <VARIATIONS>  'all' (default), 'none' for a flat theme, or a\n");
    printf("                             comma separated list of theme variations\n");
    printf("  -m, --method <METHOD>      Color distance: de2000 (default), de1994g,\n");
    printf("                             de1994t, de1976\n");
    printf("  -o, --output <DIR>         Output directory (default: output)\n");
    printf("  -O, --output-file <FILE>   Explicit output file, once per input file\n");
    printf("  -j, --threads <N>          Worker threads (default: 0 = all cores)\n");
    printf("      --config <FILE>        Config file path (default: platform-specific)\n");
    printf("  -l, --list                 List built-in themes and their variations\n");
    printf("  -v, --verbose              Print palettes and timings (repeat for more)\n");
    printf("  -h, --help                 Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default location: $XDG_CONFIG_HOME/dipc/config.toml\n");
    printf("                    (~/.config/dipc/config.toml when XDG_CONFIG_HOME is unset)\n");
    printf("\nEXIT STATUS:\n");
    printf("  0 on success, 1 for invalid arguments, palettes or config,\n");
    printf("  127 when an image cannot be decoded or encoded\n");
}

}
