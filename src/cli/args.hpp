#pragma once

#include <string>
#include <vector>

namespace dipc {

struct Args {
    std::string palette;
    std::vector<std::string> inputs;
    std::vector<std::string> output_files;

    std::string styles;
    bool styles_set = false;
    std::string method;
    std::string output_dir;
    std::string config_path;

    int threads = -1;
    int verbosity = 0;

    bool list = false;
    bool show_help = false;

    // Set when the command line cannot be used as given.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
