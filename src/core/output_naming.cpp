#include "core/output_naming.hpp"
#include "core/frame_source.hpp"

#include <algorithm>
#include <filesystem>

namespace dipc {

std::string output_file_name(const std::string& directory,
                             const std::string& input_path,
                             const std::string& identifier,
                             const std::vector<Palette>& palettes,
                             DistanceMethod method,
                             const std::string& extension) {
    std::string stem = std::filesystem::path(input_path).stem().string();
    if (stem.empty()) {
        stem = "image";
    }

    std::string name = stem + "_" + identifier;
    for (const auto& palette : palettes) {
        if (!palette.name) {
            continue;
        }
        std::string style = *palette.name;
        std::replace(style.begin(), style.end(), ' ', '_');
        name += "-" + style;
    }

    if (method != DEFAULT_DISTANCE_METHOD) {
        name += "_";
        name += distance_method_name(method);
    }

    name += "." + extension;

    if (directory.empty()) {
        return name;
    }
    return (std::filesystem::path(directory) / name).string();
}

std::string default_output_extension(const std::string& input_path) {
    return is_animated_input(input_path) ? "gif" : "png";
}

}
