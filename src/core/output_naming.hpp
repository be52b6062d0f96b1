#pragma once

#include "core/delta_e.hpp"
#include "palette/palette.hpp"
#include <string>
#include <vector>

namespace dipc {

// <dir>/<stem>_<identifier>[-<style>...][_<method>].<extension>
// Only named palettes add a style suffix, with spaces turned into '_'. The
// method suffix is left out for the default method.
std::string output_file_name(const std::string& directory,
                             const std::string& input_path,
                             const std::string& identifier,
                             const std::vector<Palette>& palettes,
                             DistanceMethod method,
                             const std::string& extension = "png");

// "gif" for animated inputs, "png" for everything else.
std::string default_output_extension(const std::string& input_path);

}
