#pragma once

#include "core/color_space.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dipc {

enum class DistanceMethod {
    DE2000,
    DE1994G,
    DE1994T,
    DE1976
};

constexpr DistanceMethod DEFAULT_DISTANCE_METHOD = DistanceMethod::DE2000;

const char* distance_method_name(DistanceMethod method);
std::optional<DistanceMethod> parse_distance_method(const std::string& text);

// Perceptual difference between a reference color and a sample. CIE94 is not
// symmetric: its weights come from the reference chroma.
float delta_e(const Lab& reference, const Lab& sample, DistanceMethod method);

float delta_e_1976(const Lab& reference, const Lab& sample);
float delta_e_1994(const Lab& reference, const Lab& sample, bool textiles);
float delta_e_2000(const Lab& reference, const Lab& sample);

// Linear scan with strict improvement: among equally distant candidates the
// earliest one wins. Returns count when the palette is empty.
size_t nearest_index(const Lab& pixel, const Lab* palette, size_t count, DistanceMethod method);

Lab nearest(const Lab& pixel, const Lab* palette, size_t count, DistanceMethod method);
Lab nearest(const Lab& pixel, const std::vector<Lab>& palette, DistanceMethod method);

}
