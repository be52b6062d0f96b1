#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dipc {

// Key order of palette documents is meaningful (style order, tie-breaks), so
// documents are always held as ordered_json.
using Document = nlohmann::ordered_json;

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;

    Rgb() = default;
    Rgb(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    uint32_t packed() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
    bool operator<(const Rgb& o) const { return packed() < o.packed(); }
};

struct PaletteEntry {
    std::string name;
    Rgb color;
};

struct Palette {
    std::optional<std::string> name;
    std::vector<PaletteEntry> colors;

    size_t size() const { return colors.size(); }
    bool empty() const { return colors.empty(); }
};

// Accepts "#RRGGBB", "#RGB", [r, g, b] and {"r": .., "g": .., "b": ..}.
// Values of any other shape read as black.
Result parse_color(const Document& value, const std::string& name, Rgb& out);

// Entries of a flat document whose value is an object with no channel key,
// usually a style of a styled theme. They read as black.
size_t count_non_color_objects(const Document& object);

// Parses every entry of a JSON object, in document order, as a named color.
Result palette_from_json(const Document& object, Palette& out);

// Sorts by raw channel value and drops repeated colors; the first entry of
// each run of equal colors keeps its name.
void dedup_palette(Palette& palette);
void dedup_palettes(std::vector<Palette>& palettes);

size_t total_colors(const std::vector<Palette>& palettes);

std::string to_hex(const Rgb& color);

}
