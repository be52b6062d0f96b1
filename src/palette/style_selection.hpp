#pragma once

#include "core/types.hpp"
#include "palette/palette.hpp"
#include <string>
#include <vector>

namespace dipc {

struct StyleSelection {
    enum class Kind {
        All,
        None,
        Some
    };

    Kind kind = Kind::All;
    std::vector<std::string> names;

    static StyleSelection all() { return {Kind::All, {}}; }
    static StyleSelection none() { return {Kind::None, {}}; }
    static StyleSelection some(std::vector<std::string> names) { return {Kind::Some, std::move(names)}; }
};

// "all", "none" or a comma separated list of style names.
Result parse_style_selection(const std::string& text, StyleSelection& out);

std::string style_selection_to_string(const StyleSelection& selection);

// None reads the whole document as one flat, unnamed palette. All and Some
// read each selected top-level entry as a named palette of its own. Output
// order is document order for All and request order for Some.
Result resolve_palettes(const Document& document, const StyleSelection& selection,
                        std::vector<Palette>& out);

}
