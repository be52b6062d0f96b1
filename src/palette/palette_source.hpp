#pragma once

#include "core/types.hpp"
#include "palette/palette.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dipc {

enum class BuiltinPalette {
    Catppuccin,
    Edge,
    Everforest,
    Gruvbox,
    GruvboxMaterial,
    Nord,
    OneDark,
    RosePine,
    TokyoNight
};

// Theme given on the command line as `JSON: {...}`.
struct InlineDocument {
    Document document;
};

// Theme stored in a JSON file; read when the document is requested.
struct FileDocument {
    std::string path;
};

using PaletteSource = std::variant<BuiltinPalette, InlineDocument, FileDocument>;

const std::vector<BuiltinPalette>& all_builtin_palettes();
const char* builtin_palette_name(BuiltinPalette palette);
std::optional<BuiltinPalette> parse_builtin_palette(const std::string& name);

// Built-in name (or one of its aliases), `JSON: ` followed by an object, or
// the path of an existing JSON file, tried in that order.
Result parse_palette_source(const std::string& text, PaletteSource& out);

Result load_palette_document(const PaletteSource& source, Document& out);

// Canonical built-in name, or "custom" for user supplied documents.
std::string palette_identifier(const PaletteSource& source);

}
