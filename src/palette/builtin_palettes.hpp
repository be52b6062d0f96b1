#pragma once

#include "palette/palette_source.hpp"

namespace dipc {

// JSON text of an embedded theme. Every built-in is an object of styles,
// each style an object of named "#RRGGBB" colors.
const char* builtin_palette_json(BuiltinPalette palette);

}
