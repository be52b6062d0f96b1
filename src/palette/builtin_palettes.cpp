#include "palette/builtin_palettes.hpp"

namespace dipc {

namespace {

const char* const CATPPUCCIN_JSON = R"json({
  "latte": {
    "rosewater": "#dc8a78", "flamingo": "#dd7878", "pink": "#ea76cb", "mauve": "#8839ef",
    "red": "#d20f39", "maroon": "#e64553", "peach": "#fe640b", "yellow": "#df8e1d",
    "green": "#40a02b", "teal": "#179299", "sky": "#04a5e5", "sapphire": "#209fb5",
    "blue": "#1e66f5", "lavender": "#7287fd", "text": "#4c4f69", "subtext1": "#5c5f77",
    "subtext0": "#6c6f85", "overlay2": "#7c7f93", "overlay1": "#8c8fa1", "overlay0": "#9ca0b0",
    "surface2": "#acb0be", "surface1": "#bcc0cc", "surface0": "#ccd0da", "base": "#eff1f5",
    "mantle": "#e6e9ef", "crust": "#dce0e8"
  },
  "frappe": {
    "rosewater": "#f2d5cf", "flamingo": "#eebebe", "pink": "#f4b8e4", "mauve": "#ca9ee6",
    "red": "#e78284", "maroon": "#ea999c", "peach": "#ef9f76", "yellow": "#e5c890",
    "green": "#a6d189", "teal": "#81c8be", "sky": "#99d1db", "sapphire": "#85c1dc",
    "blue": "#8caaee", "lavender": "#babbf1", "text": "#c6d0f5", "subtext1": "#b5bfe2",
    "subtext0": "#a5adce", "overlay2": "#949cbb", "overlay1": "#838ba7", "overlay0": "#737994",
    "surface2": "#626880", "surface1": "#51576d", "surface0": "#414559", "base": "#303446",
    "mantle": "#292c3c", "crust": "#232634"
  },
  "macchiato": {
    "rosewater": "#f4dbd6", "flamingo": "#f0c6c6", "pink": "#f5bde6", "mauve": "#c6a0f6",
    "red": "#ed8796", "maroon": "#ee99a0", "peach": "#f5a97f", "yellow": "#eed49f",
    "green": "#a6da95", "teal": "#8bd5ca", "sky": "#91d7e3", "sapphire": "#7dc4e4",
    "blue": "#8aadf4", "lavender": "#b7bdf8", "text": "#cad3f5", "subtext1": "#b8c0e0",
    "subtext0": "#a5adcb", "overlay2": "#939ab7", "overlay1": "#8087a2", "overlay0": "#6e738d",
    "surface2": "#5b6078", "surface1": "#494d64", "surface0": "#363a4f", "base": "#24273a",
    "mantle": "#1e2030", "crust": "#181926"
  },
  "mocha": {
    "rosewater": "#f5e0dc", "flamingo": "#f2cdcd", "pink": "#f5c2e7", "mauve": "#cba6f7",
    "red": "#f38ba8", "maroon": "#eba0ac", "peach": "#fab387", "yellow": "#f9e2af",
    "green": "#a6e3a1", "teal": "#94e2d5", "sky": "#89dceb", "sapphire": "#74c7ec",
    "blue": "#89b4fa", "lavender": "#b4befe", "text": "#cdd6f4", "subtext1": "#bac2de",
    "subtext0": "#a6adc8", "overlay2": "#9399b2", "overlay1": "#7f849c", "overlay0": "#6c7086",
    "surface2": "#585b70", "surface1": "#45475a", "surface0": "#313244", "base": "#1e1e2e",
    "mantle": "#181825", "crust": "#11111b"
  }
})json";

const char* const EDGE_JSON = R"json({
  "dark": {
    "bg0": "#2c2e34", "bg1": "#33353f", "bg2": "#363944", "bg3": "#3b3e48", "bg4": "#414550",
    "bg_grey": "#7f8490", "fg": "#c5cdd9", "red": "#ec7279", "yellow": "#deb974",
    "green": "#a0c980", "cyan": "#5dbbc1", "blue": "#6cb6eb", "purple": "#d38aea", "grey": "#758094"
  },
  "light": {
    "bg0": "#fafafa", "bg1": "#eef1f4", "bg2": "#e8ebf0", "bg3": "#dde2e7", "bg4": "#d5dae0",
    "bg_grey": "#bcc5cf", "fg": "#4b505b", "red": "#d05858", "yellow": "#be7e05",
    "green": "#608e32", "cyan": "#3a8b84", "blue": "#5079be", "purple": "#b05ccc", "grey": "#8790a0"
  }
})json";

const char* const EVERFOREST_JSON = R"json({
  "dark": {
    "bg_dim": "#232a2e", "bg0": "#2d353b", "bg1": "#343f44", "bg2": "#3d484d", "bg3": "#475258",
    "bg4": "#4f585e", "bg5": "#56635f", "fg": "#d3c6aa", "red": "#e67e80", "orange": "#e69875",
    "yellow": "#dbbc7f", "green": "#a7c080", "aqua": "#83c092", "blue": "#7fbbb3",
    "purple": "#d699b6", "grey0": "#7a8478", "grey1": "#859289", "grey2": "#9da9a0"
  },
  "light": {
    "bg_dim": "#efebd4", "bg0": "#fdf6e3", "bg1": "#f4f0d9", "bg2": "#efebd4", "bg3": "#e6e2cc",
    "bg4": "#e0dcc7", "bg5": "#bdc3af", "fg": "#5c6a72", "red": "#f85552", "orange": "#f57d26",
    "yellow": "#dfa000", "green": "#8da101", "aqua": "#35a77c", "blue": "#3a94c5",
    "purple": "#df69ba", "grey0": "#a6b0a0", "grey1": "#939f91", "grey2": "#829181"
  }
})json";

const char* const GRUVBOX_JSON = R"json({
  "dark": {
    "bg": "#282828", "bg0_h": "#1d2021", "bg0_s": "#32302f", "bg1": "#3c3836", "bg2": "#504945",
    "bg3": "#665c54", "bg4": "#7c6f64", "gray": "#928374", "fg": "#ebdbb2", "fg0": "#fbf1c7",
    "fg2": "#d5c4a1", "fg3": "#bdae93", "fg4": "#a89984", "red": "#cc241d", "green": "#98971a",
    "yellow": "#d79921", "blue": "#458588", "purple": "#b16286", "aqua": "#689d6a",
    "orange": "#d65d0e", "bright_red": "#fb4934", "bright_green": "#b8bb26",
    "bright_yellow": "#fabd2f", "bright_blue": "#83a598", "bright_purple": "#d3869b",
    "bright_aqua": "#8ec07c", "bright_orange": "#fe8019"
  },
  "light": {
    "bg": "#fbf1c7", "bg0_h": "#f9f5d7", "bg0_s": "#f2e5bc", "bg1": "#ebdbb2", "bg2": "#d5c4a1",
    "bg3": "#bdae93", "bg4": "#a89984", "gray": "#928374", "fg": "#3c3836", "fg0": "#282828",
    "fg2": "#504945", "fg3": "#665c54", "fg4": "#7c6f64", "red": "#cc241d", "green": "#98971a",
    "yellow": "#d79921", "blue": "#458588", "purple": "#b16286", "aqua": "#689d6a",
    "orange": "#d65d0e", "faded_red": "#9d0006", "faded_green": "#79740e",
    "faded_yellow": "#b57614", "faded_blue": "#076678", "faded_purple": "#8f3f71",
    "faded_aqua": "#427b58", "faded_orange": "#af3a03"
  }
})json";

const char* const GRUVBOX_MATERIAL_JSON = R"json({
  "dark": {
    "bg0": "#282828", "bg1": "#32302f", "bg3": "#45403d", "bg5": "#5a524c", "fg0": "#d4be98",
    "fg1": "#ddc7a1", "red": "#ea6962", "orange": "#e78a4e", "yellow": "#d8a657",
    "green": "#a9b665", "aqua": "#89b482", "blue": "#7daea3", "purple": "#d3869b",
    "grey0": "#7c6f64", "grey1": "#928374", "grey2": "#a89984"
  },
  "light": {
    "bg0": "#fbf1c7", "bg1": "#f4e8be", "bg2": "#f2e5bc", "bg3": "#eee0b7", "bg5": "#ddccab",
    "fg0": "#654735", "fg1": "#4f3829", "red": "#c14a4a", "orange": "#c35e0a",
    "yellow": "#b47109", "green": "#6c782e", "aqua": "#4c7a5d", "blue": "#45707a",
    "purple": "#945e80", "grey0": "#a89984", "grey1": "#928374", "grey2": "#7c6f64"
  }
})json";

const char* const NORD_JSON = R"json({
  "Polar Night": {
    "nord0": "#2e3440", "nord1": "#3b4252", "nord2": "#434c5e", "nord3": "#4c566a"
  },
  "Snow Storm": {
    "nord4": "#d8dee9", "nord5": "#e5e9f0", "nord6": "#eceff4"
  },
  "Frost": {
    "nord7": "#8fbcbb", "nord8": "#88c0d0", "nord9": "#81a1c1", "nord10": "#5e81ac"
  },
  "Aurora": {
    "nord11": "#bf616a", "nord12": "#d08770", "nord13": "#ebcb8b", "nord14": "#a3be8c",
    "nord15": "#b48ead"
  },
  "Full": {
    "nord0": "#2e3440", "nord1": "#3b4252", "nord2": "#434c5e", "nord3": "#4c566a",
    "nord4": "#d8dee9", "nord5": "#e5e9f0", "nord6": "#eceff4", "nord7": "#8fbcbb",
    "nord8": "#88c0d0", "nord9": "#81a1c1", "nord10": "#5e81ac", "nord11": "#bf616a",
    "nord12": "#d08770", "nord13": "#ebcb8b", "nord14": "#a3be8c", "nord15": "#b48ead"
  }
})json";

const char* const ONEDARK_JSON = R"json({
  "dark": {
    "black": "#181a1f", "bg0": "#282c34", "bg1": "#31353f", "bg2": "#393f4a", "bg3": "#3b3f4c",
    "fg": "#abb2bf", "red": "#e86671", "orange": "#d19a66", "yellow": "#e5c07b",
    "green": "#98c379", "cyan": "#56b6c2", "blue": "#61afef", "purple": "#c678dd",
    "grey": "#5c6370", "light_grey": "#848b98"
  },
  "light": {
    "bg0": "#fafafa", "bg1": "#f0f0f0", "bg2": "#e6e6e6", "bg3": "#dcdcdc", "fg": "#383a42",
    "red": "#e45649", "orange": "#986801", "yellow": "#c18401", "green": "#50a14f",
    "cyan": "#0184bc", "blue": "#4078f2", "purple": "#a626a4", "grey": "#a0a1a7",
    "light_grey": "#818387"
  }
})json";

const char* const ROSE_PINE_JSON = R"json({
  "main": {
    "base": "#191724", "surface": "#1f1d2e", "overlay": "#26233a", "muted": "#6e6a86",
    "subtle": "#908caa", "text": "#e0def4", "love": "#eb6f92", "gold": "#f6c177",
    "rose": "#ebbcba", "pine": "#31748f", "foam": "#9ccfd8", "iris": "#c4a7e7",
    "highlight_low": "#21202e", "highlight_med": "#403d52", "highlight_high": "#524f67"
  },
  "moon": {
    "base": "#232136", "surface": "#2a273f", "overlay": "#393552", "muted": "#6e6a86",
    "subtle": "#908caa", "text": "#e0def4", "love": "#eb6f92", "gold": "#f6c177",
    "rose": "#ea9a97", "pine": "#3e8fb0", "foam": "#9ccfd8", "iris": "#c4a7e7",
    "highlight_low": "#2a283e", "highlight_med": "#44415a", "highlight_high": "#56526e"
  },
  "dawn": {
    "base": "#faf4ed", "surface": "#fffaf3", "overlay": "#f2e9e1", "muted": "#9893a5",
    "subtle": "#797593", "text": "#575279", "love": "#b4637a", "gold": "#ea9d34",
    "rose": "#d7827e", "pine": "#286983", "foam": "#56949f", "iris": "#907aa9",
    "highlight_low": "#f4ede8", "highlight_med": "#dfdad9", "highlight_high": "#cecacd"
  }
})json";

const char* const TOKYO_NIGHT_JSON = R"json({
  "night": {
    "bg": "#1a1b26", "bg_dark": "#16161e", "bg_highlight": "#292e42", "terminal_black": "#414868",
    "fg": "#c0caf5", "fg_dark": "#a9b1d6", "fg_gutter": "#3b4261", "dark3": "#545c7e",
    "comment": "#565f89", "dark5": "#737aa2", "blue0": "#3d59a1", "blue": "#7aa2f7",
    "cyan": "#7dcfff", "blue1": "#2ac3de", "blue2": "#0db9d7", "blue5": "#89ddff",
    "blue6": "#b4f9f8", "blue7": "#394b70", "magenta": "#bb9af7", "magenta2": "#ff007c",
    "purple": "#9d7cd8", "orange": "#ff9e64", "yellow": "#e0af68", "green": "#9ece6a",
    "green1": "#73daca", "green2": "#41a6b5", "teal": "#1abc9c", "red": "#f7768e", "red1": "#db4b4b"
  },
  "storm": {
    "bg": "#24283b", "bg_dark": "#1f2335", "bg_highlight": "#292e42", "terminal_black": "#414868",
    "fg": "#c0caf5", "fg_dark": "#a9b1d6", "fg_gutter": "#3b4261", "dark3": "#545c7e",
    "comment": "#565f89", "dark5": "#737aa2", "blue0": "#3d59a1", "blue": "#7aa2f7",
    "cyan": "#7dcfff", "blue1": "#2ac3de", "blue2": "#0db9d7", "blue5": "#89ddff",
    "blue6": "#b4f9f8", "blue7": "#394b70", "magenta": "#bb9af7", "magenta2": "#ff007c",
    "purple": "#9d7cd8", "orange": "#ff9e64", "yellow": "#e0af68", "green": "#9ece6a",
    "green1": "#73daca", "green2": "#41a6b5", "teal": "#1abc9c", "red": "#f7768e", "red1": "#db4b4b"
  },
  "day": {
    "bg": "#e1e2e7", "bg_dark": "#d0d5e3", "bg_highlight": "#c4c8da", "fg": "#3760bf",
    "fg_dark": "#6172b0", "fg_gutter": "#a8aecb", "comment": "#848cb5", "blue": "#2e7de9",
    "cyan": "#007197", "blue1": "#188092", "magenta": "#9854f1", "purple": "#7847bd",
    "orange": "#b15c00", "yellow": "#8c6c3e", "green": "#587539", "teal": "#118c74",
    "red": "#f52a65", "red1": "#c64343"
  }
})json";

}  // namespace

const char* builtin_palette_json(BuiltinPalette palette) {
    switch (palette) {
        case BuiltinPalette::Catppuccin: return CATPPUCCIN_JSON;
        case BuiltinPalette::Edge: return EDGE_JSON;
        case BuiltinPalette::Everforest: return EVERFOREST_JSON;
        case BuiltinPalette::Gruvbox: return GRUVBOX_JSON;
        case BuiltinPalette::GruvboxMaterial: return GRUVBOX_MATERIAL_JSON;
        case BuiltinPalette::Nord: return NORD_JSON;
        case BuiltinPalette::OneDark: return ONEDARK_JSON;
        case BuiltinPalette::RosePine: return ROSE_PINE_JSON;
        case BuiltinPalette::TokyoNight: return TOKYO_NIGHT_JSON;
    }
    return "{}";
}

}
