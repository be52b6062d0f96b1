#include "palette/palette_source.hpp"
#include "palette/builtin_palettes.hpp"

#include <filesystem>
#include <fstream>

namespace dipc {

namespace {

constexpr const char* INLINE_PREFIX = "JSON: ";

Result parse_document_text(const std::string& text, const std::string& origin, Document& out) {
    try {
        out = Document::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result::fail(ErrorCode::INVALID_DOCUMENT,
                            "Error while parsing JSON content of " + origin + ": " + e.what(),
                            origin);
    }
    if (!out.is_object()) {
        return Result::fail(ErrorCode::INVALID_DOCUMENT,
                            "The contents of " + origin + " are valid JSON but do not appear to be a JSON object",
                            origin);
    }
    return Result::ok();
}

}  // namespace

const std::vector<BuiltinPalette>& all_builtin_palettes() {
    static const std::vector<BuiltinPalette> palettes = {
        BuiltinPalette::Catppuccin,
        BuiltinPalette::Edge,
        BuiltinPalette::Everforest,
        BuiltinPalette::Gruvbox,
        BuiltinPalette::GruvboxMaterial,
        BuiltinPalette::Nord,
        BuiltinPalette::OneDark,
        BuiltinPalette::RosePine,
        BuiltinPalette::TokyoNight
    };
    return palettes;
}

const char* builtin_palette_name(BuiltinPalette palette) {
    switch (palette) {
        case BuiltinPalette::Catppuccin: return "catppuccin";
        case BuiltinPalette::Edge: return "edge";
        case BuiltinPalette::Everforest: return "everforest";
        case BuiltinPalette::Gruvbox: return "gruvbox";
        case BuiltinPalette::GruvboxMaterial: return "gruvbox-material";
        case BuiltinPalette::Nord: return "nord";
        case BuiltinPalette::OneDark: return "onedark";
        case BuiltinPalette::RosePine: return "rose-pine";
        case BuiltinPalette::TokyoNight: return "tokyo-night";
    }
    return "custom";
}

std::optional<BuiltinPalette> parse_builtin_palette(const std::string& name) {
    if (name == "catppuccin" || name == "catpucin" || name == "catppucin" || name == "catpuccin") {
        return BuiltinPalette::Catppuccin;
    }
    if (name == "edge") return BuiltinPalette::Edge;
    if (name == "everforest") return BuiltinPalette::Everforest;
    if (name == "gruvbox") return BuiltinPalette::Gruvbox;
    if (name == "gruvbox-material" || name == "gruvbox_material" || name == "gruvboxmaterial") {
        return BuiltinPalette::GruvboxMaterial;
    }
    if (name == "nord") return BuiltinPalette::Nord;
    if (name == "onedark" || name == "one-dark" || name == "one_dark") return BuiltinPalette::OneDark;
    if (name == "rose-pine" || name == "rosepine" || name == "rose_pine") return BuiltinPalette::RosePine;
    if (name == "tokyo-night" || name == "tokyonight" || name == "tokyo_night") return BuiltinPalette::TokyoNight;
    return std::nullopt;
}

Result parse_palette_source(const std::string& text, PaletteSource& out) {
    if (auto builtin = parse_builtin_palette(text)) {
        out = *builtin;
        return Result::ok();
    }

    if (text.rfind(INLINE_PREFIX, 0) == 0) {
        InlineDocument inline_doc;
        Result r = parse_document_text(text.substr(5), "inline JSON string", inline_doc.document);
        if (r.failure()) {
            return r;
        }
        out = std::move(inline_doc);
        return Result::ok();
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::path(text), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND,
                            "Theme source file `" + text + "` appears to not be a file.",
                            text);
    }
    out = FileDocument{text};
    return Result::ok();
}

Result load_palette_document(const PaletteSource& source, Document& out) {
    if (const auto* builtin = std::get_if<BuiltinPalette>(&source)) {
        return parse_document_text(builtin_palette_json(*builtin),
                                   std::string("built-in theme ") + builtin_palette_name(*builtin), out);
    }

    if (const auto* inline_doc = std::get_if<InlineDocument>(&source)) {
        out = inline_doc->document;
        return Result::ok();
    }

    const auto& file = std::get<FileDocument>(source);
    std::ifstream in(file.path, std::ios::binary);
    if (!in) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND,
                            "Cannot open theme file: " + file.path, file.path);
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_document_text(content, file.path, out);
}

std::string palette_identifier(const PaletteSource& source) {
    if (const auto* builtin = std::get_if<BuiltinPalette>(&source)) {
        return builtin_palette_name(*builtin);
    }
    return "custom";
}

}
