#include "palette/style_selection.hpp"
#include <sstream>

namespace dipc {

namespace {

Result wrap_style_error(const std::string& style, const Result& inner) {
    Result wrapped = inner;
    wrapped.message = "Failed to parse palette style `" + style + "`: " + describe(inner);
    if (wrapped.subject.empty()) {
        wrapped.subject = style;
    }
    return wrapped;
}

Result named_palette(const std::string& style, const Document& value, Palette& out) {
    Result r = palette_from_json(value, out);
    if (r.failure()) {
        return wrap_style_error(style, r);
    }
    out.name = style;
    return Result::ok();
}

}  // namespace

Result parse_style_selection(const std::string& text, StyleSelection& out) {
    if (text == "all" || text == "ALL") {
        out = StyleSelection::all();
        return Result::ok();
    }
    if (text == "none" || text == "NONE" || text == "no" || text == "NO") {
        out = StyleSelection::none();
        return Result::ok();
    }
    if (text.empty()) {
        return Result::fail(ErrorCode::INVALID_STYLE_SELECTION, "No variations selected", "", text);
    }

    std::vector<std::string> names;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        std::string part = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (part.empty()) {
            return Result::fail(ErrorCode::INVALID_STYLE_SELECTION,
                                "One of the variations seems to be an empty string. "
                                "Do you have a double comma in your variations list?",
                                "", text);
        }
        names.push_back(part);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    out = StyleSelection::some(std::move(names));
    return Result::ok();
}

std::string style_selection_to_string(const StyleSelection& selection) {
    switch (selection.kind) {
        case StyleSelection::Kind::All: return "all";
        case StyleSelection::Kind::None: return "none";
        case StyleSelection::Kind::Some: break;
    }
    std::ostringstream ss;
    for (size_t i = 0; i < selection.names.size(); ++i) {
        if (i > 0) ss << ',';
        ss << selection.names[i];
    }
    return ss.str();
}

Result resolve_palettes(const Document& document, const StyleSelection& selection,
                        std::vector<Palette>& out) {
    out.clear();
    if (!document.is_object()) {
        return Result::fail(ErrorCode::INVALID_DOCUMENT,
                            "Palette source is not a JSON object", "", document.dump());
    }

    switch (selection.kind) {
        case StyleSelection::Kind::None: {
            Palette flat;
            Result r = palette_from_json(document, flat);
            if (r.failure()) {
                return r;
            }
            out.push_back(std::move(flat));
            return Result::ok();
        }

        case StyleSelection::Kind::All: {
            out.reserve(document.size());
            for (const auto& [style, value] : document.items()) {
                if (!value.is_object()) {
                    return Result::fail(ErrorCode::STYLE_NOT_OBJECT,
                                        "Failed to parse palette style `" + style +
                                        "`: It's value is not a JSON object",
                                        style, value.dump());
                }
                Palette palette;
                Result r = named_palette(style, value, palette);
                if (r.failure()) {
                    out.clear();
                    return r;
                }
                out.push_back(std::move(palette));
            }
            return Result::ok();
        }

        case StyleSelection::Kind::Some: {
            // Entries are consumed as they are resolved, so naming a style
            // twice fails on the second request.
            Document remaining = document;
            out.reserve(selection.names.size());
            for (const auto& style : selection.names) {
                auto it = remaining.find(style);
                if (it == remaining.end() || !it->is_object()) {
                    out.clear();
                    return Result::fail(ErrorCode::STYLE_NOT_FOUND,
                                        "Failed to parse palette style `" + style +
                                        "`: It does not exist in the theme JSON source",
                                        style);
                }
                Document value = std::move(*it);
                remaining.erase(it);

                Palette palette;
                Result r = named_palette(style, value, palette);
                if (r.failure()) {
                    out.clear();
                    return r;
                }
                out.push_back(std::move(palette));
            }
            return Result::ok();
        }
    }

    return Result::ok();
}

}
