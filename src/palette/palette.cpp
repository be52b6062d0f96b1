#include "palette/palette.hpp"
#include <algorithm>
#include <cstdio>

namespace dipc {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

Result parse_hex(const std::string& hex, const std::string& name, Rgb& out) {
    if (hex.empty() || hex[0] != '#') {
        return Result::fail(ErrorCode::INVALID_HEX_COLOR,
                            "Encountered a color string not in the `#HEX` format: `" + hex + "`",
                            name, hex);
    }

    const std::string digits = hex.substr(1);
    if (digits.size() != 3 && digits.size() != 6) {
        return Result::fail(ErrorCode::INVALID_HEX_COLOR,
                            "Encountered a HEX color string of an invalid length: `" + hex + "`",
                            name, hex);
    }

    const size_t channel_length = digits.size() / 3;
    uint8_t channels[3] = {0, 0, 0};
    for (size_t channel = 0; channel < 3; ++channel) {
        int value = 0;
        for (size_t i = 0; i < channel_length; ++i) {
            int nyb = hex_digit(digits[channel * channel_length + i]);
            if (nyb < 0) {
                return Result::fail(ErrorCode::INVALID_HEX_COLOR,
                                    "Failed to parse HEX color string `" + hex +
                                    "`. Only hexadecimal digits are allowed.",
                                    name, hex);
            }
            value = value * 16 + nyb;
        }
        // #abc is shorthand for #aabbcc
        if (channel_length == 1) {
            value *= 17;
        }
        channels[channel] = static_cast<uint8_t>(value);
    }

    out = Rgb(channels[0], channels[1], channels[2]);
    return Result::ok();
}

bool channel_value(const Document& v, uint8_t& out) {
    uint64_t n = 0;
    if (v.is_number_unsigned()) {
        n = v.get<uint64_t>();
    } else if (v.is_number_integer()) {
        int64_t s = v.get<int64_t>();
        if (s < 0) {
            return false;
        }
        n = static_cast<uint64_t>(s);
    } else {
        return false;
    }
    if (n > 255) {
        return false;
    }
    out = static_cast<uint8_t>(n);
    return true;
}

Result parse_array(const Document& arr, const std::string& name, Rgb& out) {
    const std::string literal = arr.dump();
    if (arr.size() != 3) {
        return Result::fail(ErrorCode::INVALID_COLOR_ARRAY,
                            "Encountered a color array with " + std::to_string(arr.size()) +
                            " elements instead of 3: " + literal,
                            name, literal);
    }

    uint8_t channels[3] = {0, 0, 0};
    for (size_t i = 0; i < 3; ++i) {
        const Document& element = arr[i];
        if (!element.is_number()) {
            return Result::fail(ErrorCode::INVALID_COLOR_ARRAY,
                                "Encountered a non-number in a color array: " + literal,
                                name, literal);
        }
        if (!channel_value(element, channels[i])) {
            return Result::fail(ErrorCode::CHANNEL_OVERFLOW,
                                "Encountered a number not representable by an 8-bit-integer in a color array: " +
                                literal + ", element " + std::to_string(i),
                                name, literal);
        }
    }

    out = Rgb(channels[0], channels[1], channels[2]);
    return Result::ok();
}

Result parse_object(const Document& obj, const std::string& name, Rgb& out) {
    static const char* const keys[3] = {"r", "g", "b"};
    const std::string literal = obj.dump();

    uint8_t channels[3] = {0, 0, 0};
    for (size_t i = 0; i < 3; ++i) {
        auto it = obj.find(keys[i]);
        if (it == obj.end()) {
            return Result::fail(ErrorCode::INVALID_COLOR_OBJECT,
                                std::string("Key `") + keys[i] + "` not found in JSON object " + literal +
                                ". The format is `{\"r\": 255, \"g\": 128, \"b\": 0}`",
                                name, literal);
        }
        if (!it->is_number()) {
            return Result::fail(ErrorCode::INVALID_COLOR_OBJECT,
                                std::string("Key `") + keys[i] + "` has a non-number value in JSON object " +
                                literal + ". The format is `{\"r\": 255, \"g\": 128, \"b\": 0}`",
                                name, literal);
        }
        if (!channel_value(*it, channels[i])) {
            return Result::fail(ErrorCode::CHANNEL_OVERFLOW,
                                std::string("Encountered a number not representable by an 8-bit-integer in a color object: at key ") +
                                keys[i] + ": " + it->dump(),
                                name, literal);
        }
    }

    out = Rgb(channels[0], channels[1], channels[2]);
    return Result::ok();
}

bool has_channel_key(const Document& obj) {
    return obj.contains("r") || obj.contains("g") || obj.contains("b");
}

}  // namespace

Result parse_color(const Document& value, const std::string& name, Rgb& out) {
    out = Rgb();

    if (value.is_string()) {
        return parse_hex(value.get<std::string>(), name, out);
    }
    if (value.is_array()) {
        return parse_array(value, name, out);
    }
    // An object without any channel key is not a color object at all; it gets
    // the same treatment as booleans and nulls.
    if (value.is_object() && has_channel_key(value)) {
        return parse_object(value, name, out);
    }
    return Result::ok();
}

size_t count_non_color_objects(const Document& object) {
    if (!object.is_object()) {
        return 0;
    }
    size_t n = 0;
    for (const auto& [name, value] : object.items()) {
        if (value.is_object() && !has_channel_key(value)) {
            ++n;
        }
    }
    return n;
}

Result palette_from_json(const Document& object, Palette& out) {
    out = Palette();
    if (!object.is_object()) {
        return Result::fail(ErrorCode::INVALID_DOCUMENT,
                            "Palette source is not a JSON object", "", object.dump());
    }

    out.colors.reserve(object.size());
    for (const auto& [name, value] : object.items()) {
        Rgb color;
        Result r = parse_color(value, name, color);
        if (r.failure()) {
            return r;
        }
        out.colors.push_back({name, color});
    }
    return Result::ok();
}

void dedup_palette(Palette& palette) {
    auto& colors = palette.colors;
    std::stable_sort(colors.begin(), colors.end(),
                     [](const PaletteEntry& a, const PaletteEntry& b) { return a.color < b.color; });
    colors.erase(std::unique(colors.begin(), colors.end(),
                             [](const PaletteEntry& a, const PaletteEntry& b) { return a.color == b.color; }),
                 colors.end());
}

void dedup_palettes(std::vector<Palette>& palettes) {
    for (auto& palette : palettes) {
        dedup_palette(palette);
    }
}

size_t total_colors(const std::vector<Palette>& palettes) {
    size_t n = 0;
    for (const auto& p : palettes) {
        n += p.size();
    }
    return n;
}

std::string to_hex(const Rgb& color) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return std::string(buf);
}

}
