#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/color_space.hpp"
#include "../src/core/delta_e.hpp"

using namespace dipc;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static bool near(double a, double b, double eps) {
    return std::abs(a - b) < eps;
}

TEST(lab_white_and_black) {
    Lab white = ColorSpace::srgb_to_lab(255, 255, 255);
    assert(near(white.l, 100.0, 0.01));
    assert(near(white.a, 0.0, 0.01));
    assert(near(white.b, 0.0, 0.01));

    Lab black = ColorSpace::srgb_to_lab(0, 0, 0);
    assert(near(black.l, 0.0, 1e-6));
    assert(near(black.a, 0.0, 1e-6));
    assert(near(black.b, 0.0, 1e-6));
}

TEST(lab_reference_values) {
    // sRGB primaries under D65
    Lab red = ColorSpace::srgb_to_lab(255, 0, 0);
    assert(near(red.l, 53.24, 0.05));
    assert(near(red.a, 80.09, 0.05));
    assert(near(red.b, 67.20, 0.05));

    Lab blue = ColorSpace::srgb_to_lab(0, 0, 255);
    assert(near(blue.l, 32.30, 0.05));
    assert(near(blue.a, 79.19, 0.05));
    assert(near(blue.b, -107.86, 0.05));
}

TEST(lab_roundtrip_every_rgb_triple) {
    for (int r = 0; r < 256; ++r) {
        for (int g = 0; g < 256; ++g) {
            for (int b = 0; b < 256; ++b) {
                Lab lab = ColorSpace::srgb_to_lab(static_cast<uint8_t>(r), static_cast<uint8_t>(g),
                                                  static_cast<uint8_t>(b));
                uint8_t rr = 0, gg = 0, bb = 0;
                ColorSpace::lab_to_srgb(lab, rr, gg, bb);
                if (rr != r || gg != g || bb != b) {
                    throw std::runtime_error("roundtrip failed for " + std::to_string(r) + "," +
                                             std::to_string(g) + "," + std::to_string(b));
                }
            }
        }
    }
}

TEST(lab_out_of_gamut_is_clamped) {
    uint8_t r = 0, g = 0, b = 0;
    ColorSpace::lab_to_srgb(Lab(150.0f, 0.0f, 0.0f), r, g, b);
    assert(r == 255 && g == 255 && b == 255);
    ColorSpace::lab_to_srgb(Lab(-20.0f, 0.0f, 0.0f), r, g, b);
    assert(r == 0 && g == 0 && b == 0);
}

TEST(cie76_is_euclidean) {
    assert(near(delta_e_1976(Lab(50, 0, 0), Lab(50, 3, 4)), 5.0, 1e-5));
    assert(near(delta_e_1976(Lab(0, 0, 0), Lab(100, 0, 0)), 100.0, 1e-4));
    assert(delta_e_1976(Lab(42, -7, 13), Lab(42, -7, 13)) == 0.0f);
}

TEST(cie94_graphics_and_textiles) {
    // pure lightness difference: only kL differs between the profiles
    assert(near(delta_e_1994(Lab(50, 0, 0), Lab(60, 0, 0), false), 10.0, 1e-4));
    assert(near(delta_e_1994(Lab(50, 0, 0), Lab(60, 0, 0), true), 5.0, 1e-4));

    // chroma difference weighted by the reference chroma
    assert(near(delta_e_1994(Lab(50, 3, 4), Lab(50, 0, 0), false), 4.0816, 1e-3));
    assert(near(delta_e(Lab(50, 3, 4), Lab(50, 0, 0), DistanceMethod::DE1994G), 4.0816, 1e-3));
}

TEST(cie94_is_not_symmetric) {
    Lab a(50, 30, 40);
    Lab b(55, 0, 10);
    assert(delta_e_1994(a, b, false) != delta_e_1994(b, a, false));
}

TEST(ciede2000_reference_pairs) {
    struct Pair {
        Lab first;
        Lab second;
        double expected;
    };
    const std::vector<Pair> pairs = {
        {Lab(50.0f, 2.6772f, -79.7751f), Lab(50.0f, 0.0f, -82.7485f), 2.0425},
        {Lab(50.0f, 3.1571f, -77.2803f), Lab(50.0f, 0.0f, -82.7485f), 2.8615},
        {Lab(50.0f, 0.0f, 0.0f), Lab(50.0f, -1.0f, 2.0f), 2.3669},
        {Lab(50.0f, -1.0f, 2.0f), Lab(50.0f, 0.0f, 0.0f), 2.3669},
        {Lab(50.0f, 2.49f, -0.001f), Lab(50.0f, -2.49f, 0.0009f), 7.1792},
        {Lab(50.0f, 2.5f, 0.0f), Lab(73.0f, 25.0f, -18.0f), 27.1492},
        {Lab(50.0f, 2.5f, 0.0f), Lab(56.0f, -27.0f, -3.0f), 31.9030},
        {Lab(60.2574f, -34.0099f, 36.2677f), Lab(60.4626f, -34.1751f, 39.4387f), 1.2644},
        {Lab(22.7233f, 20.0904f, -46.6940f), Lab(23.0331f, 14.9730f, -42.5619f), 2.0373},
        {Lab(90.8027f, -2.0831f, 1.4410f), Lab(91.1528f, -1.6435f, 0.0447f), 1.4441},
    };

    for (const auto& p : pairs) {
        double d = delta_e_2000(p.first, p.second);
        if (!near(d, p.expected, 5e-4)) {
            throw std::runtime_error("CIEDE2000 expected " + std::to_string(p.expected) +
                                     " got " + std::to_string(d));
        }
    }
}

TEST(ciede2000_identity) {
    assert(delta_e_2000(Lab(37, 12, -40), Lab(37, 12, -40)) == 0.0f);
}

TEST(method_names_parse_case_insensitive) {
    assert(parse_distance_method("de2000") == DistanceMethod::DE2000);
    assert(parse_distance_method("DE1994G") == DistanceMethod::DE1994G);
    assert(parse_distance_method("De1994t") == DistanceMethod::DE1994T);
    assert(parse_distance_method("de1976") == DistanceMethod::DE1976);
    assert(!parse_distance_method("cie2000").has_value());
    assert(!parse_distance_method("").has_value());
    assert(std::string(distance_method_name(DEFAULT_DISTANCE_METHOD)) == "de2000");
}

TEST(nearest_palette_color_wins_outright) {
    const std::vector<uint8_t> rgb = {
        0, 0, 0,
        255, 255, 255,
        200, 30, 60,
        20, 120, 220,
    };
    std::vector<Lab> palette;
    for (size_t i = 0; i < rgb.size(); i += 3) {
        palette.push_back(ColorSpace::srgb_to_lab(rgb[i], rgb[i + 1], rgb[i + 2]));
    }

    const DistanceMethod methods[] = {
        DistanceMethod::DE2000, DistanceMethod::DE1994G, DistanceMethod::DE1994T, DistanceMethod::DE1976
    };
    for (DistanceMethod method : methods) {
        for (size_t i = 0; i < palette.size(); ++i) {
            assert(nearest_index(palette[i], palette.data(), palette.size(), method) == i);
            Lab match = nearest(palette[i], palette, method);
            uint8_t r = 0, g = 0, b = 0;
            ColorSpace::lab_to_srgb(match, r, g, b);
            assert(r == rgb[i * 3] && g == rgb[i * 3 + 1] && b == rgb[i * 3 + 2]);
        }
    }
}

TEST(nearest_first_of_equal_candidates_wins) {
    // equidistant from the pixel in every metric
    const Lab pixel(50, 0, 0);
    const std::vector<Lab> palette = {Lab(60, 0, 0), Lab(40, 0, 0)};
    assert(nearest_index(pixel, palette.data(), palette.size(), DistanceMethod::DE1976) == 0);

    const std::vector<Lab> swapped = {Lab(40, 0, 0), Lab(60, 0, 0)};
    assert(nearest_index(pixel, swapped.data(), swapped.size(), DistanceMethod::DE1976) == 0);
    assert(nearest(pixel, swapped, DistanceMethod::DE1976) == Lab(40, 0, 0));

    const std::vector<Lab> duplicates = {Lab(10, 5, 5), Lab(70, 1, 1), Lab(70, 1, 1)};
    assert(nearest_index(Lab(71, 1, 1), duplicates.data(), duplicates.size(), DistanceMethod::DE2000) == 1);
}

TEST(nearest_with_empty_palette_returns_pixel) {
    const Lab pixel(12.5f, -3.0f, 8.0f);
    std::vector<Lab> empty;
    assert(nearest_index(pixel, empty.data(), 0, DistanceMethod::DE2000) == 0);
    assert(nearest(pixel, empty, DistanceMethod::DE2000) == pixel);
}

int main() {
    std::cout << "=== dipc Color Test Suite ===\n\n";

    ColorSpace::init();

    std::cout << "--- Color Space Tests ---\n";
    RUN_TEST(lab_white_and_black);
    RUN_TEST(lab_reference_values);
    RUN_TEST(lab_roundtrip_every_rgb_triple);
    RUN_TEST(lab_out_of_gamut_is_clamped);

    std::cout << "\n--- Distance Tests ---\n";
    RUN_TEST(cie76_is_euclidean);
    RUN_TEST(cie94_graphics_and_textiles);
    RUN_TEST(cie94_is_not_symmetric);
    RUN_TEST(ciede2000_reference_pairs);
    RUN_TEST(ciede2000_identity);
    RUN_TEST(method_names_parse_case_insensitive);

    std::cout << "\n--- Nearest Match Tests ---\n";
    RUN_TEST(nearest_palette_color_wins_outright);
    RUN_TEST(nearest_first_of_equal_candidates_wins);
    RUN_TEST(nearest_with_empty_palette_returns_pixel);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
