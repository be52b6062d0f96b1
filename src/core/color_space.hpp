#pragma once

#include <cstdint>
#include <cmath>

namespace dipc {

struct LinearColor {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    LinearColor() = default;
    LinearColor(double r, double g, double b) : r(r), g(g), b(b) {}
};

struct Lab {
    float l = 0.0f;
    float a = 0.0f;
    float b = 0.0f;

    Lab() = default;
    Lab(float l, float a, float b) : l(l), a(a), b(b) {}

    bool operator==(const Lab& o) const { return l == o.l && a == o.a && b == o.b; }
    bool operator!=(const Lab& o) const { return !(*this == o); }
};

// sRGB <-> CIELAB with a D65 reference white.
class ColorSpace {
public:
    static void init();

    static double srgb_to_linear(uint8_t srgb);
    static uint8_t linear_to_srgb(double linear);

    static LinearColor srgb_to_linear(uint8_t r, uint8_t g, uint8_t b);
    static void linear_to_srgb(const LinearColor& linear, uint8_t& r, uint8_t& g, uint8_t& b);

    static Lab to_lab(const LinearColor& linear);
    static Lab srgb_to_lab(uint8_t r, uint8_t g, uint8_t b);

    static LinearColor from_lab(const Lab& lab);
    static void lab_to_srgb(const Lab& lab, uint8_t& r, uint8_t& g, uint8_t& b);

    static constexpr double WHITE_X = 0.95047;
    static constexpr double WHITE_Y = 1.0;
    static constexpr double WHITE_Z = 1.08883;

private:
    static double srgb_decode_lut_[256];
    static bool initialized_;

    static double srgb_decode(uint8_t c);
    static uint8_t srgb_encode(double c);

    static double lab_f(double t);
    static double lab_f_inv(double t);
};

}
