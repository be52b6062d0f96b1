#include "core/color_space.hpp"
#include <cmath>
#include <algorithm>

namespace dipc {

double ColorSpace::srgb_decode_lut_[256];
bool ColorSpace::initialized_ = false;

void ColorSpace::init() {
    if (initialized_) return;

    for (int i = 0; i < 256; ++i) {
        srgb_decode_lut_[i] = srgb_decode(static_cast<uint8_t>(i));
    }

    initialized_ = true;
}

double ColorSpace::srgb_decode(uint8_t c) {
    double cv = c / 255.0;
    if (cv <= 0.04045) {
        return cv / 12.92;
    }
    return std::pow((cv + 0.055) / 1.055, 2.4);
}

uint8_t ColorSpace::srgb_encode(double c) {
    c = std::clamp(c, 0.0, 1.0);
    double result;
    if (c <= 0.0031308) {
        result = 12.92 * c;
    } else {
        result = 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
    }
    return static_cast<uint8_t>(std::clamp(std::round(result * 255.0), 0.0, 255.0));
}

double ColorSpace::srgb_to_linear(uint8_t srgb) {
    if (initialized_) {
        return srgb_decode_lut_[srgb];
    }
    return srgb_decode(srgb);
}

// No encode table here: a quantized table cannot reproduce every 8-bit value
// on the way back, and palette colors must survive Lab -> sRGB exactly.
uint8_t ColorSpace::linear_to_srgb(double linear) {
    return srgb_encode(linear);
}

LinearColor ColorSpace::srgb_to_linear(uint8_t r, uint8_t g, uint8_t b) {
    return {srgb_to_linear(r), srgb_to_linear(g), srgb_to_linear(b)};
}

void ColorSpace::linear_to_srgb(const LinearColor& linear, uint8_t& r, uint8_t& g, uint8_t& b) {
    r = linear_to_srgb(linear.r);
    g = linear_to_srgb(linear.g);
    b = linear_to_srgb(linear.b);
}

double ColorSpace::lab_f(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0 * delta * delta) + 4.0 / 29.0;
}

double ColorSpace::lab_f_inv(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta) {
        return t * t * t;
    }
    return 3.0 * delta * delta * (t - 4.0 / 29.0);
}

Lab ColorSpace::to_lab(const LinearColor& linear) {
    double r = linear.r;
    double g = linear.g;
    double b = linear.b;

    double x = 0.4124564 * r + 0.3575761 * g + 0.1804375 * b;
    double y = 0.2126729 * r + 0.7151522 * g + 0.0721750 * b;
    double z = 0.0193339 * r + 0.1191920 * g + 0.9503041 * b;

    double fx = lab_f(x / WHITE_X);
    double fy = lab_f(y / WHITE_Y);
    double fz = lab_f(z / WHITE_Z);

    return {static_cast<float>(116.0 * fy - 16.0),
            static_cast<float>(500.0 * (fx - fy)),
            static_cast<float>(200.0 * (fy - fz))};
}

Lab ColorSpace::srgb_to_lab(uint8_t r, uint8_t g, uint8_t b) {
    LinearColor linear = srgb_to_linear(r, g, b);
    return to_lab(linear);
}

LinearColor ColorSpace::from_lab(const Lab& lab) {
    double fy = (static_cast<double>(lab.l) + 16.0) / 116.0;
    double fx = fy + static_cast<double>(lab.a) / 500.0;
    double fz = fy - static_cast<double>(lab.b) / 200.0;

    double x = lab_f_inv(fx) * WHITE_X;
    double y = lab_f_inv(fy) * WHITE_Y;
    double z = lab_f_inv(fz) * WHITE_Z;

    double r =  3.2404542 * x - 1.5371385 * y - 0.4985314 * z;
    double g = -0.9692660 * x + 1.8760108 * y + 0.0415560 * z;
    double b =  0.0556434 * x - 0.2040259 * y + 1.0572252 * z;

    return {std::clamp(r, 0.0, 1.0),
            std::clamp(g, 0.0, 1.0),
            std::clamp(b, 0.0, 1.0)};
}

void ColorSpace::lab_to_srgb(const Lab& lab, uint8_t& r, uint8_t& g, uint8_t& b) {
    LinearColor linear = from_lab(lab);
    linear_to_srgb(linear, r, g, b);
}

}
