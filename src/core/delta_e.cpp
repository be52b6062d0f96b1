#include "core/delta_e.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace dipc {

namespace {

constexpr double kPi = 3.14159265358979323846;

double deg_to_rad(double deg) { return deg * (kPi / 180.0); }
double rad_to_deg(double rad) { return rad * (180.0 / kPi); }

double pow7(double v) {
    double v2 = v * v;
    double v3 = v2 * v;
    return v3 * v3 * v;
}

// 25^7
constexpr double kPow25_7 = 6103515625.0;

double hue_degrees(double b, double a_prime) {
    if (b == 0.0 && a_prime == 0.0) {
        return 0.0;
    }
    double h = rad_to_deg(std::atan2(b, a_prime));
    if (h < 0.0) {
        h += 360.0;
    }
    return h;
}

}  // namespace

const char* distance_method_name(DistanceMethod method) {
    switch (method) {
        case DistanceMethod::DE2000: return "de2000";
        case DistanceMethod::DE1994G: return "de1994g";
        case DistanceMethod::DE1994T: return "de1994t";
        case DistanceMethod::DE1976: return "de1976";
    }
    return "de2000";
}

std::optional<DistanceMethod> parse_distance_method(const std::string& text) {
    std::string lower = text;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "de2000") return DistanceMethod::DE2000;
    if (lower == "de1994g") return DistanceMethod::DE1994G;
    if (lower == "de1994t") return DistanceMethod::DE1994T;
    if (lower == "de1976") return DistanceMethod::DE1976;
    return std::nullopt;
}

float delta_e_1976(const Lab& reference, const Lab& sample) {
    double dl = static_cast<double>(reference.l) - sample.l;
    double da = static_cast<double>(reference.a) - sample.a;
    double db = static_cast<double>(reference.b) - sample.b;
    return static_cast<float>(std::sqrt(dl * dl + da * da + db * db));
}

float delta_e_1994(const Lab& reference, const Lab& sample, bool textiles) {
    const double kl = textiles ? 2.0 : 1.0;
    const double k1 = textiles ? 0.048 : 0.045;
    const double k2 = textiles ? 0.014 : 0.015;

    double dl = static_cast<double>(reference.l) - sample.l;
    double c1 = std::hypot(static_cast<double>(reference.a), static_cast<double>(reference.b));
    double c2 = std::hypot(static_cast<double>(sample.a), static_cast<double>(sample.b));
    double dc = c1 - c2;
    double da = static_cast<double>(reference.a) - sample.a;
    double db = static_cast<double>(reference.b) - sample.b;
    double dh = std::sqrt(std::max(0.0, da * da + db * db - dc * dc));

    double sl = 1.0;
    double sc = 1.0 + k1 * c1;
    double sh = 1.0 + k2 * c1;

    double tl = dl / (kl * sl);
    double tc = dc / sc;
    double th = dh / sh;
    return static_cast<float>(std::sqrt(tl * tl + tc * tc + th * th));
}

float delta_e_2000(const Lab& reference, const Lab& sample) {
    const double l1 = reference.l, a1 = reference.a, b1 = reference.b;
    const double l2 = sample.l, a2 = sample.a, b2 = sample.b;

    double c1 = std::hypot(a1, b1);
    double c2 = std::hypot(a2, b2);
    double c_bar = (c1 + c2) / 2.0;
    double c_bar7 = pow7(c_bar);
    double g = 0.5 * (1.0 - std::sqrt(c_bar7 / (c_bar7 + kPow25_7)));

    double a1p = (1.0 + g) * a1;
    double a2p = (1.0 + g) * a2;
    double c1p = std::hypot(a1p, b1);
    double c2p = std::hypot(a2p, b2);
    double h1p = hue_degrees(b1, a1p);
    double h2p = hue_degrees(b2, a2p);

    double dlp = l2 - l1;
    double dcp = c2p - c1p;

    double dhp = 0.0;
    if (c1p * c2p != 0.0) {
        dhp = h2p - h1p;
        if (dhp > 180.0) {
            dhp -= 360.0;
        } else if (dhp < -180.0) {
            dhp += 360.0;
        }
    }
    double d_hp = 2.0 * std::sqrt(c1p * c2p) * std::sin(deg_to_rad(dhp / 2.0));

    double l_bar_p = (l1 + l2) / 2.0;
    double c_bar_p = (c1p + c2p) / 2.0;

    double h_bar_p;
    if (c1p * c2p == 0.0) {
        h_bar_p = h1p + h2p;
    } else if (std::abs(h1p - h2p) <= 180.0) {
        h_bar_p = (h1p + h2p) / 2.0;
    } else if (h1p + h2p < 360.0) {
        h_bar_p = (h1p + h2p + 360.0) / 2.0;
    } else {
        h_bar_p = (h1p + h2p - 360.0) / 2.0;
    }

    double t = 1.0
             - 0.17 * std::cos(deg_to_rad(h_bar_p - 30.0))
             + 0.24 * std::cos(deg_to_rad(2.0 * h_bar_p))
             + 0.32 * std::cos(deg_to_rad(3.0 * h_bar_p + 6.0))
             - 0.20 * std::cos(deg_to_rad(4.0 * h_bar_p - 63.0));

    double h_off = (h_bar_p - 275.0) / 25.0;
    double d_theta = 30.0 * std::exp(-h_off * h_off);
    double c_bar_p7 = pow7(c_bar_p);
    double rc = 2.0 * std::sqrt(c_bar_p7 / (c_bar_p7 + kPow25_7));
    double l_off = (l_bar_p - 50.0) * (l_bar_p - 50.0);
    double sl = 1.0 + (0.015 * l_off) / std::sqrt(20.0 + l_off);
    double sc = 1.0 + 0.045 * c_bar_p;
    double sh = 1.0 + 0.015 * c_bar_p * t;
    double rt = -std::sin(deg_to_rad(2.0 * d_theta)) * rc;

    double tl = dlp / sl;
    double tc = dcp / sc;
    double th = d_hp / sh;
    double sum = tl * tl + tc * tc + th * th + rt * tc * th;
    return static_cast<float>(std::sqrt(std::max(0.0, sum)));
}

float delta_e(const Lab& reference, const Lab& sample, DistanceMethod method) {
    switch (method) {
        case DistanceMethod::DE2000: return delta_e_2000(reference, sample);
        case DistanceMethod::DE1994G: return delta_e_1994(reference, sample, false);
        case DistanceMethod::DE1994T: return delta_e_1994(reference, sample, true);
        case DistanceMethod::DE1976: return delta_e_1976(reference, sample);
    }
    return delta_e_2000(reference, sample);
}

size_t nearest_index(const Lab& pixel, const Lab* palette, size_t count, DistanceMethod method) {
    float best_dist = std::numeric_limits<float>::infinity();
    size_t best_idx = count;

    for (size_t i = 0; i < count; ++i) {
        float dist = delta_e(pixel, palette[i], method);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }

    return best_idx;
}

Lab nearest(const Lab& pixel, const Lab* palette, size_t count, DistanceMethod method) {
    size_t idx = nearest_index(pixel, palette, count, method);
    if (idx >= count) {
        return pixel;
    }
    return palette[idx];
}

Lab nearest(const Lab& pixel, const std::vector<Lab>& palette, DistanceMethod method) {
    return nearest(pixel, palette.data(), palette.size(), method);
}

}
