#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <string>

namespace dipc {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT,
    INVALID_STYLE_SELECTION,
    STYLE_NOT_OBJECT,
    STYLE_NOT_FOUND,
    INVALID_HEX_COLOR,
    INVALID_COLOR_ARRAY,
    INVALID_COLOR_OBJECT,
    CHANNEL_OVERFLOW,
    INVALID_DOCUMENT,
    FILE_NOT_FOUND,
    CARDINALITY_MISMATCH,
    DECODE_ERROR,
    ENCODE_ERROR,
    CONFIG_ERROR
};

// Failures keep the offending subject (style, color name or path) and the
// literal offending value apart from the prose so callers can match on them.
struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;
    std::string subject;
    std::string value;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, "", "", ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg, "", ""}; }
    static Result fail(ErrorCode code, const std::string& msg,
                       const std::string& subject, const std::string& value = "") {
        return {code, msg, subject, value};
    }
};

const char* error_code_name(ErrorCode code);

// Decode and encode failures of a single image. Everything else is a usage or
// validation error.
bool is_operational(ErrorCode code);

std::string describe(const Result& result);

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Tightly packed RGBA8, row-major.
class FrameBuffer {
public:
    static constexpr int CHANNELS = 4;

    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * CHANNELS, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : FrameBuffer(w, h) {
        this->fill(fill);
    }
    FrameBuffer(int w, int h, const uint8_t* rgba)
        : width_(w), height_(h), data_(rgba, rgba + static_cast<size_t>(w) * h * CHANNELS) {}

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t pixel_count() const { return static_cast<size_t>(width_) * height_; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * CHANNELS;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * CHANNELS;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (size_t i = 0; i < data_.size(); i += CHANNELS) {
            data_[i] = c.r;
            data_[i+1] = c.g;
            data_[i+2] = c.b;
            data_[i+3] = c.a;
        }
    }

    bool operator==(const FrameBuffer& o) const {
        return width_ == o.width_ && height_ == o.height_ && data_ == o.data_;
    }
    bool operator!=(const FrameBuffer& o) const { return !(*this == o); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

}
