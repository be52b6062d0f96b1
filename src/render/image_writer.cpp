#include "image_writer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <unistd.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace dipc {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

}  // namespace

ImageFormat image_format_from_path(const std::string& path) {
    const std::string ext = lower_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".bmp") return ImageFormat::BMP;
    if (ext == ".tga") return ImageFormat::TGA;
    return ImageFormat::PNG;
}

std::string temporary_path_for(const std::string& path) {
    std::filesystem::path p(path);
    std::string name = "." + p.filename().string() + ".tmp" + std::to_string(::getpid());
    return (p.parent_path() / name).string();
}

Result commit_temporary(const std::string& temporary, const std::string& path) {
    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        discard_temporary(temporary);
        return Result::fail(ErrorCode::ENCODE_ERROR,
                            "Cannot move encoded image to " + path + ": " + ec.message(), path);
    }
    return Result::ok();
}

void discard_temporary(const std::string& temporary) {
    std::error_code ec;
    std::filesystem::remove(temporary, ec);
}

Result write_image(const std::string& path, const FrameBuffer& image, int jpeg_quality) {
    if (image.empty()) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Refusing to write an empty image to " + path, path);
    }

    const std::string temporary = temporary_path_for(path);
    const int w = image.width();
    const int h = image.height();
    const int stride = w * FrameBuffer::CHANNELS;

    int ok = 0;
    switch (image_format_from_path(path)) {
        case ImageFormat::PNG:
            ok = stbi_write_png(temporary.c_str(), w, h, FrameBuffer::CHANNELS, image.data(), stride);
            break;
        case ImageFormat::JPEG:
            // alpha is dropped by the JPEG writer
            ok = stbi_write_jpg(temporary.c_str(), w, h, FrameBuffer::CHANNELS, image.data(),
                                std::clamp(jpeg_quality, 1, 100));
            break;
        case ImageFormat::BMP:
            ok = stbi_write_bmp(temporary.c_str(), w, h, FrameBuffer::CHANNELS, image.data());
            break;
        case ImageFormat::TGA:
            ok = stbi_write_tga(temporary.c_str(), w, h, FrameBuffer::CHANNELS, image.data());
            break;
    }

    if (!ok) {
        discard_temporary(temporary);
        return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to encode " + path, path);
    }
    return commit_temporary(temporary, path);
}

}
