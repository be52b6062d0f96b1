#pragma once

#include "core/types.hpp"
#include <string>

namespace dipc {

enum class ImageFormat {
    PNG,
    JPEG,
    BMP,
    TGA
};

// Picked from the destination extension; unknown extensions write PNG.
ImageFormat image_format_from_path(const std::string& path);

// Encodes into a sibling temporary file and renames it over the destination,
// so a failed write never leaves a partial image behind.
Result write_image(const std::string& path, const FrameBuffer& image, int jpeg_quality = 95);

// Helpers shared with the GIF encoder.
std::string temporary_path_for(const std::string& path);
Result commit_temporary(const std::string& temporary, const std::string& path);
void discard_temporary(const std::string& temporary);

}
