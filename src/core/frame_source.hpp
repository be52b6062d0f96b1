#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#ifdef DIPC_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

namespace dipc {

// Presentation time of a decoded frame, in units of the stream time base.
struct FrameTiming {
    int64_t pts = 0;
    int64_t duration = 0;
    int time_base_num = 1;
    int time_base_den = 100;
};

// Forward-only frame sequence. read() returns false at the end of the
// sequence and on decode errors; last_error() is empty for a clean end.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual Result open(const std::string& path) = 0;
    virtual bool read(FrameBuffer& out, FrameTiming& timing) = 0;
    virtual Size frame_size() const = 0;
    virtual bool is_open() const = 0;

    const std::string& last_error() const { return last_error_; }

protected:
    std::string last_error_;
};

// A single still image, always delivered as RGBA.
class ImageSource : public FrameSource {
public:
    ImageSource();
    ~ImageSource() override;

    Result open(const std::string& path) override;
    bool read(FrameBuffer& out, FrameTiming& timing) override;
    Size frame_size() const override;
    bool is_open() const override;

private:
    FrameBuffer image_;
    bool loaded_ = false;
    bool sent_ = false;
};

// Frames of an animated image decoded one at a time through FFmpeg.
class AnimatedSource : public FrameSource {
public:
    AnimatedSource();
    ~AnimatedSource() override;

    Result open(const std::string& path) override;
    bool read(FrameBuffer& out, FrameTiming& timing) override;
    Size frame_size() const override;
    bool is_open() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    Size size_;
    int64_t next_pts_ = 0;
};

bool is_animated_input(const std::string& path);

// Decodes a still image into RGBA.
Result load_image(const std::string& path, FrameBuffer& out);

// Drains an independent decoder to count the frames of an animated input.
Result count_frames(const std::string& path, size_t& count);

}
