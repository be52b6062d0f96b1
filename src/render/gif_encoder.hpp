#pragma once

#include "core/delta_e.hpp"
#include "core/frame_source.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
}

namespace dipc {

// Writes an infinitely looping GIF. Frames carry their own timestamps in the
// time base given to open(). Each frame is stored with a palette made of its
// own colors; past 256 colors the rarest ones are mapped to the nearest kept
// color with the configured distance method.
class GifEncoder {
public:
    struct Config {
        int width = 0;
        int height = 0;
        int time_base_num = 1;
        int time_base_den = 100;
        DistanceMethod method = DEFAULT_DISTANCE_METHOD;
    };

    GifEncoder();
    ~GifEncoder();

    GifEncoder(const GifEncoder&) = delete;
    GifEncoder& operator=(const GifEncoder&) = delete;

    Result open(const std::string& filename, const Config& config);
    Result write_frame(const FrameBuffer& frame, const FrameTiming& timing);
    // Flushes, finalizes and moves the file into place.
    Result finish();
    // Drops everything written so far.
    void abort();
    bool is_open() const { return format_ctx_ != nullptr; }

    static constexpr size_t MAX_COLORS = 256;

private:
    Result init_codec();
    Result drain_packets();
    Result fill_indexed_frame(const FrameBuffer& frame);
    void release();

    Config config_;
    std::string filename_;
    std::string temporary_;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    int64_t last_pts_ = -1;
};

}
