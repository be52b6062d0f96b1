#include "gif_encoder.hpp"
#include "render/image_writer.hpp"

#include "core/color_space.hpp"

#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <utility>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/pixfmt.h>
}

namespace dipc {

namespace {

// Pixels below this alpha are written as the transparent palette entry.
constexpr uint8_t ALPHA_THRESHOLD = 128;

constexpr uint32_t TRANSPARENT_ENTRY = 0x00000000u;
constexpr uint32_t UNUSED_ENTRY = 0xFF000000u;

uint32_t palette_entry(const uint8_t* px) {
    if (px[3] < ALPHA_THRESHOLD) {
        return TRANSPARENT_ENTRY;
    }
    return 0xFF000000u | (static_cast<uint32_t>(px[0]) << 16) |
           (static_cast<uint32_t>(px[1]) << 8) | px[2];
}

Lab entry_lab(uint32_t entry) {
    return ColorSpace::srgb_to_lab(static_cast<uint8_t>(entry >> 16),
                                   static_cast<uint8_t>(entry >> 8),
                                   static_cast<uint8_t>(entry));
}

// Fills the 256 entry color table of one frame and returns the table index of
// every color in it. Frames with more colors keep the transparent entry and
// the most frequent colors (ties broken by value); the rest are mapped to the
// nearest kept color.
std::unordered_map<uint32_t, uint8_t> index_colors(const std::unordered_map<uint32_t, size_t>& counts,
                                                   DistanceMethod method, uint32_t* palette) {
    std::vector<std::pair<uint32_t, size_t>> ranked(counts.begin(), counts.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<uint32_t> kept;
    kept.reserve(GifEncoder::MAX_COLORS);
    if (counts.count(TRANSPARENT_ENTRY) > 0) {
        kept.push_back(TRANSPARENT_ENTRY);
    }
    for (const auto& [entry, count] : ranked) {
        if (kept.size() >= GifEncoder::MAX_COLORS) break;
        if (entry != TRANSPARENT_ENTRY) kept.push_back(entry);
    }

    std::unordered_map<uint32_t, uint8_t> indices;
    for (size_t i = 0; i < GifEncoder::MAX_COLORS; ++i) {
        palette[i] = i < kept.size() ? kept[i] : UNUSED_ENTRY;
    }
    for (size_t i = 0; i < kept.size(); ++i) {
        indices.emplace(kept[i], static_cast<uint8_t>(i));
    }
    if (indices.size() == counts.size()) {
        return indices;
    }

    std::vector<Lab> labs;
    std::vector<uint8_t> lab_slots;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (kept[i] == TRANSPARENT_ENTRY) continue;
        labs.push_back(entry_lab(kept[i]));
        lab_slots.push_back(static_cast<uint8_t>(i));
    }
    for (const auto& [entry, count] : ranked) {
        if (indices.count(entry) > 0) continue;
        const size_t nearest = nearest_index(entry_lab(entry), labs.data(), labs.size(), method);
        indices.emplace(entry, lab_slots[nearest]);
    }
    return indices;
}

}  // namespace

GifEncoder::GifEncoder() = default;

GifEncoder::~GifEncoder() {
    abort();
}

Result GifEncoder::open(const std::string& filename, const Config& config) {
    abort();
    config_ = config;
    filename_ = filename;
    temporary_ = temporary_path_for(filename);

    if (config_.width <= 0 || config_.height <= 0 ||
        config_.time_base_num <= 0 || config_.time_base_den <= 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Invalid GIF geometry for " + filename, filename);
    }

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "gif", temporary_.c_str());
    if (ret < 0 || !format_ctx_) {
        format_ctx_ = nullptr;
        return Result::fail(ErrorCode::ENCODE_ERROR, "GIF muxer unavailable for " + filename, filename);
    }

    Result r = init_codec();
    if (r.failure()) {
        abort();
        return r;
    }

    ret = avio_open(&format_ctx_->pb, temporary_.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        abort();
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot create " + filename, filename);
    }

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "loop", "0", 0);
    ret = avformat_write_header(format_ctx_, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        abort();
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot write GIF header to " + filename, filename);
    }

    return Result::ok();
}

Result GifEncoder::init_codec() {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_GIF);
    if (!codec) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "GIF encoder unavailable", filename_);
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Out of memory", filename_);
    }

    codec_ctx_->width = config_.width;
    codec_ctx_->height = config_.height;
    codec_ctx_->time_base = {config_.time_base_num, config_.time_base_den};
    codec_ctx_->pix_fmt = AV_PIX_FMT_PAL8;

    if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
        codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot open GIF encoder", filename_);
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot create GIF stream", filename_);
    }
    stream_->time_base = codec_ctx_->time_base;
    if (avcodec_parameters_from_context(stream_->codecpar, codec_ctx_) < 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot configure GIF stream", filename_);
    }

    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_ || !pkt_) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Out of memory", filename_);
    }

    frame_->format = codec_ctx_->pix_fmt;
    frame_->width = codec_ctx_->width;
    frame_->height = codec_ctx_->height;
    if (av_frame_get_buffer(frame_, 0) < 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Cannot allocate GIF frame", filename_);
    }

    return Result::ok();
}

Result GifEncoder::fill_indexed_frame(const FrameBuffer& frame) {
    if (av_frame_make_writable(frame_) < 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "GIF frame is not writable", filename_);
    }

    auto* palette = reinterpret_cast<uint32_t*>(frame_->data[1]);
    const uint8_t* src = frame.data();
    const size_t pixels = frame.pixel_count();

    std::unordered_map<uint32_t, size_t> counts;
    for (size_t i = 0; i < pixels; ++i) {
        ++counts[palette_entry(src + i * FrameBuffer::CHANNELS)];
    }

    const std::unordered_map<uint32_t, uint8_t> indices = index_colors(counts, config_.method, palette);

    for (int y = 0; y < frame.height(); ++y) {
        uint8_t* row = frame_->data[0] + static_cast<size_t>(y) * frame_->linesize[0];
        for (int x = 0; x < frame.width(); ++x) {
            const uint8_t* px = src + (static_cast<size_t>(y) * frame.width() + x) * FrameBuffer::CHANNELS;
            row[x] = indices.at(palette_entry(px));
        }
    }
    return Result::ok();
}

Result GifEncoder::write_frame(const FrameBuffer& frame, const FrameTiming& timing) {
    if (!is_open() || !frame_) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "GIF encoder is not open", filename_);
    }
    if (frame.width() != config_.width || frame.height() != config_.height) {
        return Result::fail(ErrorCode::ENCODE_ERROR,
                            "Frame size changed in the middle of " + filename_, filename_);
    }

    Result r = fill_indexed_frame(frame);
    if (r.failure()) {
        return r;
    }

    // pts must increase strictly for the muxer
    int64_t pts = timing.pts;
    if (pts <= last_pts_) {
        pts = last_pts_ + 1;
    }
    last_pts_ = pts;
    frame_->pts = pts;
    frame_->duration = timing.duration;

    if (avcodec_send_frame(codec_ctx_, frame_) < 0) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to encode a frame of " + filename_, filename_);
    }
    return drain_packets();
}

Result GifEncoder::drain_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to encode a frame of " + filename_, filename_);
        }

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;

        ret = av_interleaved_write_frame(format_ctx_, pkt_);
        if (ret < 0) {
            return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to write " + filename_, filename_);
        }
    }
    return Result::ok();
}

Result GifEncoder::finish() {
    if (!is_open()) {
        return Result::fail(ErrorCode::ENCODE_ERROR, "GIF encoder is not open", filename_);
    }

    if (avcodec_send_frame(codec_ctx_, nullptr) < 0) {
        abort();
        return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to flush " + filename_, filename_);
    }
    Result r = drain_packets();
    if (r.failure()) {
        abort();
        return r;
    }
    if (av_write_trailer(format_ctx_) < 0) {
        abort();
        return Result::fail(ErrorCode::ENCODE_ERROR, "Failed to finalize " + filename_, filename_);
    }

    release();
    return commit_temporary(temporary_, filename_);
}

void GifEncoder::abort() {
    const bool had_output = format_ctx_ != nullptr;
    release();
    if (had_output && !temporary_.empty()) {
        discard_temporary(temporary_);
    }
}

void GifEncoder::release() {
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }

    if (format_ctx_) {
        if (format_ctx_->pb) {
            avio_closep(&format_ctx_->pb);
        }
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }

    if (frame_) {
        av_frame_free(&frame_);
    }

    if (pkt_) {
        av_packet_free(&pkt_);
    }

    stream_ = nullptr;
    last_pts_ = -1;
}

}
