#include "frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace dipc {

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return std::string(buf);
}

struct FFmpegDecoder {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    const AVCodec* codec = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    AVFrame* rgba_frame = nullptr;
    SwsContext* sws_ctx = nullptr;
    int stream_idx = -1;
    bool eof = false;
    Size sws_size;
    AVPixelFormat sws_format = AV_PIX_FMT_NONE;
    std::vector<uint8_t> rgba_buffer;

    ~FFmpegDecoder() { close(); }

    void close() {
        if (sws_ctx) sws_freeContext(sws_ctx);
        if (rgba_frame) av_frame_free(&rgba_frame);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) avformat_close_input(&format_ctx);

        sws_ctx = nullptr;
        rgba_frame = nullptr;
        frame = nullptr;
        packet = nullptr;
        codec_ctx = nullptr;
        format_ctx = nullptr;
        stream_idx = -1;
        eof = false;
        sws_size = {};
        sws_format = AV_PIX_FMT_NONE;
        rgba_buffer.clear();
    }
};

bool ensure_rgba_pipeline(FFmpegDecoder& dec, int width, int height, AVPixelFormat src_fmt) {
    if (width <= 0 || height <= 0 || !dec.rgba_frame) {
        return false;
    }
    if (dec.sws_ctx && dec.sws_size == Size{width, height} && dec.sws_format == src_fmt) {
        return true;
    }

    if (dec.sws_ctx) {
        sws_freeContext(dec.sws_ctx);
        dec.sws_ctx = nullptr;
    }

    int rgba_size = av_image_get_buffer_size(AV_PIX_FMT_RGBA, width, height, 1);
    if (rgba_size <= 0) {
        return false;
    }

    dec.rgba_buffer.resize(static_cast<size_t>(rgba_size));
    if (av_image_fill_arrays(dec.rgba_frame->data, dec.rgba_frame->linesize, dec.rgba_buffer.data(),
                             AV_PIX_FMT_RGBA, width, height, 1) < 0) {
        dec.rgba_buffer.clear();
        return false;
    }

    // Same size on both ends, so point sampling is an exact pixel format
    // conversion with no filtering of neighbouring pixels.
    dec.sws_ctx = sws_getContext(width, height, src_fmt,
                                 width, height, AV_PIX_FMT_RGBA,
                                 SWS_POINT, nullptr, nullptr, nullptr);
    if (!dec.sws_ctx) {
        dec.rgba_buffer.clear();
        return false;
    }

    dec.sws_size = {width, height};
    dec.sws_format = src_fmt;
    return true;
}

Result init_decoder(const std::string& path, FFmpegDecoder& dec, Size& size, bool still_image) {
    dec.close();

    const AVInputFormat* input_fmt = nullptr;
    if (still_image) {
        input_fmt = av_find_input_format("image2");
    }

    AVDictionary* open_opts = nullptr;
    av_dict_set(&open_opts, "probesize", "5000000", 0);
    av_dict_set(&open_opts, "analyzeduration", "5000000", 0);
    int open_ret = avformat_open_input(&dec.format_ctx, path.c_str(), input_fmt, &open_opts);
    av_dict_free(&open_opts);
    if (open_ret < 0) {
        return Result::fail(ErrorCode::DECODE_ERROR,
                            "Cannot open " + path + ": " + av_error_string(open_ret), path);
    }
    if (avformat_find_stream_info(dec.format_ctx, nullptr) < 0) {
        dec.close();
        return Result::fail(ErrorCode::DECODE_ERROR, "Cannot read stream info of " + path, path);
    }

    dec.stream_idx = av_find_best_stream(dec.format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (dec.stream_idx < 0) {
        dec.close();
        return Result::fail(ErrorCode::DECODE_ERROR, "No image stream in " + path, path);
    }

    AVStream* stream = dec.format_ctx->streams[dec.stream_idx];
    dec.codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!dec.codec) {
        dec.close();
        return Result::fail(ErrorCode::DECODE_ERROR, "No decoder available for " + path, path);
    }

    dec.codec_ctx = avcodec_alloc_context3(dec.codec);
    if (!dec.codec_ctx ||
        avcodec_parameters_to_context(dec.codec_ctx, stream->codecpar) < 0 ||
        avcodec_open2(dec.codec_ctx, dec.codec, nullptr) < 0) {
        dec.close();
        return Result::fail(ErrorCode::DECODE_ERROR, "Cannot open decoder for " + path, path);
    }

    size.width = std::max(dec.codec_ctx->width, stream->codecpar->width);
    size.height = std::max(dec.codec_ctx->height, stream->codecpar->height);

    dec.packet = av_packet_alloc();
    dec.frame = av_frame_alloc();
    dec.rgba_frame = av_frame_alloc();
    if (!dec.packet || !dec.frame || !dec.rgba_frame) {
        dec.close();
        return Result::fail(ErrorCode::DECODE_ERROR, "Out of memory while opening " + path, path);
    }

    dec.eof = false;
    return Result::ok();
}

void copy_rgba_frame_to_buffer(const AVFrame* rgba, int width, int height, FrameBuffer& out) {
    if (out.width() != width || out.height() != height) {
        out = FrameBuffer(width, height);
    }

    const size_t row_bytes = static_cast<size_t>(width) * FrameBuffer::CHANNELS;
    for (int y = 0; y < height; ++y) {
        const uint8_t* row = rgba->data[0] + static_cast<size_t>(y) * rgba->linesize[0];
        std::memcpy(out.data() + static_cast<size_t>(y) * row_bytes, row, row_bytes);
    }
}

// Returns 1 for a frame, 0 at end of stream and a negative AVERROR on failure.
int decode_next_frame(FFmpegDecoder& dec, Size& size, FrameBuffer& out) {
    while (true) {
        int recv = avcodec_receive_frame(dec.codec_ctx, dec.frame);
        if (recv == 0) {
            int frame_w = dec.frame->width;
            int frame_h = dec.frame->height;
            AVPixelFormat src_fmt = static_cast<AVPixelFormat>(dec.frame->format);
            if (frame_w <= 0 || frame_h <= 0 ||
                !ensure_rgba_pipeline(dec, frame_w, frame_h, src_fmt)) {
                av_frame_unref(dec.frame);
                return AVERROR_INVALIDDATA;
            }
            size.width = frame_w;
            size.height = frame_h;
            sws_scale(dec.sws_ctx,
                      dec.frame->data, dec.frame->linesize,
                      0, frame_h,
                      dec.rgba_frame->data, dec.rgba_frame->linesize);
            copy_rgba_frame_to_buffer(dec.rgba_frame, frame_w, frame_h, out);
            return 1;
        }

        if (recv == AVERROR_EOF) {
            return 0;
        }
        if (recv != AVERROR(EAGAIN)) {
            return recv;
        }
        if (dec.eof) {
            return 0;
        }

        bool fed_decoder = false;
        while (!fed_decoder) {
            int read_ret = av_read_frame(dec.format_ctx, dec.packet);
            if (read_ret < 0) {
                dec.eof = true;
                int flush_ret = avcodec_send_packet(dec.codec_ctx, nullptr);
                if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
                    return flush_ret;
                }
                fed_decoder = true;
                continue;
            }

            if (dec.packet->stream_index == dec.stream_idx) {
                int send_ret = avcodec_send_packet(dec.codec_ctx, dec.packet);
                av_packet_unref(dec.packet);
                if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
                    return send_ret;
                }
                fed_decoder = true;
            } else {
                av_packet_unref(dec.packet);
            }
        }
    }
}

Result decode_first_frame(const std::string& path, FrameBuffer& out) {
    FFmpegDecoder dec;
    Size size;
    Result r = init_decoder(path, dec, size, true);
    if (r.failure()) {
        return r;
    }
    int ret = decode_next_frame(dec, size, out);
    if (ret <= 0) {
        return Result::fail(ErrorCode::DECODE_ERROR,
                            "Failed to decode " + path +
                            (ret < 0 ? ": " + av_error_string(ret) : std::string(": no frames")),
                            path);
    }
    return Result::ok();
}

#ifdef DIPC_USE_OPENCV
bool decode_image_file_direct(const std::string& path, FrameBuffer& out) {
    cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (mat.empty()) {
        return false;
    }
    if (mat.depth() == CV_16U) {
        mat.convertTo(mat, CV_8U, 1.0 / 257.0);
    } else if (mat.depth() != CV_8U) {
        return false;
    }

    cv::Mat rgba;
    if (mat.channels() == 1) {
        cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA);
    } else if (mat.channels() == 3) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA);
    } else {
        return false;
    }

    out = FrameBuffer(rgba.cols, rgba.rows);
    const size_t row_bytes = static_cast<size_t>(rgba.cols) * FrameBuffer::CHANNELS;
    for (int y = 0; y < rgba.rows; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * row_bytes, rgba.ptr<uint8_t>(y), row_bytes);
    }
    return true;
}
#else
bool decode_image_file_direct(const std::string& path, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, FrameBuffer::CHANNELS);  // Force RGBA
    if (!data) {
        return false;
    }

    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }

    out = FrameBuffer(w, h, data);
    stbi_image_free(data);
    return true;
}
#endif

}  // namespace

bool is_animated_input(const std::string& path) {
    return to_lower_copy(path).ends_with(".gif");
}

ImageSource::ImageSource() = default;
ImageSource::~ImageSource() = default;

Result ImageSource::open(const std::string& path) {
    image_ = FrameBuffer();
    loaded_ = false;
    sent_ = false;
    last_error_.clear();

    if (!decode_image_file_direct(path, image_)) {
        Result r = decode_first_frame(path, image_);
        if (r.failure()) {
            last_error_ = r.message;
            return r;
        }
    }
    loaded_ = true;
    return Result::ok();
}

bool ImageSource::read(FrameBuffer& out, FrameTiming& timing) {
    if (sent_ || !loaded_) return false;
    out = image_;
    timing = FrameTiming();
    sent_ = true;
    return true;
}

Size ImageSource::frame_size() const { return image_.size(); }
bool ImageSource::is_open() const { return loaded_; }

struct AnimatedSource::Impl {
    FFmpegDecoder decoder;
    std::string path;
    bool opened = false;
};

AnimatedSource::AnimatedSource() : impl_(std::make_unique<Impl>()) {}

AnimatedSource::~AnimatedSource() {
    impl_->decoder.close();
}

Result AnimatedSource::open(const std::string& path) {
    impl_->opened = false;
    impl_->path = path;
    next_pts_ = 0;
    last_error_.clear();

    Result r = init_decoder(path, impl_->decoder, size_, false);
    if (r.failure()) {
        last_error_ = r.message;
        return r;
    }
    impl_->opened = true;
    return Result::ok();
}

bool AnimatedSource::read(FrameBuffer& out, FrameTiming& timing) {
    if (!impl_->opened) return false;

    FFmpegDecoder& dec = impl_->decoder;
    int ret = decode_next_frame(dec, size_, out);
    if (ret < 0) {
        last_error_ = "Failed to decode a frame of " + impl_->path + ": " + av_error_string(ret);
        return false;
    }
    if (ret == 0) {
        return false;
    }

    const AVStream* stream = dec.format_ctx->streams[dec.stream_idx];
    timing.time_base_num = stream->time_base.num;
    timing.time_base_den = stream->time_base.den;

    int64_t pts = dec.frame->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE) {
        pts = next_pts_;
    }
    timing.pts = pts;
    timing.duration = dec.frame->duration > 0 ? dec.frame->duration : 0;
    next_pts_ = pts + std::max<int64_t>(timing.duration, 1);

    av_frame_unref(dec.frame);
    return true;
}

Size AnimatedSource::frame_size() const { return size_; }
bool AnimatedSource::is_open() const { return impl_->opened; }

Result load_image(const std::string& path, FrameBuffer& out) {
    ImageSource source;
    Result r = source.open(path);
    if (r.failure()) {
        return r;
    }
    FrameTiming timing;
    if (!source.read(out, timing)) {
        return Result::fail(ErrorCode::DECODE_ERROR, "Failed to decode " + path, path);
    }
    return Result::ok();
}

Result count_frames(const std::string& path, size_t& count) {
    count = 0;
    AnimatedSource source;
    Result r = source.open(path);
    if (r.failure()) {
        return r;
    }

    FrameBuffer frame;
    FrameTiming timing;
    while (source.read(frame, timing)) {
        ++count;
    }
    if (!source.last_error().empty()) {
        return Result::fail(ErrorCode::DECODE_ERROR, source.last_error(), path);
    }
    return Result::ok();
}

}
