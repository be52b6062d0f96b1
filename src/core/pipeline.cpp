#include "pipeline.hpp"
#include "core/frame_source.hpp"
#include "core/output_naming.hpp"
#include "render/gif_encoder.hpp"
#include "render/image_writer.hpp"
#include <algorithm>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace dipc {

namespace {

// Pixels handed to a worker at a time.
constexpr int PIXEL_CHUNK = 4096;

}  // namespace

Pipeline::Pipeline(const Config& config) : config_(config) {
    ColorSpace::init();
}

Result Pipeline::prepare(const PaletteSource& source, const StyleSelection& selection) {
    return prepare(source, selection, config_.method);
}

Result Pipeline::prepare(const PaletteSource& source, const StyleSelection& selection, DistanceMethod method) {
    config_.method = method;
    prepared_ = false;
    resolved_.clear();
    palettes_.clear();
    labs_.clear();
    colors_.clear();
    identifier_ = palette_identifier(source);

    Document document;
    Result r = load_palette_document(source, document);
    if (r.failure()) {
        return fail(r);
    }

    r = resolve_palettes(document, selection, resolved_);
    if (r.failure()) {
        return fail(r);
    }

    palettes_ = resolved_;
    dedup_palettes(palettes_);
    build_lab_array();

    prepared_ = true;
    state_ = State::PaletteReady;
    return Result::ok();
}

void Pipeline::build_lab_array() {
    const size_t total = total_colors(palettes_);
    labs_.reserve(total);
    colors_.reserve(total);
    for (const auto& palette : palettes_) {
        for (const auto& entry : palette.colors) {
            colors_.push_back(entry.color);
            labs_.push_back(ColorSpace::srgb_to_lab(entry.color.r, entry.color.g, entry.color.b));
        }
    }
}

void Pipeline::apply(FrameBuffer& frame) const {
    const size_t count = labs_.size();
    if (count == 0 || frame.empty()) {
        return;
    }

    const Lab* palette = labs_.data();
    const Rgb* colors = colors_.data();
    const DistanceMethod method = config_.method;
    const int64_t total_pixels = static_cast<int64_t>(frame.pixel_count());
    uint8_t* data = frame.data();

#ifdef HAS_OPENMP
    const int workers = config_.threads > 0 ? config_.threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic, PIXEL_CHUNK) num_threads(workers)
#endif
    for (int64_t i = 0; i < total_pixels; ++i) {
        uint8_t* px = data + i * FrameBuffer::CHANNELS;
        const Lab lab = ColorSpace::srgb_to_lab(px[0], px[1], px[2]);
        const Rgb& match = colors[nearest_index(lab, palette, count, method)];
        px[0] = match.r;
        px[1] = match.g;
        px[2] = match.b;
    }
}

Result Pipeline::fail(Result r) {
    state_ = State::Failed;
    return r;
}

Result Pipeline::convert_image(const std::string& input, const std::string& output) {
    // A failed image leaves the prepared palette usable for the next one.
    if (!prepared_ || state_ == State::Converting) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            std::string("Cannot convert images while the pipeline is ") +
                            pipeline_state_name(state_),
                            input);
    }

    state_ = State::Converting;
    Result r = is_animated_input(input) && is_animated_input(output)
        ? convert_animated(input, output)
        : convert_static(input, output);
    if (r.failure()) {
        return fail(r);
    }
    state_ = State::Done;
    return r;
}

Result Pipeline::convert_static(const std::string& input, const std::string& output) {
    FrameBuffer image;
    Result r = load_image(input, image);
    if (r.failure()) {
        return r;
    }
    apply(image);
    return write_image(output, image, config_.jpeg_quality);
}

Result Pipeline::convert_animated(const std::string& input, const std::string& output) {
    size_t total = 0;
    Result r = count_frames(input, total);
    if (r.failure()) {
        return r;
    }

    AnimatedSource source;
    r = source.open(input);
    if (r.failure()) {
        return r;
    }

    GifEncoder encoder;
    FrameBuffer frame;
    FrameTiming timing;
    size_t index = 0;
    while (source.read(frame, timing)) {
        if (!encoder.is_open()) {
            GifEncoder::Config cfg;
            cfg.width = frame.width();
            cfg.height = frame.height();
            cfg.time_base_num = timing.time_base_num;
            cfg.time_base_den = timing.time_base_den;
            cfg.method = config_.method;
            r = encoder.open(output, cfg);
            if (r.failure()) {
                return r;
            }
        }

        apply(frame);
        r = encoder.write_frame(frame, timing);
        if (r.failure()) {
            encoder.abort();
            return r;
        }

        ++index;
        if (frame_callback_) {
            frame_callback_(index, std::max(total, index));
        }
    }

    if (!source.last_error().empty()) {
        encoder.abort();
        return Result::fail(ErrorCode::DECODE_ERROR, source.last_error(), input);
    }
    if (!encoder.is_open()) {
        return Result::fail(ErrorCode::DECODE_ERROR, input + " contains no frames", input);
    }
    return encoder.finish();
}

Result Pipeline::convert_all(const std::vector<std::string>& inputs, const std::vector<std::string>& outputs) {
    if (inputs.size() != outputs.size()) {
        return fail(Result::fail(ErrorCode::CARDINALITY_MISMATCH,
                                 "Got " + std::to_string(inputs.size()) + " input files but " +
                                 std::to_string(outputs.size()) + " output files",
                                 "", std::to_string(outputs.size())));
    }

    for (size_t i = 0; i < inputs.size(); ++i) {
        if (image_callback_) {
            image_callback_(i, inputs[i], outputs[i]);
        }
        Result r = convert_image(inputs[i], outputs[i]);
        if (r.failure()) {
            return r;
        }
    }
    return Result::ok();
}

std::string Pipeline::output_path_for(const std::string& directory, const std::string& input) const {
    return output_file_name(directory, input, identifier_, palettes_, config_.method,
                            default_output_extension(input));
}

const char* pipeline_state_name(Pipeline::State state) {
    switch (state) {
        case Pipeline::State::Idle: return "idle";
        case Pipeline::State::PaletteReady: return "ready";
        case Pipeline::State::Converting: return "converting";
        case Pipeline::State::Done: return "done";
        case Pipeline::State::Failed: return "failed";
    }
    return "unknown";
}

}
