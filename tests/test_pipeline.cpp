#include <iostream>
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>

#include <unistd.h>

#include "../src/core/types.hpp"
#include "../src/core/pipeline.hpp"
#include "../src/core/frame_source.hpp"
#include "../src/render/image_writer.hpp"
#include "../src/render/gif_encoder.hpp"

using namespace dipc;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static std::filesystem::path scratch_dir() {
    static const std::filesystem::path dir = [] {
        auto p = std::filesystem::temp_directory_path() / ("dipc_pipeline_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(p);
        return p;
    }();
    return dir;
}

static std::string scratch(const std::string& name) {
    return (scratch_dir() / name).string();
}

static PaletteSource inline_source(const char* json) {
    return InlineDocument{Document::parse(json)};
}

static const char* const THREE_COLORS = R"({"black": "#000000", "white": "#FFFFFF", "red": "#FF0000"})";

static Pipeline prepared(int threads = 0) {
    Pipeline::Config cfg;
    cfg.threads = threads;
    Pipeline p(cfg);
    Result r = p.prepare(inline_source(THREE_COLORS), StyleSelection::none());
    if (r.failure()) {
        throw std::runtime_error(describe(r));
    }
    return p;
}

// Deterministic image covering a spread of colors and alpha values.
static FrameBuffer gradient(int w, int h) {
    FrameBuffer fb(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            fb.set_pixel(x, y, Color(static_cast<uint8_t>(x * 255 / std::max(1, w - 1)),
                                     static_cast<uint8_t>(y * 255 / std::max(1, h - 1)),
                                     static_cast<uint8_t>((x * 7 + y * 13) & 0xFF),
                                     static_cast<uint8_t>(255 - ((x + y) & 0x7F))));
        }
    }
    return fb;
}

static bool only_palette_colors(const FrameBuffer& fb) {
    for (int y = 0; y < fb.height(); ++y) {
        for (int x = 0; x < fb.width(); ++x) {
            Color c = fb.get_pixel(x, y);
            const bool black = c.r == 0 && c.g == 0 && c.b == 0;
            const bool white = c.r == 255 && c.g == 255 && c.b == 255;
            const bool red = c.r == 255 && c.g == 0 && c.b == 0;
            if (!black && !white && !red) return false;
        }
    }
    return true;
}

// ---- In-memory recoloring ----

TEST(prepare_reports_palette) {
    Pipeline p = prepared();
    assert(p.state() == Pipeline::State::PaletteReady);
    assert(p.identifier() == "custom");
    assert(p.palettes().size() == 1);
    assert(p.lab_palette().size() == 3);
    assert(std::string(pipeline_state_name(p.state())) == "ready");
}

TEST(prepare_failure_leaves_pipeline_failed) {
    Pipeline p;
    Result r = p.prepare(inline_source(R"({"dark": {"x": "#000000"}})"), StyleSelection::some({"light"}));
    assert(r.error == ErrorCode::STYLE_NOT_FOUND);
    assert(p.state() == Pipeline::State::Failed);
    assert(p.lab_palette().empty());
}

TEST(apply_maps_to_nearest_color) {
    Pipeline p = prepared();
    FrameBuffer fb(3, 1);
    fb.set_pixel(0, 0, Color(10, 12, 8, 255));
    fb.set_pixel(1, 0, Color(240, 250, 245, 255));
    fb.set_pixel(2, 0, Color(200, 20, 30, 255));
    p.apply(fb);
    assert(fb.get_pixel(0, 0) == Color(0, 0, 0, 255));
    assert(fb.get_pixel(1, 0) == Color(255, 255, 255, 255));
    assert(fb.get_pixel(2, 0) == Color(255, 0, 0, 255));
}

TEST(apply_preserves_alpha) {
    Pipeline p = prepared();
    FrameBuffer fb(2, 1);
    fb.set_pixel(0, 0, Color(250, 5, 5, 128));
    fb.set_pixel(1, 0, Color(3, 3, 3, 0));
    p.apply(fb);
    assert(fb.get_pixel(0, 0) == Color(255, 0, 0, 128));
    assert(fb.get_pixel(1, 0) == Color(0, 0, 0, 0));
}

TEST(apply_is_idempotent) {
    Pipeline p = prepared();
    FrameBuffer once = gradient(64, 48);
    p.apply(once);
    assert(only_palette_colors(once));
    FrameBuffer twice = once;
    p.apply(twice);
    assert(once == twice);
}

TEST(apply_independent_of_thread_count) {
    FrameBuffer single = gradient(257, 131);
    FrameBuffer many = single;
    prepared(1).apply(single);
    prepared(8).apply(many);
    assert(single == many);
}

TEST(apply_on_empty_frame_is_noop) {
    Pipeline p = prepared();
    FrameBuffer empty;
    p.apply(empty);
    assert(empty.empty());
}

TEST(every_method_keeps_palette_colors_fixed) {
    const DistanceMethod methods[] = {
        DistanceMethod::DE2000, DistanceMethod::DE1994G, DistanceMethod::DE1994T, DistanceMethod::DE1976
    };
    for (DistanceMethod method : methods) {
        Pipeline p;
        assert(p.prepare(inline_source(THREE_COLORS), StyleSelection::none(), method).success());
        FrameBuffer fb(3, 1);
        fb.set_pixel(0, 0, Color(0, 0, 0));
        fb.set_pixel(1, 0, Color(255, 255, 255));
        fb.set_pixel(2, 0, Color(255, 0, 0));
        FrameBuffer expected = fb;
        p.apply(fb);
        assert(fb == expected);
    }
}

// ---- Files ----

TEST(convert_png_file) {
    const std::string input = scratch("photo.png");
    FrameBuffer source = gradient(40, 30);
    assert(write_image(input, source).success());

    Pipeline p = prepared();
    const std::string output = p.output_path_for(scratch_dir().string(), input);
    assert(std::filesystem::path(output).filename() == "photo_custom.png");

    Result r = p.convert_image(input, output);
    assert(r.success());
    assert(p.state() == Pipeline::State::Done);

    FrameBuffer written;
    assert(load_image(output, written).success());
    assert(written.size() == source.size());
    assert(only_palette_colors(written));

    FrameBuffer expected = source;
    p.apply(expected);
    assert(written == expected);
}

TEST(convert_to_jpeg_and_bmp) {
    const std::string input = scratch("small.png");
    assert(write_image(input, gradient(16, 16)).success());

    Pipeline p = prepared();
    assert(p.convert_image(input, scratch("small_out.jpg")).success());
    assert(p.convert_image(input, scratch("small_out.bmp")).success());
    assert(std::filesystem::file_size(scratch("small_out.jpg")) > 0);

    FrameBuffer bmp;
    assert(load_image(scratch("small_out.bmp"), bmp).success());
    assert(only_palette_colors(bmp));
}

TEST(undecodable_input_is_operational_error) {
    const std::string input = scratch("garbage.png");
    {
        std::ofstream out(input, std::ios::binary);
        out << "this is not an image";
    }
    const std::string output = scratch("garbage_out.png");

    Pipeline p = prepared();
    Result r = p.convert_image(input, output);
    assert(r.error == ErrorCode::DECODE_ERROR);
    assert(is_operational(r.error));
    assert(p.state() == Pipeline::State::Failed);
    assert(!std::filesystem::exists(output));
}

TEST(failed_image_does_not_block_next_image) {
    const std::string broken = scratch("broken.png");
    {
        std::ofstream out(broken, std::ios::binary);
        out << "not a png either";
    }
    const std::string valid = scratch("valid.png");
    assert(write_image(valid, gradient(10, 10)).success());

    Pipeline p = prepared();
    Result r = p.convert_image(broken, scratch("broken_out.png"));
    assert(r.error == ErrorCode::DECODE_ERROR);
    assert(p.state() == Pipeline::State::Failed);
    assert(p.lab_palette().size() == 3);

    r = p.convert_image(valid, scratch("valid_out.png"));
    assert(r.success());
    assert(p.state() == Pipeline::State::Done);

    FrameBuffer written;
    assert(load_image(scratch("valid_out.png"), written).success());
    assert(only_palette_colors(written));
}

TEST(convert_after_failed_prepare_is_rejected) {
    Pipeline p = prepared();
    Result r = p.prepare(inline_source(R"({"dark": {"x": "#000000"}})"), StyleSelection::some({"light"}));
    assert(r.failure());

    const std::string input = scratch("after_prepare.png");
    assert(write_image(input, gradient(4, 4)).success());
    r = p.convert_image(input, scratch("after_prepare_out.png"));
    assert(r.error == ErrorCode::INVALID_ARGUMENT);
    assert(!std::filesystem::exists(scratch("after_prepare_out.png")));
}

TEST(convert_before_prepare_is_rejected) {
    Pipeline p;
    Result r = p.convert_image(scratch("photo.png"), scratch("never.png"));
    assert(r.error == ErrorCode::INVALID_ARGUMENT);
    assert(!std::filesystem::exists(scratch("never.png")));
}

TEST(cardinality_checked_before_any_conversion) {
    const std::string input = scratch("card.png");
    assert(write_image(input, gradient(8, 8)).success());

    Pipeline p = prepared();
    Result r = p.convert_all({input, input}, {scratch("card_a.png")});
    assert(r.error == ErrorCode::CARDINALITY_MISMATCH);
    assert(!is_operational(r.error));
    assert(p.state() == Pipeline::State::Failed);
    assert(!std::filesystem::exists(scratch("card_a.png")));
}

TEST(convert_all_in_order) {
    const std::string a = scratch("first.png");
    const std::string b = scratch("second.png");
    assert(write_image(a, gradient(8, 8)).success());
    assert(write_image(b, gradient(12, 4)).success());

    Pipeline p = prepared();
    std::vector<size_t> seen;
    p.set_image_callback([&](size_t index, const std::string&, const std::string&) {
        seen.push_back(index);
    });
    assert(p.convert_all({a, b}, {scratch("first_out.png"), scratch("second_out.png")}).success());
    assert(seen.size() == 2 && seen[0] == 0 && seen[1] == 1);
    assert(std::filesystem::exists(scratch("first_out.png")));
    assert(std::filesystem::exists(scratch("second_out.png")));
}

// ---- Animated ----

TEST(animated_gif_keeps_frames) {
    const std::string input = scratch("anim.gif");
    {
        GifEncoder encoder;
        GifEncoder::Config cfg;
        cfg.width = 16;
        cfg.height = 8;
        assert(encoder.open(input, cfg).success());

        FrameBuffer first(16, 8, Color(20, 20, 20));
        FrameBuffer second(16, 8, Color(230, 30, 40));
        second.set_pixel(0, 0, Color(250, 250, 250));
        FrameTiming t;
        t.duration = 10;
        assert(encoder.write_frame(first, t).success());
        t.pts = 10;
        assert(encoder.write_frame(second, t).success());
        assert(encoder.finish().success());
    }

    size_t frames = 0;
    assert(count_frames(input, frames).success());
    assert(frames == 2);

    Pipeline p = prepared();
    const std::string output = p.output_path_for(scratch_dir().string(), input);
    assert(std::filesystem::path(output).extension() == ".gif");

    size_t reported = 0;
    p.set_frame_callback([&](size_t frame, size_t total) {
        reported = frame;
        assert(total == 2);
    });
    assert(p.convert_image(input, output).success());
    assert(reported == 2);

    AnimatedSource result;
    assert(result.open(output).success());
    assert(result.frame_size() == (Size{16, 8}));
    FrameBuffer frame;
    FrameTiming timing;
    size_t decoded = 0;
    std::set<uint32_t> colors;
    while (result.read(frame, timing)) {
        ++decoded;
        assert(only_palette_colors(frame));
        Color c = frame.get_pixel(5, 5);
        colors.insert((static_cast<uint32_t>(c.r) << 16) | (c.g << 8) | c.b);
    }
    assert(result.last_error().empty());
    assert(decoded == 2);
    assert(colors.count(0x000000) == 1);
    assert(colors.count(0xFF0000) == 1);
}

TEST(gif_encoder_reduces_busy_frames) {
    const std::string output = scratch("busy.gif");
    GifEncoder encoder;
    GifEncoder::Config cfg;
    cfg.width = 32;
    cfg.height = 32;
    assert(encoder.open(output, cfg).success());

    // 512 distinct colors in the top half, one dominant color below
    FrameBuffer busy(32, 32, Color(10, 200, 30));
    for (int i = 0; i < 32 * 16; ++i) {
        busy.set_pixel(i % 32, i / 32, Color(static_cast<uint8_t>(i & 0xFF), static_cast<uint8_t>(i >> 8), 77));
    }
    // a transparent pixel keeps its own entry
    busy.set_pixel(0, 16, Color(1, 2, 3, 0));

    assert(encoder.write_frame(busy, FrameTiming{}).success());
    assert(encoder.finish().success());

    size_t frames = 0;
    assert(count_frames(output, frames).success());
    assert(frames == 1);

    FrameBuffer decoded;
    FrameTiming timing;
    AnimatedSource source;
    assert(source.open(output).success());
    assert(source.read(decoded, timing));
    assert(decoded.size() == busy.size());

    std::set<uint32_t> distinct;
    for (int y = 0; y < 32; ++y) {
        for (int x = 0; x < 32; ++x) {
            Color c = decoded.get_pixel(x, y);
            if (c.a == 0) continue;
            distinct.insert((static_cast<uint32_t>(c.r) << 16) | (c.g << 8) | c.b);
        }
    }
    assert(distinct.size() <= GifEncoder::MAX_COLORS);
    assert(decoded.get_pixel(20, 20) == Color(10, 200, 30, 255));
    assert(decoded.get_pixel(0, 16).a == 0);
}

TEST(gif_to_png_takes_first_frame) {
    const std::string input = scratch("anim.gif");
    const std::string output = scratch("anim_still.png");
    Pipeline p = prepared();
    assert(p.convert_image(input, output).success());

    FrameBuffer still;
    assert(load_image(output, still).success());
    assert(still.width() == 16 && still.height() == 8);
    assert(still.get_pixel(5, 5) == Color(0, 0, 0, 255));
}

int main() {
    std::cout << "=== dipc Pipeline Test Suite ===\n\n";

    std::cout << "--- Recoloring Tests ---\n";
    RUN_TEST(prepare_reports_palette);
    RUN_TEST(prepare_failure_leaves_pipeline_failed);
    RUN_TEST(apply_maps_to_nearest_color);
    RUN_TEST(apply_preserves_alpha);
    RUN_TEST(apply_is_idempotent);
    RUN_TEST(apply_independent_of_thread_count);
    RUN_TEST(apply_on_empty_frame_is_noop);
    RUN_TEST(every_method_keeps_palette_colors_fixed);

    std::cout << "\n--- File Tests ---\n";
    RUN_TEST(convert_png_file);
    RUN_TEST(convert_to_jpeg_and_bmp);
    RUN_TEST(undecodable_input_is_operational_error);
    RUN_TEST(failed_image_does_not_block_next_image);
    RUN_TEST(convert_after_failed_prepare_is_rejected);
    RUN_TEST(convert_before_prepare_is_rejected);
    RUN_TEST(cardinality_checked_before_any_conversion);
    RUN_TEST(convert_all_in_order);

    std::cout << "\n--- Animated Tests ---\n";
    RUN_TEST(animated_gif_keeps_frames);
    RUN_TEST(gif_encoder_reduces_busy_frames);
    RUN_TEST(gif_to_png_takes_first_frame);

    std::error_code ec;
    std::filesystem::remove_all(scratch_dir(), ec);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
