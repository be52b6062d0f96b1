#pragma once

#include "core/color_space.hpp"
#include "core/delta_e.hpp"
#include "core/types.hpp"
#include "palette/palette.hpp"
#include "palette/palette_source.hpp"
#include "palette/style_selection.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace dipc {

// One recoloring run: a prepared palette applied to any number of images,
// strictly one image at a time.
class Pipeline {
public:
    struct Config {
        DistanceMethod method = DEFAULT_DISTANCE_METHOD;
        int threads = 0;  // 0 = OpenMP default
        int jpeg_quality = 95;
    };

    enum class State {
        Idle,
        PaletteReady,
        Converting,
        Done,
        Failed
    };

    // Called after every encoded frame of an animated image.
    using FrameCallback = std::function<void(size_t frame, size_t total)>;
    // Called by convert_all before each image is started.
    using ImageCallback = std::function<void(size_t index, const std::string& input, const std::string& output)>;

    Pipeline() : Pipeline(Config{}) {}
    explicit Pipeline(const Config& config);

    const Config& config() const { return config_; }

    // Resolves the styles of the source, dedups every palette and builds the
    // Lab search array. Nothing is converted if this fails.
    Result prepare(const PaletteSource& source, const StyleSelection& selection);
    Result prepare(const PaletteSource& source, const StyleSelection& selection, DistanceMethod method);

    // Replaces the RGB of every pixel with its nearest palette color.
    void apply(FrameBuffer& frame) const;

    // Needs a successful prepare(). A failure is scoped to this image: the
    // state becomes Failed but later calls may still convert.
    Result convert_image(const std::string& input, const std::string& output);
    Result convert_all(const std::vector<std::string>& inputs, const std::vector<std::string>& outputs);

    std::string output_path_for(const std::string& directory, const std::string& input) const;

    void set_frame_callback(FrameCallback callback) { frame_callback_ = std::move(callback); }
    void set_image_callback(ImageCallback callback) { image_callback_ = std::move(callback); }

    State state() const { return state_; }
    const std::string& identifier() const { return identifier_; }
    // Palettes as resolved, and after dedup.
    const std::vector<Palette>& resolved_palettes() const { return resolved_; }
    const std::vector<Palette>& palettes() const { return palettes_; }
    const std::vector<Lab>& lab_palette() const { return labs_; }

private:
    Result convert_static(const std::string& input, const std::string& output);
    Result convert_animated(const std::string& input, const std::string& output);
    Result fail(Result r);

    void build_lab_array();

    Config config_;
    State state_ = State::Idle;
    bool prepared_ = false;
    std::string identifier_;
    std::vector<Palette> resolved_;
    std::vector<Palette> palettes_;
    std::vector<Lab> labs_;
    std::vector<Rgb> colors_;
    FrameCallback frame_callback_;
    ImageCallback image_callback_;
};

const char* pipeline_state_name(Pipeline::State state);

}
