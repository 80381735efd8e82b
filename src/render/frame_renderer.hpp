#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "glyph/font_loader.hpp"
#include "glyph/glyph_cache.hpp"
#include "media/media_toolkit.hpp"
#include <functional>
#include <string>

namespace cascii {

struct VideoRenderOptions {
    std::string output_target;
    float font_size_px = 13.0f;
    float font_ratio = 0.7f;
    int quality_factor = 18;
    bool mux_audio = false;
    std::string audio_source;
    int fps = 30;
    std::string font_path;
    Color foreground = Color(230, 230, 230);
    Color background = Color(0, 0, 0);

    Result validate() const;
};

int glyph_width(float font_size_px, float font_ratio);
int glyph_height(float font_size_px);

class FrameRenderer {
public:
    explicit FrameRenderer(const VideoRenderOptions& options);

    const VideoRenderOptions& options() const { return options_; }
    int cell_width() const { return cache_.cell_width(); }
    int cell_height() const { return cache_.cell_height(); }

    // Loads options.font_path, or the first system monospace font when unset,
    // and prepares glyphs for chars.
    Result load_font(const std::string& chars);
    GlyphCache& cache() { return cache_; }

    Size output_size(const Frame& frame) const;
    Result render(const Frame& frame, FrameBuffer& out);

private:
    void draw_cell(FrameBuffer& out, int x0, int y0, const GlyphBitmap& glyph, const Color& color) const;

    VideoRenderOptions options_;
    FontLoader font_;
    GlyphCache cache_;
};

using RenderProgress = std::function<void(size_t rendered, size_t total)>;

// Renders every frame in order and hands it to the encoder. The encoder is
// finished on success.
Result render_sequence(FrameRenderer& renderer, const FrameSequence& sequence,
                       FrameEncoder& encoder, const RenderProgress& progress = {});

}
