#include "render/frame_renderer.hpp"
#include <algorithm>
#include <cmath>

namespace cascii {

Result VideoRenderOptions::validate() const {
    if (!(font_size_px > 0.0f)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "font size must be positive");
    }
    if (!(font_ratio > 0.0f)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "font ratio must be positive");
    }
    if (quality_factor < 0 || quality_factor > 51) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            "quality factor must be in [0, 51], got " + std::to_string(quality_factor));
    }
    if (fps <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "render fps must be positive");
    }
    if (mux_audio && audio_source.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "audio muxing needs an audio source");
    }
    return Result::ok();
}

int glyph_width(float font_size_px, float font_ratio) {
    return std::max(1, static_cast<int>(std::lround(font_size_px * font_ratio)));
}

int glyph_height(float font_size_px) {
    return std::max(1, static_cast<int>(std::lround(font_size_px)));
}

FrameRenderer::FrameRenderer(const VideoRenderOptions& options) : options_(options) {
    cache_.set_cell_size(glyph_width(options.font_size_px, options.font_ratio),
                         glyph_height(options.font_size_px));
}

Result FrameRenderer::load_font(const std::string& chars) {
    Result r = options_.validate();
    if (r.failure()) return r;

    if (options_.font_path.empty()) {
        r = font_.load_system_fallback(options_.font_size_px);
    } else {
        r = font_.load(options_.font_path, options_.font_size_px);
    }
    if (r.failure()) return r;

    return cache_.initialize(&font_, chars,
                             glyph_width(options_.font_size_px, options_.font_ratio),
                             glyph_height(options_.font_size_px));
}

Size FrameRenderer::output_size(const Frame& frame) const {
    return {frame.width() * cache_.cell_width(), frame.height() * cache_.cell_height()};
}

static uint8_t blend(uint8_t bg, uint8_t fg, int alpha) {
    return static_cast<uint8_t>((bg * (255 - alpha) + fg * alpha + 127) / 255);
}

void FrameRenderer::draw_cell(FrameBuffer& out, int x0, int y0, const GlyphBitmap& glyph, const Color& color) const {
    const Color& bg = options_.background;
    const int w = std::min(glyph.width, cache_.cell_width());
    const int h = std::min(glyph.height, cache_.cell_height());
    for (int gy = 0; gy < h; ++gy) {
        uint8_t* row = out.data() + (static_cast<size_t>(y0 + gy) * out.width() + x0) * 4;
        for (int gx = 0; gx < w; ++gx) {
            const int alpha = glyph.coverage(gx, gy);
            if (alpha == 0) continue;
            uint8_t* px = row + gx * 4;
            px[0] = blend(bg.r, color.r, alpha);
            px[1] = blend(bg.g, color.g, alpha);
            px[2] = blend(bg.b, color.b, alpha);
            px[3] = 255;
        }
    }
}

Result FrameRenderer::render(const Frame& frame, FrameBuffer& out) {
    if (frame.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cannot render an empty frame");
    }

    const Size size = output_size(frame);
    FrameBuffer image(size.width, size.height, options_.background);
    const int cw = cache_.cell_width();
    const int ch = cache_.cell_height();

    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            const Cell& cell = frame.at(x, y);
            if (cell.ch == ' ') continue;

            const GlyphBitmap* glyph = cache_.glyph(static_cast<unsigned char>(cell.ch));
            if (!glyph || glyph->empty()) continue;

            const Color color = cell.has_color ? Color(cell.r, cell.g, cell.b) : options_.foreground;
            draw_cell(image, x * cw, y * ch, *glyph, color);
        }
    }

    out = std::move(image);
    return Result::ok();
}

Result render_sequence(FrameRenderer& renderer, const FrameSequence& sequence,
                       FrameEncoder& encoder, const RenderProgress& progress) {
    Result r = check_uniform_size(sequence);
    if (r.failure()) return r;

    FrameBuffer image;
    for (size_t i = 0; i < sequence.size(); ++i) {
        r = renderer.render(sequence[i].frame, image);
        if (r.failure()) {
            return Result::fail(r.error, "frame " + std::to_string(sequence[i].index) + ": " + r.message);
        }
        r = encoder.write(image);
        if (r.failure()) {
            return Result::fail(r.error, "frame " + std::to_string(sequence[i].index) + ": " + r.message);
        }
        if (progress) progress(i + 1, sequence.size());
    }
    return encoder.finish();
}

}
