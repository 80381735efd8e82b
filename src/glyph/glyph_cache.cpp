#include "glyph/glyph_cache.hpp"
#include <algorithm>
#include <cmath>

namespace cascii {

void GlyphCache::set_cell_size(int cell_width, int cell_height) {
    cell_width_ = std::max(1, cell_width);
    cell_height_ = std::max(1, cell_height);
    baseline_ = std::max(1, static_cast<int>(std::lround(cell_height_ * 0.8)));
    bitmaps_.clear();
}

Result GlyphCache::initialize(const FontLoader* loader, const std::string& chars, int cell_width, int cell_height) {
    if (!loader || !loader->is_loaded()) {
        return Result::fail(ErrorCode::FONT_ERROR, "glyph cache needs a loaded font");
    }
    if (cell_width <= 0 || cell_height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            "glyph cell must be positive, got " + std::to_string(cell_width) + "x" + std::to_string(cell_height));
    }

    set_cell_size(cell_width, cell_height);
    loader_ = loader;

    // Center the font's ascent..descent span vertically inside the cell.
    const int ascent = loader->ascent();
    const int descent = loader->descent();
    const int slack = cell_height_ - (ascent + descent);
    baseline_ = std::clamp(slack / 2 + ascent, 1, cell_height_);

    for (char c : chars) {
        const uint32_t cp = static_cast<unsigned char>(c);
        if (bitmaps_.count(cp) == 0) render(cp);
    }
    return Result::ok();
}

GlyphBitmap GlyphCache::compose(const GlyphBitmap& src) const {
    GlyphBitmap cell;
    cell.width = cell_width_;
    cell.height = cell_height_;
    cell.advance = cell_width_;
    cell.pixels.assign(static_cast<size_t>(cell_width_) * cell_height_, 0);
    if (src.empty()) return cell;

    const int advance = src.advance > 0 ? src.advance : src.width;
    const int origin_x = (cell_width_ - advance) / 2 + src.bearing_x;
    const int origin_y = baseline_ + src.bearing_y;

    for (int y = 0; y < src.height; ++y) {
        const int dy = origin_y + y;
        if (dy < 0 || dy >= cell_height_) continue;
        for (int x = 0; x < src.width; ++x) {
            const int dx = origin_x + x;
            if (dx < 0 || dx >= cell_width_) continue;
            cell.pixels[static_cast<size_t>(dy) * cell_width_ + dx] = src.coverage(x, y);
        }
    }
    return cell;
}

void GlyphCache::render(uint32_t codepoint) {
    if (!loader_) return;
    bitmaps_[codepoint] = compose(loader_->render_glyph(codepoint));
}

void GlyphCache::add_bitmap(uint32_t codepoint, const GlyphBitmap& bitmap) {
    if (bitmap.width == cell_width_ && bitmap.height == cell_height_ &&
        bitmap.pixels.size() == static_cast<size_t>(cell_width_) * cell_height_) {
        bitmaps_[codepoint] = bitmap;
        return;
    }
    GlyphBitmap cell;
    cell.width = cell_width_;
    cell.height = cell_height_;
    cell.advance = cell_width_;
    cell.pixels.assign(static_cast<size_t>(cell_width_) * cell_height_, 0);
    for (int y = 0; y < std::min(cell_height_, bitmap.height); ++y) {
        for (int x = 0; x < std::min(cell_width_, bitmap.width); ++x) {
            cell.pixels[static_cast<size_t>(y) * cell_width_ + x] = bitmap.coverage(x, y);
        }
    }
    bitmaps_[codepoint] = std::move(cell);
}

const GlyphBitmap* GlyphCache::get_bitmap(uint32_t codepoint) const {
    auto it = bitmaps_.find(codepoint);
    return it != bitmaps_.end() ? &it->second : nullptr;
}

const GlyphBitmap* GlyphCache::glyph(uint32_t codepoint) {
    auto it = bitmaps_.find(codepoint);
    if (it != bitmaps_.end()) return &it->second;
    if (!loader_) return nullptr;
    render(codepoint);
    return get_bitmap(codepoint);
}

}
