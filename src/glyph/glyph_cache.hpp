#pragma once

#include "glyph/font_loader.hpp"
#include <string>
#include <unordered_map>

namespace cascii {

// Cell-sized glyph bitmaps sharing one baseline, keyed by codepoint.
class GlyphCache {
public:
    GlyphCache() = default;

    // Renders every character of chars into cell_width x cell_height bitmaps.
    // Characters missing later are rendered on first use.
    Result initialize(const FontLoader* loader, const std::string& chars, int cell_width, int cell_height);

    // Injects a prepared bitmap; it is cropped or padded to the cell size.
    void add_bitmap(uint32_t codepoint, const GlyphBitmap& bitmap);

    const GlyphBitmap* get_bitmap(uint32_t codepoint) const;
    const GlyphBitmap* glyph(uint32_t codepoint);

    int cell_width() const { return cell_width_; }
    int cell_height() const { return cell_height_; }
    int baseline() const { return baseline_; }
    size_t size() const { return bitmaps_.size(); }

    void set_cell_size(int cell_width, int cell_height);

private:
    GlyphBitmap compose(const GlyphBitmap& src) const;
    void render(uint32_t codepoint);

    const FontLoader* loader_ = nullptr;
    int cell_width_ = 8;
    int cell_height_ = 16;
    int baseline_ = 12;

    std::unordered_map<uint32_t, GlyphBitmap> bitmaps_;
};

}
