#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cascii {

struct FontInfoImpl;

// 8-bit coverage bitmap. bearing_y is the offset of the top row from the baseline.
struct GlyphBitmap {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int advance = 0;
    int bearing_x = 0;
    int bearing_y = 0;

    bool empty() const { return pixels.empty(); }
    uint8_t coverage(int x, int y) const {
        if (x < 0 || x >= width || y < 0 || y >= height) return 0;
        const size_t i = static_cast<size_t>(y) * width + x;
        return i < pixels.size() ? pixels[i] : 0;
    }
};

// One TrueType/OpenType face scaled to a pixel height.
class FontLoader {
public:
    FontLoader();
    ~FontLoader();

    FontLoader(const FontLoader&) = delete;
    FontLoader& operator=(const FontLoader&) = delete;

    Result load(const std::string& path, float pixel_height = 16.0f);
    Result load_from_memory(const uint8_t* data, size_t size, float pixel_height = 16.0f);
    Result load_system_fallback(float pixel_height = 16.0f);

    GlyphBitmap render_glyph(uint32_t codepoint) const;
    bool is_loaded() const { return loaded_; }
    const std::string& path() const { return path_; }

    // Scaled metrics in pixels.
    int ascent() const { return ascent_; }
    int descent() const { return descent_; }
    float pixel_height() const { return pixel_height_; }

    // User font directories first, then system ones.
    static std::vector<std::string> font_search_dirs();
    static std::string find_system_monospace_font();

private:
    std::unique_ptr<FontInfoImpl> font_info_;
    std::vector<uint8_t> font_data_;
    std::string path_;
    float scale_ = 1.0f;
    float pixel_height_ = 16.0f;
    int ascent_ = 0;
    int descent_ = 0;
    bool loaded_ = false;
};

}
