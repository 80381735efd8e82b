#include "glyph/font_loader.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace cascii {

namespace fs = std::filesystem;

struct FontInfoImpl {
    stbtt_fontinfo info;
};

namespace {

constexpr size_t MAX_FONT_BYTES = 32u * 1024 * 1024;

// Monospace faces that cover printable ASCII, most common first.
const char* const MONOSPACE_FILES[] = {
    "DejaVuSansMono.ttf",
    "LiberationMono-Regular.ttf",
    "NotoSansMono-Regular.ttf",
    "UbuntuMono-R.ttf",
    "liberation-mono.ttf",
    "Menlo.ttc",
    "Monaco.ttf",
    "consola.ttf",
    "cour.ttf",
};

bool unsafe_path(const std::string& path) {
    return path.empty() || path.size() > 4096 ||
           path.find("..") != std::string::npos ||
           path.find('\0') != std::string::npos;
}

// TrueType 1.0, 'true', 'OTTO' and 'ttcf' collections.
bool has_font_signature(const uint8_t* data, size_t size) {
    if (!data || size < 12) return false;
    const uint32_t tag = (static_cast<uint32_t>(data[0]) << 24) |
                         (static_cast<uint32_t>(data[1]) << 16) |
                         (static_cast<uint32_t>(data[2]) << 8) |
                         static_cast<uint32_t>(data[3]);
    return tag == 0x00010000 || tag == 0x74727565 || tag == 0x4F54544F || tag == 0x74746366;
}

}

FontLoader::FontLoader() : font_info_(std::make_unique<FontInfoImpl>()) {}
FontLoader::~FontLoader() = default;

std::vector<std::string> FontLoader::font_search_dirs() {
    std::vector<std::string> dirs;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        dirs.push_back(std::string(xdg) + "/fonts");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        dirs.push_back(std::string(home) + "/.local/share/fonts");
        dirs.push_back(std::string(home) + "/.fonts");
    }
    for (const char* d : {"/usr/share/fonts/truetype/dejavu",
                          "/usr/share/fonts/truetype/liberation",
                          "/usr/share/fonts/truetype/noto",
                          "/usr/share/fonts/truetype/ubuntu",
                          "/usr/share/fonts/TTF",
                          "/usr/local/share/fonts",
                          "/System/Library/Fonts",
                          "/Library/Fonts",
                          "C:\\Windows\\Fonts"}) {
        dirs.emplace_back(d);
    }
    return dirs;
}

std::string FontLoader::find_system_monospace_font() {
    const std::vector<std::string> dirs = font_search_dirs();
    for (const char* name : MONOSPACE_FILES) {
        for (const std::string& dir : dirs) {
            std::error_code ec;
            const fs::path candidate = fs::path(dir) / name;
            if (fs::is_regular_file(candidate, ec)) return candidate.string();
        }
    }
    return "";
}

Result FontLoader::load(const std::string& path, float pixel_height) {
    if (unsafe_path(path)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "refusing font path '" + path + "'");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open font " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to read font " + path);
    }

    Result r = load_from_memory(data.data(), data.size(), pixel_height);
    if (r.failure()) {
        return Result::fail(r.error, path + ": " + r.message);
    }
    path_ = path;
    return Result::ok();
}

Result FontLoader::load_from_memory(const uint8_t* data, size_t size, float pixel_height) {
    loaded_ = false;
    path_.clear();
    if (size > MAX_FONT_BYTES) {
        return Result::fail(ErrorCode::FONT_ERROR, "font data is larger than 32 MiB");
    }
    if (!has_font_signature(data, size)) {
        return Result::fail(ErrorCode::FONT_ERROR, "not a TrueType or OpenType font");
    }
    if (!(pixel_height > 0.0f)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "font pixel height must be positive");
    }

    // stb_truetype keeps pointers into the buffer.
    font_data_.assign(data, data + size);
    const int offset = stbtt_GetFontOffsetForIndex(font_data_.data(), 0);
    if (offset < 0 || !stbtt_InitFont(&font_info_->info, font_data_.data(), offset)) {
        return Result::fail(ErrorCode::FONT_ERROR, "stb_truetype could not parse the font tables");
    }

    pixel_height_ = pixel_height;
    scale_ = stbtt_ScaleForPixelHeight(&font_info_->info, pixel_height);

    int ascent = 0, descent = 0, line_gap = 0;
    stbtt_GetFontVMetrics(&font_info_->info, &ascent, &descent, &line_gap);
    ascent_ = static_cast<int>(std::lround(ascent * scale_));
    descent_ = static_cast<int>(std::lround(-descent * scale_));

    loaded_ = true;
    return Result::ok();
}

Result FontLoader::load_system_fallback(float pixel_height) {
    const std::string path = find_system_monospace_font();
    if (path.empty()) {
        return Result::fail(ErrorCode::FONT_ERROR,
            "no monospace font found; set render.font_path or pass --font");
    }
    return load(path, pixel_height);
}

GlyphBitmap FontLoader::render_glyph(uint32_t codepoint) const {
    GlyphBitmap bitmap;
    if (!loaded_) return bitmap;

    const stbtt_fontinfo* info = &font_info_->info;
    const int cp = static_cast<int>(codepoint);
    int advance = 0, lsb = 0;
    stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);

    int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
    stbtt_GetCodepointBitmapBox(info, cp, scale_, scale_, &x0, &y0, &x1, &y1);

    bitmap.advance = static_cast<int>(std::lround(advance * scale_));
    bitmap.bearing_x = x0;
    bitmap.bearing_y = y0;
    if (x1 <= x0 || y1 <= y0) return bitmap;

    bitmap.width = x1 - x0;
    bitmap.height = y1 - y0;
    bitmap.pixels.assign(static_cast<size_t>(bitmap.width) * bitmap.height, 0);
    stbtt_MakeCodepointBitmap(info, bitmap.pixels.data(), bitmap.width, bitmap.height,
                              bitmap.width, scale_, scale_, cp);
    return bitmap;
}

}
