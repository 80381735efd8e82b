#include "mapping/char_mapper.hpp"
#include <cmath>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace cascii {

Result Palette::create(const std::string& chars, Palette& out) {
    if (chars.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "palette must contain at least one character");
    }
    bool seen[128] = {false};
    for (size_t i = 0; i < chars.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(chars[i]);
        if (c < 0x20 || c > 0x7E) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                "palette character at position " + std::to_string(i) + " is not printable ASCII");
        }
        if (seen[c]) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                std::string("palette character '") + chars[i] + "' appears more than once");
        }
        seen[c] = true;
    }
    out = Palette(chars);
    return Result::ok();
}

Result ConversionOptions::validate() const {
    if (columns && *columns <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "columns must be positive");
    }
    if (!(font_ratio > 0.0f) || !std::isfinite(font_ratio)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "font_ratio must be a positive number");
    }
    if (luminance_threshold < 0 || luminance_threshold > 255) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "luminance threshold must be between 0 and 255");
    }
    if (palette.size() == 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "palette is empty");
    }
    return Result::ok();
}

Size target_grid_size(int src_w, int src_h, const ConversionOptions& options) {
    Size size;
    if (src_w <= 0 || src_h <= 0) return size;

    if (options.columns) {
        const int cols = *options.columns;
        size.width = cols;
        size.height = static_cast<int>(std::lround(
            static_cast<double>(src_h) / src_w * cols * options.font_ratio));
    } else {
        size.width = src_w;
        size.height = static_cast<int>(std::lround(static_cast<double>(src_h) * options.font_ratio));
    }
    size.height = std::max(1, size.height);
    return size;
}

Frame map_image(const FrameBuffer& image, const ConversionOptions& options) {
    Frame frame(image.width(), image.height());
    const int w = image.width();
    const int h = image.height();
    const uint8_t* src = image.data();

#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < h; ++y) {
        const uint8_t* row = src + static_cast<size_t>(y) * w * 4;
        for (int x = 0; x < w; ++x) {
            const uint8_t* px = row + static_cast<size_t>(x) * 4;
            frame.set(x, y, map_pixel(px[0], px[1], px[2], options));
        }
    }
    return frame;
}

}
