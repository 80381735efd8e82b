#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "mapping/char_sets.hpp"
#include <optional>
#include <utility>
#include <string>

namespace cascii {

// Darkest-to-lightest run of distinct printable ASCII characters.
class Palette {
public:
    Palette() : chars_(CharSet::DEFAULT) {}

    static Result create(const std::string& chars, Palette& out);

    size_t size() const { return chars_.size(); }
    char at(size_t i) const { return chars_[i]; }
    const std::string& chars() const { return chars_; }

private:
    explicit Palette(std::string chars) : chars_(std::move(chars)) {}

    std::string chars_;
};

struct ConversionOptions {
    std::optional<int> columns = 400;
    float font_ratio = 0.7f;
    int luminance_threshold = 20;
    Palette palette;
    bool color = false;

    Result validate() const;
};

// BT.709 weights in fixed point; truncates like an integer cast of the float sum.
inline int luminance(uint8_t r, uint8_t g, uint8_t b) {
    return (2126 * r + 7152 * g + 722 * b) / 10000;
}

inline Cell map_pixel(uint8_t r, uint8_t g, uint8_t b, const ConversionOptions& options) {
    const int l = luminance(r, g, b);
    const int threshold = options.luminance_threshold;
    if (l < threshold) {
        return Cell::blank();
    }

    const int range = std::max(1, 255 - threshold);
    const int effective = l - threshold;
    const int last = static_cast<int>(options.palette.size()) - 1;
    const int idx = std::min(last, effective * last / range);
    const char ch = options.palette.at(static_cast<size_t>(idx));

    if (options.color) {
        return Cell(ch, r, g, b);
    }
    return Cell(ch);
}

Size target_grid_size(int src_w, int src_h, const ConversionOptions& options);

// Maps every pixel of an image already sampled at grid resolution.
Frame map_image(const FrameBuffer& image, const ConversionOptions& options);

}
