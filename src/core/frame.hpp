#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cascii {

struct Cell {
    char ch = ' ';
    bool has_color = false;
    uint8_t r = 0, g = 0, b = 0;

    Cell() = default;
    explicit Cell(char c) : ch(c) {}
    Cell(char c, uint8_t r, uint8_t g, uint8_t b) : ch(c), has_color(true), r(r), g(g), b(b) {}

    static Cell blank() { return Cell(); }
    bool is_blank() const { return ch == ' ' && !has_color; }

    bool same_color(const Cell& other) const {
        if (has_color != other.has_color) return false;
        return !has_color || (r == other.r && g == other.g && b == other.b);
    }

    bool operator==(const Cell& other) const {
        return ch == other.ch && same_color(other);
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

// W x H character grid. Built once, then only read; transforms return new frames.
class Frame {
public:
    Frame() = default;
    Frame(int w, int h) : width_(w), height_(h), cells_(static_cast<size_t>(w) * h) {}

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    const std::vector<Cell>& cells() const { return cells_; }

    const Cell& at(int x, int y) const {
        return cells_[static_cast<size_t>(y) * width_ + x];
    }

    void set(int x, int y, const Cell& c) {
        cells_[static_cast<size_t>(y) * width_ + x] = c;
    }

    bool has_color() const;
    uint64_t fingerprint() const;
    std::string row_text(int y) const;

    bool operator==(const Frame& other) const {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> cells_;
};

struct IndexedFrame {
    int index = 0;
    Frame frame;
};

using FrameSequence = std::vector<IndexedFrame>;

Result check_uniform_size(const FrameSequence& sequence);

}
