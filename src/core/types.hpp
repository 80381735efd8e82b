#pragma once

#include <vector>
#include <cstdint>
#include <algorithm>
#include <string>

namespace cascii {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    INVALID_ARGUMENT,
    IO_ERROR,
    PROCESSING_ERROR,
    FONT_ERROR,
    DECODE_ERROR,
    DIMENSION_MISMATCH,
    INDEX_GAP,
    EXTERNAL_TOOL_ERROR,
    TOOL_NOT_FOUND,
    INVALID_TIME_RANGE,
    CANCELLED
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// RGBA8 pixel image, row-major.
class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (size_t i = 0; i + 3 < data_.size(); i += 4) {
            data_[i] = c.r;
            data_[i+1] = c.g;
            data_[i+2] = c.b;
            data_[i+3] = c.a;
        }
    }

    void clear() {
        std::fill(data_.begin(), data_.end(), 0);
    }

    static FrameBuffer from_rgb(const uint8_t* rgb, int w, int h, int stride) {
        FrameBuffer out(w, h);
        for (int y = 0; y < h; ++y) {
            const uint8_t* row = rgb + static_cast<size_t>(y) * stride;
            uint8_t* dst = out.data() + static_cast<size_t>(y) * w * 4;
            for (int x = 0; x < w; ++x) {
                dst[x * 4] = row[x * 3];
                dst[x * 4 + 1] = row[x * 3 + 1];
                dst[x * 4 + 2] = row[x * 3 + 2];
                dst[x * 4 + 3] = 255;
            }
        }
        return out;
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

}
