#include "core/frame.hpp"

namespace cascii {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ull;
constexpr uint64_t FNV_PRIME = 0x100000001b3ull;

inline uint64_t fnv_mix(uint64_t h, uint8_t byte) {
    h ^= byte;
    return h * FNV_PRIME;
}

}

bool Frame::has_color() const {
    for (const Cell& c : cells_) {
        if (c.has_color) return true;
    }
    return false;
}

uint64_t Frame::fingerprint() const {
    uint64_t h = FNV_OFFSET;
    for (int shift = 0; shift < 32; shift += 8) {
        h = fnv_mix(h, static_cast<uint8_t>(width_ >> shift));
        h = fnv_mix(h, static_cast<uint8_t>(height_ >> shift));
    }
    for (const Cell& c : cells_) {
        h = fnv_mix(h, static_cast<uint8_t>(c.ch));
        if (c.has_color) {
            h = fnv_mix(h, 1);
            h = fnv_mix(h, c.r);
            h = fnv_mix(h, c.g);
            h = fnv_mix(h, c.b);
        } else {
            h = fnv_mix(h, 0);
        }
    }
    return h;
}

std::string Frame::row_text(int y) const {
    std::string row;
    row.reserve(width_);
    for (int x = 0; x < width_; ++x) {
        row.push_back(at(x, y).ch);
    }
    return row;
}

Result check_uniform_size(const FrameSequence& sequence) {
    if (sequence.empty()) return Result::ok();
    const Size expected = sequence.front().frame.size();
    for (const IndexedFrame& f : sequence) {
        if (f.frame.size() != expected) {
            return Result::fail(ErrorCode::DIMENSION_MISMATCH,
                "frame " + std::to_string(f.index) + " is " +
                std::to_string(f.frame.width()) + "x" + std::to_string(f.frame.height()) +
                ", expected " + std::to_string(expected.width) + "x" + std::to_string(expected.height));
        }
    }
    return Result::ok();
}

}
