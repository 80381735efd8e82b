#include "codec/frame_codec.hpp"
#include <cstring>
#include <vector>

namespace cascii {

namespace {

void put_u32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

void put_u8(std::string& out, uint8_t v) {
    out.push_back(static_cast<char>(v));
}

class ByteReader {
public:
    explicit ByteReader(const std::string& data) : data_(data) {}

    bool read_u8(uint8_t& v) {
        if (pos_ + 1 > data_.size()) return false;
        v = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    bool read_u32(uint32_t& v) {
        if (pos_ + 4 > data_.size()) return false;
        const auto* p = reinterpret_cast<const unsigned char*>(data_.data() + pos_);
        v = static_cast<uint32_t>(p[0]) |
            (static_cast<uint32_t>(p[1]) << 8) |
            (static_cast<uint32_t>(p[2]) << 16) |
            (static_cast<uint32_t>(p[3]) << 24);
        pos_ += 4;
        return true;
    }

    bool skip(size_t n) {
        if (pos_ + n > data_.size()) return false;
        pos_ += n;
        return true;
    }

    size_t remaining() const { return data_.size() - pos_; }

private:
    const std::string& data_;
    size_t pos_ = 0;
};

bool has_color_magic(const std::string& data) {
    return data.size() >= sizeof(COLOR_MAGIC) &&
           std::memcmp(data.data(), COLOR_MAGIC, sizeof(COLOR_MAGIC)) == 0;
}

Result truncated(const std::string& what) {
    return Result::fail(ErrorCode::DECODE_ERROR, "truncated color frame: " + what);
}

}

FrameFormat preferred_format(const Frame& frame) {
    return frame.has_color() ? FrameFormat::Color : FrameFormat::Plain;
}

const char* extension_for(FrameFormat format) {
    return format == FrameFormat::Color ? COLOR_EXTENSION : PLAIN_EXTENSION;
}

std::string encode_plain(const Frame& frame) {
    std::string out;
    out.reserve(static_cast<size_t>(frame.width() + 1) * frame.height());
    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            out.push_back(frame.at(x, y).ch);
        }
        out.push_back('\n');
    }
    return out;
}

std::string encode_color(const Frame& frame) {
    std::string out;
    out.append(COLOR_MAGIC, sizeof(COLOR_MAGIC));
    put_u8(out, COLOR_FORMAT_VERSION);
    put_u32(out, static_cast<uint32_t>(frame.width()));
    put_u32(out, static_cast<uint32_t>(frame.height()));

    std::string row_runs;
    for (int y = 0; y < frame.height(); ++y) {
        row_runs.clear();
        uint32_t run_count = 0;
        int x = 0;
        while (x < frame.width()) {
            const Cell& head = frame.at(x, y);
            int end = x + 1;
            while (end < frame.width() && frame.at(end, y) == head) {
                ++end;
            }

            put_u32(row_runs, static_cast<uint32_t>(end - x));
            put_u8(row_runs, static_cast<uint8_t>(head.ch));
            put_u8(row_runs, head.has_color ? RUN_HAS_COLOR : 0);
            if (head.has_color) {
                put_u8(row_runs, head.r);
                put_u8(row_runs, head.g);
                put_u8(row_runs, head.b);
            }
            ++run_count;
            x = end;
        }
        put_u32(out, run_count);
        out += row_runs;
    }
    return out;
}

std::string encode(const Frame& frame) {
    return preferred_format(frame) == FrameFormat::Color ? encode_color(frame) : encode_plain(frame);
}

// The version byte is not printable, so a plain row starting with the magic
// text is never taken for a color frame.
bool is_color_form(const std::string& data) {
    return has_color_magic(data) && data.size() > sizeof(COLOR_MAGIC) &&
           static_cast<uint8_t>(data[sizeof(COLOR_MAGIC)]) == COLOR_FORMAT_VERSION;
}

Result decode_plain(const std::string& text, Frame& out) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string::npos) ? text.size() : nl;
        size_t len = end - start;
        if (len > 0 && text[end - 1] == '\r') {
            --len;
        }
        lines.emplace_back(text, start, len);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }

    if (lines.empty() || lines.front().empty()) {
        return Result::fail(ErrorCode::DECODE_ERROR, "plain frame is empty");
    }

    const size_t width = lines.front().size();
    if (width > static_cast<size_t>(MAX_FRAME_DIMENSION) || lines.size() > static_cast<size_t>(MAX_FRAME_DIMENSION)) {
        return Result::fail(ErrorCode::DECODE_ERROR, "plain frame exceeds maximum dimensions");
    }
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].size() != width) {
            return Result::fail(ErrorCode::DECODE_ERROR,
                "row " + std::to_string(i + 1) + " has " + std::to_string(lines[i].size()) +
                " columns, expected " + std::to_string(width));
        }
    }

    Frame frame(static_cast<int>(width), static_cast<int>(lines.size()));
    for (int y = 0; y < frame.height(); ++y) {
        const std::string& line = lines[static_cast<size_t>(y)];
        for (int x = 0; x < frame.width(); ++x) {
            frame.set(x, y, Cell(line[static_cast<size_t>(x)]));
        }
    }
    out = std::move(frame);
    return Result::ok();
}

Result decode_color(const std::string& data, Frame& out) {
    if (!has_color_magic(data)) {
        return Result::fail(ErrorCode::DECODE_ERROR, "missing color frame magic");
    }

    ByteReader reader(data);
    reader.skip(sizeof(COLOR_MAGIC));

    uint8_t version = 0;
    if (!reader.read_u8(version)) return truncated("missing version");
    if (version != COLOR_FORMAT_VERSION) {
        return Result::fail(ErrorCode::DECODE_ERROR,
            "unsupported color frame version " + std::to_string(version));
    }

    uint32_t width = 0;
    uint32_t height = 0;
    if (!reader.read_u32(width) || !reader.read_u32(height)) {
        return truncated("missing dimensions");
    }
    if (width == 0 || height == 0) {
        return Result::fail(ErrorCode::DECODE_ERROR, "color frame has zero width or height");
    }
    if (width > static_cast<uint32_t>(MAX_FRAME_DIMENSION) || height > static_cast<uint32_t>(MAX_FRAME_DIMENSION)) {
        return Result::fail(ErrorCode::DECODE_ERROR,
            "color frame dimensions " + std::to_string(width) + "x" + std::to_string(height) + " exceed maximum");
    }

    Frame frame(static_cast<int>(width), static_cast<int>(height));
    for (uint32_t y = 0; y < height; ++y) {
        uint32_t run_count = 0;
        if (!reader.read_u32(run_count)) {
            return truncated("expected " + std::to_string(height) + " rows, found " + std::to_string(y));
        }

        uint32_t x = 0;
        for (uint32_t r = 0; r < run_count; ++r) {
            uint32_t length = 0;
            uint8_t ch = 0;
            uint8_t flags = 0;
            if (!reader.read_u32(length) || !reader.read_u8(ch) || !reader.read_u8(flags)) {
                return truncated("row " + std::to_string(y + 1) + " ends inside run " + std::to_string(r + 1));
            }
            if (length == 0) {
                return Result::fail(ErrorCode::DECODE_ERROR,
                    "row " + std::to_string(y + 1) + " run " + std::to_string(r + 1) + " has zero length");
            }
            if (length > width - x) {
                return Result::fail(ErrorCode::DECODE_ERROR,
                    "row " + std::to_string(y + 1) + " runs cover more than " + std::to_string(width) + " columns");
            }

            Cell cell(static_cast<char>(ch));
            if (flags & RUN_HAS_COLOR) {
                uint8_t cr = 0, cg = 0, cb = 0;
                if (!reader.read_u8(cr) || !reader.read_u8(cg) || !reader.read_u8(cb)) {
                    return truncated("row " + std::to_string(y + 1) + " ends inside run color");
                }
                cell = Cell(static_cast<char>(ch), cr, cg, cb);
            }

            for (uint32_t i = 0; i < length; ++i) {
                frame.set(static_cast<int>(x + i), static_cast<int>(y), cell);
            }
            x += length;
        }

        if (x != width) {
            return Result::fail(ErrorCode::DECODE_ERROR,
                "row " + std::to_string(y + 1) + " runs cover " + std::to_string(x) +
                " columns, expected " + std::to_string(width));
        }
    }

    if (reader.remaining() != 0) {
        return Result::fail(ErrorCode::DECODE_ERROR,
            std::to_string(reader.remaining()) + " trailing bytes after row " + std::to_string(height) +
            " (more than " + std::to_string(height) + " rows)");
    }

    out = std::move(frame);
    return Result::ok();
}

Result decode(const std::string& data, Frame& out) {
    if (is_color_form(data)) {
        return decode_color(data, out);
    }
    return decode_plain(data, out);
}

}
