#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include <string>

namespace cascii {

enum class FrameFormat {
    Plain,
    Color
};

constexpr const char* PLAIN_EXTENSION = ".txt";
constexpr const char* COLOR_EXTENSION = ".cframe";

constexpr char COLOR_MAGIC[4] = {'C', 'F', 'R', 'M'};
constexpr uint8_t COLOR_FORMAT_VERSION = 1;
constexpr uint8_t RUN_HAS_COLOR = 1u << 0;

// Upper bound on either dimension accepted when decoding.
constexpr int MAX_FRAME_DIMENSION = 1 << 15;

FrameFormat preferred_format(const Frame& frame);
const char* extension_for(FrameFormat format);

// Plain form: H lines of W characters, each ending in '\n'. Colors are dropped.
std::string encode_plain(const Frame& frame);
// Color form: header with W and H, then per row a run-length list of
// (count, character, flags[, r, g, b]).
std::string encode_color(const Frame& frame);
// Color form when any cell carries color, plain form otherwise.
std::string encode(const Frame& frame);

bool is_color_form(const std::string& data);

Result decode_plain(const std::string& text, Frame& out);
Result decode_color(const std::string& data, Frame& out);
Result decode(const std::string& data, Frame& out);

}
