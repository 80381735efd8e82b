#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "codec/frame_store.hpp"
#include <string>

namespace cascii {

struct TrimMargins {
    int left = 0;
    int right = 0;
    int top = 0;
    int bottom = 0;

    static TrimMargins uniform(int n) { return {n, n, n, n}; }
    bool is_zero() const { return left == 0 && right == 0 && top == 0 && bottom == 0; }
};

enum class TrimTarget {
    InPlace,
    Directory
};

struct TrimReport {
    size_t frame_count = 0;
    Size trimmed_size;
    uintmax_t bytes_written = 0;
    std::string output_dir;
};

Result trim(const Frame& frame, const TrimMargins& margins, Frame& out);
Result trim_sequence(const FrameSequence& sequence, const TrimMargins& margins, FrameSequence& out);

// Trims every .txt and .cframe frame of store. Directory targets write to
// output_dir under the same indices; InPlace overwrites the source files.
Result trim_directory(const FrameStore& store, const TrimMargins& margins,
                      TrimTarget target, const std::string& output_dir, TrimReport& report);

// Trims one frame file, keeping its form. Directory targets write a file of
// the same name into output_dir.
Result trim_file(const std::string& path, const TrimMargins& margins,
                 TrimTarget target, const std::string& output_dir, TrimReport& report);

}
