#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "codec/frame_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cascii {

// Positions are offsets into the analysed sequence, not frame indices.
struct LoopMatch {
    int offset = 0;
    int period = 0;
    int repeats = 0;
    int length = 0;

    int end() const { return offset + length; }
};

struct FramePair {
    size_t first = 0;
    size_t second = 0;

    bool operator==(const FramePair& other) const {
        return first == other.first && second == other.second;
    }
};

class LoopDetector {
public:
    struct Config {
        int min_period = 1;
        int min_repeats = 2;
    };

    LoopDetector() : LoopDetector(Config{}) {}
    explicit LoopDetector(const Config& config);

    const Config& config() const { return config_; }

    // Shortest period, then smallest offset. match stays empty when the
    // sequence has no loop.
    Result find(const FrameSequence& sequence, std::optional<LoopMatch>& match) const;

    // Every pair of identical frames whose indices are not neighbours.
    std::vector<FramePair> repeated_pairs(const FrameSequence& sequence) const;

private:
    Config config_;
};

// Copies positions [first, last] and numbers them from 1.
FrameSequence extract_range(const FrameSequence& sequence, size_t first, size_t last);
FrameSequence extract_loop(const FrameSequence& sequence, const LoopMatch& match);

// Inserts `times` extra copies of [first, last] right after `last` and
// renumbers the whole sequence from 1.
FrameSequence repeat_range(const FrameSequence& sequence, size_t first, size_t last, int times);
FrameSequence repeat_loop(const FrameSequence& sequence, const LoopMatch& match, int times);

// <dir>_loop_<first index>_<last index>, beside the source directory.
std::string loop_export_directory(const std::string& directory, int first_index, int last_index);

Result export_range(const FrameStore& store, const FrameSequence& sequence,
                    size_t first, size_t last, std::string& output_dir);
Result repeat_range_in_place(const FrameStore& store, const FrameSequence& sequence,
                             size_t first, size_t last, int times);

}
