#include "analysis/loop_detector.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace cascii {

namespace fs = std::filesystem;

LoopDetector::LoopDetector(const Config& config) : config_(config) {}

static bool window_matches(const std::vector<uint64_t>& hashes, const FrameSequence& seq,
                           size_t s, size_t p, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (hashes[s + i] != hashes[s + i + p]) return false;
    }
    for (size_t i = 0; i < count; ++i) {
        if (seq[s + i].frame != seq[s + i + p].frame) return false;
    }
    return true;
}

Result LoopDetector::find(const FrameSequence& sequence, std::optional<LoopMatch>& match) const {
    match.reset();
    if (config_.min_period < 1 || config_.min_repeats < 2) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "loop detector needs min_period >= 1 and min_repeats >= 2");
    }

    const size_t n = sequence.size();
    if (n < 4) return Result::ok();

    Result r = check_uniform_size(sequence);
    if (r.failure()) return r;

    std::vector<uint64_t> hashes(n);
    for (size_t i = 0; i < n; ++i) {
        hashes[i] = sequence[i].frame.fingerprint();
    }

    const size_t repeats = static_cast<size_t>(config_.min_repeats);
    for (size_t p = static_cast<size_t>(config_.min_period); p <= n / 2; ++p) {
        if (repeats * p > n) break;
        const size_t required = (repeats - 1) * p;

        for (size_t s = 0; s + repeats * p <= n; ++s) {
            if (!window_matches(hashes, sequence, s, p, required)) continue;

            size_t span = required;
            while (s + span + p < n &&
                   hashes[s + span] == hashes[s + span + p] &&
                   sequence[s + span].frame == sequence[s + span + p].frame) {
                ++span;
            }

            LoopMatch m;
            m.offset = static_cast<int>(s);
            m.period = static_cast<int>(p);
            m.length = static_cast<int>(span + p);
            m.repeats = m.length / m.period;
            match = m;
            return Result::ok();
        }
    }
    return Result::ok();
}

std::vector<FramePair> LoopDetector::repeated_pairs(const FrameSequence& sequence) const {
    std::unordered_map<uint64_t, std::vector<size_t>> groups;
    std::vector<uint64_t> order;
    for (size_t i = 0; i < sequence.size(); ++i) {
        const uint64_t h = sequence[i].frame.fingerprint();
        auto& group = groups[h];
        if (group.empty()) order.push_back(h);
        group.push_back(i);
    }

    std::vector<FramePair> pairs;
    for (uint64_t h : order) {
        const std::vector<size_t>& group = groups[h];
        for (size_t a = 0; a + 1 < group.size(); ++a) {
            for (size_t b = a + 1; b < group.size(); ++b) {
                const IndexedFrame& first = sequence[group[a]];
                const IndexedFrame& second = sequence[group[b]];
                if (second.index <= first.index + 1) continue;
                if (first.frame != second.frame) continue;
                pairs.push_back({group[a], group[b]});
            }
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const FramePair& x, const FramePair& y) {
        return x.first != y.first ? x.first < y.first : x.second < y.second;
    });
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
    return pairs;
}

FrameSequence extract_range(const FrameSequence& sequence, size_t first, size_t last) {
    FrameSequence out;
    if (first > last || last >= sequence.size()) return out;
    out.reserve(last - first + 1);
    int counter = 1;
    for (size_t i = first; i <= last; ++i) {
        out.push_back({counter++, sequence[i].frame});
    }
    return out;
}

FrameSequence extract_loop(const FrameSequence& sequence, const LoopMatch& match) {
    if (match.period <= 0) return {};
    return extract_range(sequence, static_cast<size_t>(match.offset),
                         static_cast<size_t>(match.offset + match.period - 1));
}

FrameSequence repeat_range(const FrameSequence& sequence, size_t first, size_t last, int times) {
    if (first > last || last >= sequence.size() || times < 0) return sequence;

    FrameSequence out;
    out.reserve(sequence.size() + (last - first + 1) * static_cast<size_t>(times));
    for (size_t i = 0; i <= last; ++i) {
        out.push_back(sequence[i]);
    }
    for (int t = 0; t < times; ++t) {
        for (size_t i = first; i <= last; ++i) {
            out.push_back(sequence[i]);
        }
    }
    for (size_t i = last + 1; i < sequence.size(); ++i) {
        out.push_back(sequence[i]);
    }

    int counter = 1;
    for (IndexedFrame& item : out) {
        item.index = counter++;
    }
    return out;
}

FrameSequence repeat_loop(const FrameSequence& sequence, const LoopMatch& match, int times) {
    if (match.period <= 0 || match.length < match.period) return sequence;
    const size_t last = static_cast<size_t>(match.offset + match.repeats * match.period - 1);
    const size_t first = last + 1 - static_cast<size_t>(match.period);
    return repeat_range(sequence, first, last, times);
}

std::string loop_export_directory(const std::string& directory, int first_index, int last_index) {
    fs::path dir(directory);
    if (!dir.has_filename()) dir = dir.parent_path();
    std::string name = dir.filename().string();
    if (name.empty()) name = "frames";
    name += "_loop_" + std::to_string(first_index) + "_" + std::to_string(last_index);
    return (dir.parent_path() / name).string();
}

Result export_range(const FrameStore& store, const FrameSequence& sequence,
                    size_t first, size_t last, std::string& output_dir) {
    if (first > last || last >= sequence.size()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            "loop range " + std::to_string(first) + ".." + std::to_string(last) +
            " is outside a sequence of " + std::to_string(sequence.size()) + " frames");
    }
    output_dir = loop_export_directory(store.directory(), sequence[first].index, sequence[last].index);
    FrameStore target(output_dir);
    return target.write_sequence(extract_range(sequence, first, last), true);
}

Result repeat_range_in_place(const FrameStore& store, const FrameSequence& sequence,
                             size_t first, size_t last, int times) {
    if (first > last || last >= sequence.size() || times < 1) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            "cannot repeat range " + std::to_string(first) + ".." + std::to_string(last) +
            " of " + std::to_string(sequence.size()) + " frames " + std::to_string(times) + " times");
    }
    FrameSequence repeated = repeat_range(sequence, first, last, times);
    Result r = store.clear_frames();
    if (r.failure()) return r;
    return store.write_sequence(repeated, true);
}

}
