#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "codec/frame_store.hpp"
#include "mapping/char_mapper.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cascii {

struct SourceFrame {
    int index = 0;
    std::string path;
    // Decoded from path inside the worker when empty.
    FrameBuffer pixels;
};

struct FrameSlot {
    int index = 0;
    Frame frame;
    Result status;
};

struct PipelineReport {
    std::vector<FrameSlot> slots;
    Result status;

    size_t converted() const;
    size_t failed() const;
    std::vector<const FrameSlot*> failures() const;
};

class ConversionPipeline {
public:
    struct Config {
        int workers = 0;
        bool strict = false;
        bool text_companion = true;
        bool keep_frames = false;
    };

    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    ConversionPipeline() : ConversionPipeline(Config{}) {}
    explicit ConversionPipeline(const Config& config);

    const Config& config() const { return config_; }
    int worker_count(size_t jobs) const;

    // Converts every source into one slot at the same position. When store is
    // set each worker writes its own frame file. expected_grid, when set, is
    // enforced for every frame.
    PipelineReport run(const std::vector<SourceFrame>& sources,
                       const ConversionOptions& options,
                       const FrameStore* store,
                       std::optional<Size> expected_grid = std::nullopt,
                       const ProgressCallback& progress = {}) const;

    static Result convert_one(const SourceFrame& source, const ConversionOptions& options, Frame& out);

private:
    Config config_;
};

}
