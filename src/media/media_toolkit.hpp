#pragma once

#include "core/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace cascii {

struct MediaInfo {
    int width = 0;
    int height = 0;
    double duration_seconds = 0.0;
    double fps = 0.0;
    bool has_audio = false;
};

struct ExtractRequest {
    std::string source;
    int fps = 30;
    std::optional<double> start;
    std::optional<double> end;
    // Output width in pixels; height follows the aspect ratio, rounded to even.
    int columns = 400;
    std::string preprocess_filter;
};

// Receives frames in order with 1-based indices. A failure stops extraction.
using FrameSink = std::function<Result(int index, FrameBuffer&& pixels)>;

struct EncoderSettings {
    int width = 0;
    int height = 0;
    int fps = 30;
    // 0 is best, 51 is worst (x264 CRF scale).
    int quality_factor = 18;
    std::string codec = "libx264";
    std::string preset = "medium";
};

class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;

    virtual Result write(const FrameBuffer& frame) = 0;
    // Flushes and closes the container. Further writes fail.
    virtual Result finish() = 0;
};

// Probing, frame extraction, audio handling and container encoding.
class MediaToolkit {
public:
    virtual ~MediaToolkit() = default;

    virtual Result probe(const std::string& path, MediaInfo& info) = 0;
    virtual Result extract_frames(const ExtractRequest& request, const FrameSink& sink) = 0;
    virtual Result extract_audio(const std::string& source, const std::string& audio_path,
                                 std::optional<double> start, std::optional<double> end) = 0;
    virtual Result mux_audio(const std::string& video_path, const std::string& audio_path,
                             const std::string& output_path) = 0;
    virtual Result open_encoder(const std::string& path, const EncoderSettings& settings,
                                std::unique_ptr<FrameEncoder>& encoder) = 0;
    // Runs one still image through a filter chain.
    virtual Result filter_image(const FrameBuffer& input, const std::string& filter, FrameBuffer& output) = 0;
};

}
