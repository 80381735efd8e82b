#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "codec/frame_store.hpp"
#include "mapping/char_mapper.hpp"
#include "media/media_toolkit.hpp"
#include "pipeline/conversion_pipeline.hpp"
#include "render/frame_renderer.hpp"
#include <functional>
#include <optional>
#include <string>

#ifndef CASCII_VERSION
#define CASCII_VERSION "0.1.0"
#endif

namespace cascii {

constexpr const char* DETAILS_FILENAME = "details.md";
constexpr const char* AUDIO_FILENAME = "audio.mka";

struct VideoJob {
    ExtractRequest request;
    bool keep_images = false;
    bool extract_audio = false;
    // Extracted frames handed to the pipeline per run.
    size_t batch_size = 64;
};

struct ConversionSummary {
    std::string output_dir;
    size_t frames = 0;
    size_t failed = 0;
    Size grid;
    std::string audio_path;
};

struct Details {
    size_t frames = 0;
    int luminance = 0;
    float font_ratio = 0.0f;
    int columns = 0;
    std::optional<int> fps;
};

std::string format_details(const Details& details);
Result write_details(const std::string& directory, const Details& details);

// Distinct non-blank characters used anywhere in the sequence.
std::string used_characters(const FrameSequence& sequence);

class Converter {
public:
    using Progress = std::function<void(size_t done, size_t total)>;

    Converter(MediaToolkit& toolkit, const ConversionPipeline::Config& pipeline_config);

    const ConversionPipeline& pipeline() const { return pipeline_; }

    // Writes output_path (.txt). A colored frame also gets a .cframe beside it.
    Result convert_image(const std::string& input, const std::string& output_path,
                         const ConversionOptions& options, const std::string& preprocess_filter,
                         Frame& frame);

    // Converts every image in input_dir to frame_NNNN files in output_dir.
    Result convert_directory(const std::string& input_dir, const std::string& output_dir,
                             const ConversionOptions& options, bool keep_images,
                             ConversionSummary& summary, const Progress& progress = {});

    // Streams extracted frames through the pipeline in batches.
    Result convert_video(const VideoJob& job, const std::string& output_dir,
                         const ConversionOptions& options,
                         ConversionSummary& summary, const Progress& progress = {});

    // Renders the frames in frames_dir to options.output_target.
    Result render_video(const std::string& frames_dir, const VideoRenderOptions& options,
                        const Progress& progress = {});

    // Encodes an already loaded sequence with a prepared renderer, then muxes
    // audio when requested.
    Result render_sequence_to(const FrameSequence& sequence, FrameRenderer& renderer,
                              const Progress& progress = {});

private:
    Result run_batch(std::vector<SourceFrame>& batch, const ConversionOptions& options,
                     const FrameStore& store, std::optional<Size>& grid,
                     ConversionSummary& summary, size_t total, const Progress& progress);

    MediaToolkit& toolkit_;
    ConversionPipeline pipeline_;
};

}
