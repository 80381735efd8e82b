#pragma once

#include "media/media_toolkit.hpp"
#include <string>

namespace cascii {

std::string av_error_text(int err);

// In-process MediaToolkit backed by libavformat, libavcodec and libavfilter.
class FFmpegToolkit : public MediaToolkit {
public:
    FFmpegToolkit();

    Result probe(const std::string& path, MediaInfo& info) override;
    Result extract_frames(const ExtractRequest& request, const FrameSink& sink) override;
    Result extract_audio(const std::string& source, const std::string& audio_path,
                         std::optional<double> start, std::optional<double> end) override;
    Result mux_audio(const std::string& video_path, const std::string& audio_path,
                     const std::string& output_path) override;
    Result open_encoder(const std::string& path, const EncoderSettings& settings,
                        std::unique_ptr<FrameEncoder>& encoder) override;
    Result filter_image(const FrameBuffer& input, const std::string& filter, FrameBuffer& output) override;
};

}
