#pragma once

#include "core/types.hpp"
#include "media/media_toolkit.hpp"
#include <string>
#include <memory>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;
}

namespace cascii {

class VideoEncoder : public FrameEncoder {
public:
    VideoEncoder();
    ~VideoEncoder() override;

    VideoEncoder(const VideoEncoder&) = delete;
    VideoEncoder& operator=(const VideoEncoder&) = delete;

    Result open(const std::string& filename, const EncoderSettings& settings);
    Result write(const FrameBuffer& frame) override;
    Result finish() override;
    void close();
    bool is_open() const { return format_ctx_ != nullptr; }

    // Encoded size; odd dimensions are rounded up for 4:2:0 formats.
    int width() const { return width_; }
    int height() const { return height_; }

    static int clamp_quality(int quality_factor);
    // Maps the 0..51 quality factor onto the 2..31 MPEG quantizer scale.
    static int quantizer_for_quality(int quality_factor);

private:
    Result init_codec();
    Result drain();

    EncoderSettings settings_;
    std::string filename_;
    int width_ = 0;
    int height_ = 0;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    int64_t pts_ = 0;
    bool output_is_gif_ = false;
    bool header_written_ = false;
};

}
