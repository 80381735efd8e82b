#include "render/video_encoder.hpp"
#include "media/ffmpeg_toolkit.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace cascii {

namespace {

bool ends_with_ci(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(value[offset + i]);
        unsigned char b = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

AVPixelFormat choose_pixel_format(const AVCodec* codec, bool gif_output) {
    const AVPixelFormat fallback = gif_output ? AV_PIX_FMT_RGB8 : AV_PIX_FMT_YUV420P;
    if (!codec) {
        return fallback;
    }

    const void* raw_formats = nullptr;
    int num_formats = 0;
    const int ret = avcodec_get_supported_config(
        nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &raw_formats, &num_formats);
    if (ret < 0 || !raw_formats || num_formats <= 0) {
        return fallback;
    }

    const auto* pix_fmts = static_cast<const AVPixelFormat*>(raw_formats);
    auto has_format = [&](AVPixelFormat fmt) -> bool {
        for (int i = 0; i < num_formats; ++i) {
            if (pix_fmts[i] == fmt) {
                return true;
            }
        }
        return false;
    };

    if (gif_output) {
        const AVPixelFormat preferred[] = {
            AV_PIX_FMT_RGB8,
            AV_PIX_FMT_BGR8,
            AV_PIX_FMT_PAL8
        };
        for (AVPixelFormat pf : preferred) {
            if (has_format(pf)) {
                return pf;
            }
        }
    } else if (has_format(AV_PIX_FMT_YUV420P)) {
        return AV_PIX_FMT_YUV420P;
    }

    return pix_fmts[0];
}

void push_codec_candidate(std::vector<const AVCodec*>& out, const AVCodec* codec) {
    if (!codec) {
        return;
    }
    for (const AVCodec* existing : out) {
        if (existing && codec->name && existing->name &&
            std::strcmp(existing->name, codec->name) == 0) {
            return;
        }
    }
    out.push_back(codec);
}

bool is_crf_codec(const AVCodec* codec) {
    return codec && codec->name &&
           (std::strcmp(codec->name, "libx264") == 0 || std::strcmp(codec->name, "libx265") == 0);
}

}  // namespace

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() {
    close();
}

int VideoEncoder::clamp_quality(int quality_factor) {
    return std::clamp(quality_factor, 0, 51);
}

int VideoEncoder::quantizer_for_quality(int quality_factor) {
    return 2 + (clamp_quality(quality_factor) * 29 + 25) / 51;
}

Result VideoEncoder::open(const std::string& filename, const EncoderSettings& settings) {
    close();
    if (settings.width <= 0 || settings.height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            "encoder size must be positive, got " + std::to_string(settings.width) + "x" + std::to_string(settings.height));
    }
    if (settings.fps <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "encoder fps must be positive");
    }

    settings_ = settings;
    settings_.quality_factor = clamp_quality(settings.quality_factor);
    filename_ = filename;
    output_is_gif_ = ends_with_ci(filename, ".gif");
    width_ = output_is_gif_ ? settings.width : settings.width + (settings.width & 1);
    height_ = output_is_gif_ ? settings.height : settings.height + (settings.height & 1);

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, filename.c_str());
    if (ret < 0 || !format_ctx_) {
        format_ctx_ = nullptr;
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "no container format for " + filename);
    }

    Result r = init_codec();
    if (r.failure()) {
        close();
        return r;
    }

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&format_ctx_->pb, filename.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            close();
            return Result::fail(ErrorCode::IO_ERROR, "cannot open " + filename + ": " + av_error_text(ret));
        }
    }

    ret = avformat_write_header(format_ctx_, nullptr);
    if (ret < 0) {
        close();
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR,
            "cannot write header for " + filename + ": " + av_error_text(ret));
    }
    header_written_ = true;
    return Result::ok();
}

void VideoEncoder::close() {
    if (format_ctx_) {
        if (codec_ctx_) {
            avcodec_free_context(&codec_ctx_);
        }

        if (!(format_ctx_->oformat->flags & AVFMT_NOFILE) && format_ctx_->pb) {
            avio_closep(&format_ctx_->pb);
        }

        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }

    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }

    if (frame_) {
        av_frame_free(&frame_);
    }

    if (pkt_) {
        av_packet_free(&pkt_);
    }

    if (sws_ctx_) {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = nullptr;
    }

    stream_ = nullptr;
    pts_ = 0;
    output_is_gif_ = false;
    header_written_ = false;
}

Result VideoEncoder::write(const FrameBuffer& frame) {
    if (!is_open() || !frame_) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "encoder for " + filename_ + " is not open");
    }
    if (frame.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "frame " + std::to_string(pts_ + 1) + " is empty");
    }

    if (av_frame_make_writable(frame_) < 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "encoder frame is not writable");
    }

    sws_ctx_ = sws_getCachedContext(
        sws_ctx_,
        frame.width(), frame.height(), AV_PIX_FMT_RGBA,
        width_, height_, codec_ctx_->pix_fmt,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );
    if (!sws_ctx_) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot create color converter for encoding");
    }

    const uint8_t* src_data[1] = { frame.data() };
    int src_linesize[1] = { frame.width() * 4 };

    sws_scale(sws_ctx_, src_data, src_linesize, 0, frame.height(),
              frame_->data, frame_->linesize);

    frame_->pts = pts_++;

    int ret = avcodec_send_frame(codec_ctx_, frame_);
    if (ret < 0) {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR,
            "encoding frame " + std::to_string(pts_) + " failed: " + av_error_text(ret));
    }
    return drain();
}

Result VideoEncoder::drain() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "encoder error: " + av_error_text(ret));
        }

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;

        ret = av_interleaved_write_frame(format_ctx_, pkt_);
        if (ret < 0) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot write packet to " + filename_ + ": " + av_error_text(ret));
        }
    }
    return Result::ok();
}

Result VideoEncoder::init_codec() {
    std::vector<const AVCodec*> candidates;
    if (output_is_gif_) {
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_GIF));
    } else {
        push_codec_candidate(candidates, avcodec_find_encoder_by_name(settings_.codec.c_str()));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("libx264"));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("libopenh264"));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("mpeg4"));
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_MPEG4));
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_H264));
    }
    if (candidates.empty()) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "no video encoder available for " + filename_);
    }

    const AVCodec* opened_codec = nullptr;
    for (const AVCodec* codec : candidates) {
        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) {
            continue;
        }

        codec_ctx_->width = width_;
        codec_ctx_->height = height_;
        codec_ctx_->time_base = {1, settings_.fps};
        codec_ctx_->framerate = {settings_.fps, 1};
        codec_ctx_->pix_fmt = choose_pixel_format(codec, output_is_gif_);
        codec_ctx_->gop_size = std::max(1, settings_.fps);

        if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        if (is_crf_codec(codec)) {
            av_opt_set(codec_ctx_->priv_data, "preset", settings_.preset.c_str(), 0);
            av_opt_set_int(codec_ctx_->priv_data, "crf", settings_.quality_factor, 0);
        } else if (!output_is_gif_) {
            const int q = quantizer_for_quality(settings_.quality_factor);
            codec_ctx_->flags |= AV_CODEC_FLAG_QSCALE;
            codec_ctx_->global_quality = FF_QP2LAMBDA * q;
            codec_ctx_->qmin = q;
            codec_ctx_->qmax = q;
        }

        int ret = avcodec_open2(codec_ctx_, codec, nullptr);
        if (ret >= 0) {
            opened_codec = codec;
            break;
        }
        avcodec_free_context(&codec_ctx_);
    }
    if (!opened_codec || !codec_ctx_) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "no video encoder could be opened for " + filename_);
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot add video stream");

    stream_->time_base = codec_ctx_->time_base;
    int ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
    if (ret < 0) return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot copy codec parameters: " + av_error_text(ret));

    frame_ = av_frame_alloc();
    if (!frame_) return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating frame");

    frame_->format = codec_ctx_->pix_fmt;
    frame_->width = codec_ctx_->width;
    frame_->height = codec_ctx_->height;

    ret = av_frame_get_buffer(frame_, 0);
    if (ret < 0) return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot allocate frame buffer: " + av_error_text(ret));

    pkt_ = av_packet_alloc();
    if (!pkt_) return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating packet");

    return Result::ok();
}

Result VideoEncoder::finish() {
    if (!is_open()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "encoder for " + filename_ + " is not open");
    }

    Result r = Result::ok();
    if (codec_ctx_) {
        const int ret = avcodec_send_frame(codec_ctx_, nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            r = Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "cannot flush encoder: " + av_error_text(ret));
        } else {
            r = drain();
        }
    }
    if (r.success() && header_written_) {
        const int ret = av_write_trailer(format_ctx_);
        if (ret < 0) {
            r = Result::fail(ErrorCode::IO_ERROR, "cannot finalize " + filename_ + ": " + av_error_text(ret));
        }
    }
    close();
    return r;
}

}
