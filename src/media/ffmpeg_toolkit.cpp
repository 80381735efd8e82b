#include "media/ffmpeg_toolkit.hpp"
#include "media/preprocess.hpp"
#include "render/video_encoder.hpp"

#include <cmath>
#include <filesystem>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
}

namespace cascii {

namespace {

struct InputFile {
    AVFormatContext* format_ctx = nullptr;

    ~InputFile() { close(); }

    void close() {
        if (format_ctx) avformat_close_input(&format_ctx);
        format_ctx = nullptr;
    }
};

struct OutputFile {
    AVFormatContext* format_ctx = nullptr;
    bool header_written = false;

    ~OutputFile() { close(); }

    void close() {
        if (!format_ctx) return;
        if (!(format_ctx->oformat->flags & AVFMT_NOFILE) && format_ctx->pb) {
            avio_closep(&format_ctx->pb);
        }
        avformat_free_context(format_ctx);
        format_ctx = nullptr;
    }
};

struct VideoDecoder {
    AVCodecContext* codec_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    AVFrame* filtered = nullptr;
    int stream_idx = -1;

    ~VideoDecoder() { close(); }

    void close() {
        if (filtered) av_frame_free(&filtered);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        filtered = nullptr;
        frame = nullptr;
        packet = nullptr;
        codec_ctx = nullptr;
        stream_idx = -1;
    }
};

struct FilterGraph {
    AVFilterGraph* graph = nullptr;
    AVFilterContext* src_ctx = nullptr;
    AVFilterContext* sink_ctx = nullptr;

    ~FilterGraph() { close(); }

    void close() {
        if (graph) avfilter_graph_free(&graph);
        graph = nullptr;
        src_ctx = nullptr;
        sink_ctx = nullptr;
    }
};

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec);
}

void quiet_logging() {
    static bool configured = false;
    if (!configured) {
        av_log_set_level(AV_LOG_ERROR);
        configured = true;
    }
}

Result open_input(const std::string& path, InputFile& input) {
    if (!file_exists(path)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "input not found: " + path);
    }
    int ret = avformat_open_input(&input.format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        input.format_ctx = nullptr;
        return Result::fail(ErrorCode::DECODE_ERROR, "cannot open " + path + ": " + av_error_text(ret));
    }
    ret = avformat_find_stream_info(input.format_ctx, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::DECODE_ERROR, "cannot read stream info of " + path + ": " + av_error_text(ret));
    }
    return Result::ok();
}

Result open_decoder(const std::string& path, AVFormatContext* format_ctx, VideoDecoder& dec) {
    const AVCodec* codec = nullptr;
    dec.stream_idx = av_find_best_stream(format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (dec.stream_idx == AVERROR_DECODER_NOT_FOUND) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "no decoder available for the video stream of " + path);
    }
    if (dec.stream_idx < 0 || !codec) {
        return Result::fail(ErrorCode::DECODE_ERROR, "no video stream in " + path);
    }

    AVStream* stream = format_ctx->streams[dec.stream_idx];
    dec.codec_ctx = avcodec_alloc_context3(codec);
    if (!dec.codec_ctx) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating decoder");
    }
    int ret = avcodec_parameters_to_context(dec.codec_ctx, stream->codecpar);
    if (ret < 0) {
        return Result::fail(ErrorCode::DECODE_ERROR, "bad codec parameters in " + path + ": " + av_error_text(ret));
    }
    dec.codec_ctx->thread_count = 0;
    ret = avcodec_open2(dec.codec_ctx, codec, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND,
            std::string("cannot open decoder ") + codec->name + " for " + path + ": " + av_error_text(ret));
    }

    dec.packet = av_packet_alloc();
    dec.frame = av_frame_alloc();
    dec.filtered = av_frame_alloc();
    if (!dec.packet || !dec.frame || !dec.filtered) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating decoder frames");
    }
    return Result::ok();
}

// buffer -> <chain>,format=rgb24 -> buffersink
Result build_filter_graph(FilterGraph& fg, int width, int height, int pix_fmt,
                          AVRational time_base, AVRational sample_aspect, const std::string& chain) {
    fg.graph = avfilter_graph_alloc();
    if (!fg.graph) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating filter graph");
    }

    const AVFilter* buffer = avfilter_get_by_name("buffer");
    const AVFilter* sink = avfilter_get_by_name("buffersink");
    if (!buffer || !sink) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "libavfilter lacks the buffer/buffersink filters");
    }

    if (sample_aspect.num <= 0 || sample_aspect.den <= 0) sample_aspect = {1, 1};
    const std::string args =
        "video_size=" + std::to_string(width) + "x" + std::to_string(height) +
        ":pix_fmt=" + std::to_string(pix_fmt) +
        ":time_base=" + std::to_string(time_base.num) + "/" + std::to_string(time_base.den) +
        ":pixel_aspect=" + std::to_string(sample_aspect.num) + "/" + std::to_string(sample_aspect.den);

    int ret = avfilter_graph_create_filter(&fg.src_ctx, buffer, "in", args.c_str(), nullptr, fg.graph);
    if (ret < 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot create buffer source: " + av_error_text(ret));
    }
    ret = avfilter_graph_create_filter(&fg.sink_ctx, sink, "out", nullptr, nullptr, fg.graph);
    if (ret < 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot create buffer sink: " + av_error_text(ret));
    }

    AVFilterInOut* outputs = avfilter_inout_alloc();
    AVFilterInOut* inputs = avfilter_inout_alloc();
    if (!outputs || !inputs) {
        avfilter_inout_free(&outputs);
        avfilter_inout_free(&inputs);
        return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating filter pads");
    }
    outputs->name = av_strdup("in");
    outputs->filter_ctx = fg.src_ctx;
    outputs->pad_idx = 0;
    outputs->next = nullptr;
    inputs->name = av_strdup("out");
    inputs->filter_ctx = fg.sink_ctx;
    inputs->pad_idx = 0;
    inputs->next = nullptr;

    const std::string full = (chain.empty() ? std::string("null") : chain) + ",format=rgb24";
    ret = avfilter_graph_parse_ptr(fg.graph, full.c_str(), &inputs, &outputs, nullptr);
    avfilter_inout_free(&inputs);
    avfilter_inout_free(&outputs);
    if (ret == AVERROR_FILTER_NOT_FOUND) {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "filter chain '" + full + "' uses an unavailable filter");
    }
    if (ret < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid filter chain '" + full + "': " + av_error_text(ret));
    }

    ret = avfilter_graph_config(fg.graph, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cannot configure filter chain '" + full + "': " + av_error_text(ret));
    }
    return Result::ok();
}

FrameBuffer frame_to_buffer(const AVFrame* rgb) {
    return FrameBuffer::from_rgb(rgb->data[0], rgb->width, rgb->height, rgb->linesize[0]);
}

// Pulls every frame the sink has ready. Returns false with r set when the
// frame sink fails or libavfilter reports an error.
bool drain_sink(FilterGraph& fg, AVFrame* filtered, const FrameSink& sink, int& index, Result& r) {
    while (true) {
        int ret = av_buffersink_get_frame(fg.sink_ctx, filtered);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) {
            r = Result::fail(ErrorCode::DECODE_ERROR, "filter graph error: " + av_error_text(ret));
            return false;
        }
        FrameBuffer pixels = frame_to_buffer(filtered);
        av_frame_unref(filtered);
        r = sink(++index, std::move(pixels));
        if (r.failure()) return false;
    }
}

double stream_time(const AVStream* stream, int64_t ts) {
    if (ts == AV_NOPTS_VALUE) return 0.0;
    const int64_t origin = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    return static_cast<double>(ts - origin) * av_q2d(stream->time_base);
}

Result copy_packets(AVFormatContext* in, int stream_idx, AVFormatContext* out, AVStream* out_stream,
                    std::optional<double> start, std::optional<double> end, int64_t& written) {
    AVPacket* pkt = av_packet_alloc();
    if (!pkt) return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating packet");

    AVStream* in_stream = in->streams[stream_idx];
    const int64_t offset = start
        ? av_rescale_q(static_cast<int64_t>(*start * AV_TIME_BASE), AV_TIME_BASE_Q, in_stream->time_base)
        : 0;
    const int64_t origin = in_stream->start_time != AV_NOPTS_VALUE ? in_stream->start_time : 0;

    Result r = Result::ok();
    while (av_read_frame(in, pkt) >= 0) {
        if (pkt->stream_index != stream_idx) {
            av_packet_unref(pkt);
            continue;
        }
        const double t = stream_time(in_stream, pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts);
        if (start && t < *start) {
            av_packet_unref(pkt);
            continue;
        }
        if (end && t >= *end) {
            av_packet_unref(pkt);
            break;
        }
        if (pkt->pts != AV_NOPTS_VALUE) pkt->pts -= origin + offset;
        if (pkt->dts != AV_NOPTS_VALUE) pkt->dts -= origin + offset;
        av_packet_rescale_ts(pkt, in_stream->time_base, out_stream->time_base);
        pkt->stream_index = out_stream->index;
        pkt->pos = -1;
        const int ret = av_interleaved_write_frame(out, pkt);
        if (ret < 0) {
            r = Result::fail(ErrorCode::IO_ERROR, "cannot write packet: " + av_error_text(ret));
            break;
        }
        ++written;
    }
    av_packet_free(&pkt);
    return r;
}

Result open_output(const std::string& path, OutputFile& output) {
    int ret = avformat_alloc_output_context2(&output.format_ctx, nullptr, nullptr, path.c_str());
    if (ret < 0 || !output.format_ctx) {
        output.format_ctx = nullptr;
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "no container format for " + path);
    }
    return Result::ok();
}

Result add_copy_stream(OutputFile& output, const AVStream* in_stream, AVStream*& out_stream) {
    out_stream = avformat_new_stream(output.format_ctx, nullptr);
    if (!out_stream) return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot add output stream");
    int ret = avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar);
    if (ret < 0) return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot copy stream parameters: " + av_error_text(ret));
    out_stream->codecpar->codec_tag = 0;
    out_stream->time_base = in_stream->time_base;
    return Result::ok();
}

Result begin_output(const std::string& path, OutputFile& output) {
    if (!(output.format_ctx->oformat->flags & AVFMT_NOFILE)) {
        int ret = avio_open(&output.format_ctx->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) return Result::fail(ErrorCode::IO_ERROR, "cannot open " + path + ": " + av_error_text(ret));
    }
    int ret = avformat_write_header(output.format_ctx, nullptr);
    if (ret < 0) {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR,
            "container " + std::string(output.format_ctx->oformat->name) + " rejects these streams: " + av_error_text(ret));
    }
    output.header_written = true;
    return Result::ok();
}

Result end_output(const std::string& path, OutputFile& output) {
    int ret = av_write_trailer(output.format_ctx);
    if (ret < 0) return Result::fail(ErrorCode::IO_ERROR, "cannot finalize " + path + ": " + av_error_text(ret));
    return Result::ok();
}

}  // namespace

std::string av_error_text(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

FFmpegToolkit::FFmpegToolkit() {
    quiet_logging();
}

Result FFmpegToolkit::probe(const std::string& path, MediaInfo& info) {
    InputFile input;
    Result r = open_input(path, input);
    if (r.failure()) return r;

    info = MediaInfo{};
    const int video_idx = av_find_best_stream(input.format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_idx < 0) {
        return Result::fail(ErrorCode::DECODE_ERROR, "no video stream in " + path);
    }
    const AVStream* stream = input.format_ctx->streams[video_idx];
    info.width = stream->codecpar->width;
    info.height = stream->codecpar->height;

    AVRational fr = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    info.fps = (fr.num > 0 && fr.den > 0) ? av_q2d(fr) : 0.0;

    if (input.format_ctx->duration != AV_NOPTS_VALUE) {
        info.duration_seconds = static_cast<double>(input.format_ctx->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE) {
        info.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    info.has_audio = av_find_best_stream(input.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;
    return Result::ok();
}

Result FFmpegToolkit::extract_frames(const ExtractRequest& request, const FrameSink& sink) {
    if (request.fps <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "extraction fps must be positive");
    }
    if (request.columns <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "extraction width must be positive");
    }

    InputFile input;
    Result r = open_input(request.source, input);
    if (r.failure()) return r;

    const double duration = input.format_ctx->duration != AV_NOPTS_VALUE
        ? static_cast<double>(input.format_ctx->duration) / AV_TIME_BASE : 0.0;
    r = check_time_range(request.start, request.end, duration);
    if (r.failure()) return r;

    VideoDecoder dec;
    r = open_decoder(request.source, input.format_ctx, dec);
    if (r.failure()) return r;
    AVStream* stream = input.format_ctx->streams[dec.stream_idx];

    FilterGraph fg;
    r = build_filter_graph(fg, dec.codec_ctx->width, dec.codec_ctx->height, dec.codec_ctx->pix_fmt,
                           stream->time_base, dec.codec_ctx->sample_aspect_ratio,
                           build_frame_extraction_vf(request.columns, request.fps, request.preprocess_filter));
    if (r.failure()) return r;

    if (request.start && *request.start > 0.0) {
        int64_t target = static_cast<int64_t>(*request.start * AV_TIME_BASE);
        if (input.format_ctx->start_time != AV_NOPTS_VALUE) target += input.format_ctx->start_time;
        const int ret = av_seek_frame(input.format_ctx, -1, target, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            return Result::fail(ErrorCode::INVALID_TIME_RANGE,
                "cannot seek to " + std::to_string(*request.start) + "s in " + request.source + ": " + av_error_text(ret));
        }
        avcodec_flush_buffers(dec.codec_ctx);
    }

    int index = 0;
    bool reached_end = false;

    // Returns false when extraction must stop; r then holds the outcome.
    auto push_decoded = [&]() -> bool {
        while (true) {
            int ret = avcodec_receive_frame(dec.codec_ctx, dec.frame);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
            if (ret < 0) {
                r = Result::fail(ErrorCode::DECODE_ERROR,
                    "decoding " + request.source + " failed after frame " + std::to_string(index) + ": " + av_error_text(ret));
                return false;
            }

            dec.frame->pts = dec.frame->best_effort_timestamp;
            const double t = stream_time(stream, dec.frame->pts);
            if (request.start && t < *request.start) {
                av_frame_unref(dec.frame);
                continue;
            }
            if (request.end && t >= *request.end) {
                av_frame_unref(dec.frame);
                reached_end = true;
                return true;
            }

            ret = av_buffersrc_add_frame_flags(fg.src_ctx, dec.frame, AV_BUFFERSRC_FLAG_KEEP_REF);
            av_frame_unref(dec.frame);
            if (ret < 0) {
                r = Result::fail(ErrorCode::DECODE_ERROR, "cannot feed filter graph: " + av_error_text(ret));
                return false;
            }
            if (!drain_sink(fg, dec.filtered, sink, index, r)) return false;
        }
    };

    while (!reached_end) {
        int ret = av_read_frame(input.format_ctx, dec.packet);
        if (ret == AVERROR_EOF) break;
        if (ret < 0) {
            return Result::fail(ErrorCode::DECODE_ERROR, "cannot read " + request.source + ": " + av_error_text(ret));
        }
        if (dec.packet->stream_index != dec.stream_idx) {
            av_packet_unref(dec.packet);
            continue;
        }
        ret = avcodec_send_packet(dec.codec_ctx, dec.packet);
        av_packet_unref(dec.packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            return Result::fail(ErrorCode::DECODE_ERROR,
                "corrupt packet in " + request.source + " after frame " + std::to_string(index) + ": " + av_error_text(ret));
        }
        if (!push_decoded()) return r;
    }

    if (!reached_end) {
        const int ret = avcodec_send_packet(dec.codec_ctx, nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            return Result::fail(ErrorCode::DECODE_ERROR, "cannot flush decoder: " + av_error_text(ret));
        }
        if (!push_decoded()) return r;
    }

    int ret = av_buffersrc_add_frame_flags(fg.src_ctx, nullptr, 0);
    if (ret < 0) {
        return Result::fail(ErrorCode::DECODE_ERROR, "cannot flush filter graph: " + av_error_text(ret));
    }
    if (!drain_sink(fg, dec.filtered, sink, index, r)) return r;

    if (index == 0) {
        if (request.start || request.end) {
            return Result::fail(ErrorCode::INVALID_TIME_RANGE, "no frames in the requested range of " + request.source);
        }
        return Result::fail(ErrorCode::DECODE_ERROR, "no frames decoded from " + request.source);
    }
    return Result::ok();
}

Result FFmpegToolkit::extract_audio(const std::string& source, const std::string& audio_path,
                                    std::optional<double> start, std::optional<double> end) {
    InputFile input;
    Result r = open_input(source, input);
    if (r.failure()) return r;

    const int audio_idx = av_find_best_stream(input.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, source + " has no audio stream");
    }

    if (start && *start > 0.0) {
        int64_t target = static_cast<int64_t>(*start * AV_TIME_BASE);
        if (input.format_ctx->start_time != AV_NOPTS_VALUE) target += input.format_ctx->start_time;
        const int ret = av_seek_frame(input.format_ctx, -1, target, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            return Result::fail(ErrorCode::INVALID_TIME_RANGE, "cannot seek audio of " + source + ": " + av_error_text(ret));
        }
    }

    OutputFile output;
    r = open_output(audio_path, output);
    if (r.failure()) return r;
    AVStream* out_stream = nullptr;
    r = add_copy_stream(output, input.format_ctx->streams[audio_idx], out_stream);
    if (r.failure()) return r;
    r = begin_output(audio_path, output);
    if (r.failure()) return r;

    int64_t written = 0;
    r = copy_packets(input.format_ctx, audio_idx, output.format_ctx, out_stream, start, end, written);
    if (r.failure()) return r;
    if (written == 0) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE, "no audio in the requested range of " + source);
    }
    return end_output(audio_path, output);
}

Result FFmpegToolkit::mux_audio(const std::string& video_path, const std::string& audio_path,
                                const std::string& output_path) {
    InputFile video;
    Result r = open_input(video_path, video);
    if (r.failure()) return r;
    InputFile audio;
    r = open_input(audio_path, audio);
    if (r.failure()) return r;

    const int video_idx = av_find_best_stream(video.format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    const int audio_idx = av_find_best_stream(audio.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (video_idx < 0) return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "no video stream in " + video_path);
    if (audio_idx < 0) return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "no audio stream in " + audio_path);

    OutputFile output;
    r = open_output(output_path, output);
    if (r.failure()) return r;
    AVStream* out_video = nullptr;
    AVStream* out_audio = nullptr;
    r = add_copy_stream(output, video.format_ctx->streams[video_idx], out_video);
    if (r.failure()) return r;
    r = add_copy_stream(output, audio.format_ctx->streams[audio_idx], out_audio);
    if (r.failure()) return r;
    r = begin_output(output_path, output);
    if (r.failure()) return r;

    AVPacket* vpkt = av_packet_alloc();
    AVPacket* apkt = av_packet_alloc();
    if (!vpkt || !apkt) {
        av_packet_free(&vpkt);
        av_packet_free(&apkt);
        return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating packets");
    }

    // Reads the next packet of the wanted stream; false at end of input.
    auto next_packet = [](AVFormatContext* ctx, int idx, AVPacket* pkt) {
        while (av_read_frame(ctx, pkt) >= 0) {
            if (pkt->stream_index == idx) return true;
            av_packet_unref(pkt);
        }
        return false;
    };

    const AVStream* in_video = video.format_ctx->streams[video_idx];
    const AVStream* in_audio = audio.format_ctx->streams[audio_idx];
    bool have_video = next_packet(video.format_ctx, video_idx, vpkt);
    bool have_audio = next_packet(audio.format_ctx, audio_idx, apkt);
    const double video_end = [&]() {
        const AVFormatContext* ctx = video.format_ctx;
        return ctx->duration != AV_NOPTS_VALUE ? static_cast<double>(ctx->duration) / AV_TIME_BASE : 0.0;
    }();

    while (r.success() && (have_video || have_audio)) {
        bool take_video = have_video;
        if (have_video && have_audio) {
            take_video = av_compare_ts(vpkt->dts, in_video->time_base, apkt->dts, in_audio->time_base) <= 0;
        }

        AVPacket* pkt = take_video ? vpkt : apkt;
        const AVStream* in_stream = take_video ? in_video : in_audio;
        AVStream* out_stream = take_video ? out_video : out_audio;

        // Audio longer than the rendered video is cut at the video's end.
        if (!take_video && video_end > 0.0 && stream_time(in_stream, pkt->pts) >= video_end) {
            av_packet_unref(pkt);
            have_audio = false;
            continue;
        }

        av_packet_rescale_ts(pkt, in_stream->time_base, out_stream->time_base);
        pkt->stream_index = out_stream->index;
        pkt->pos = -1;
        const int ret = av_interleaved_write_frame(output.format_ctx, pkt);
        if (ret < 0) {
            r = Result::fail(ErrorCode::IO_ERROR, "cannot write " + output_path + ": " + av_error_text(ret));
            break;
        }

        if (take_video) {
            have_video = next_packet(video.format_ctx, video_idx, vpkt);
        } else {
            have_audio = next_packet(audio.format_ctx, audio_idx, apkt);
        }
    }

    av_packet_free(&vpkt);
    av_packet_free(&apkt);
    if (r.failure()) return r;
    return end_output(output_path, output);
}

Result FFmpegToolkit::open_encoder(const std::string& path, const EncoderSettings& settings,
                                   std::unique_ptr<FrameEncoder>& encoder) {
    auto video = std::make_unique<VideoEncoder>();
    Result r = video->open(path, settings);
    if (r.failure()) return r;
    encoder = std::move(video);
    return Result::ok();
}

Result FFmpegToolkit::filter_image(const FrameBuffer& input, const std::string& filter, FrameBuffer& output) {
    if (input.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cannot filter an empty image");
    }

    FilterGraph fg;
    Result r = build_filter_graph(fg, input.width(), input.height(), AV_PIX_FMT_RGBA,
                                  AVRational{1, 25}, AVRational{1, 1}, filter);
    if (r.failure()) return r;

    AVFrame* frame = av_frame_alloc();
    if (!frame) return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating frame");
    frame->format = AV_PIX_FMT_RGBA;
    frame->width = input.width();
    frame->height = input.height();
    frame->pts = 0;
    int ret = av_frame_get_buffer(frame, 0);
    if (ret < 0) {
        av_frame_free(&frame);
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot allocate frame: " + av_error_text(ret));
    }
    av_image_copy_plane(frame->data[0], frame->linesize[0], input.data(), input.width() * 4,
                        input.width() * 4, input.height());

    ret = av_buffersrc_add_frame_flags(fg.src_ctx, frame, 0);
    av_frame_free(&frame);
    if (ret >= 0) ret = av_buffersrc_add_frame_flags(fg.src_ctx, nullptr, 0);
    if (ret < 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot feed filter graph: " + av_error_text(ret));
    }

    AVFrame* filtered = av_frame_alloc();
    if (!filtered) return Result::fail(ErrorCode::PROCESSING_ERROR, "out of memory allocating frame");
    ret = av_buffersink_get_frame(fg.sink_ctx, filtered);
    if (ret < 0) {
        av_frame_free(&filtered);
        return Result::fail(ErrorCode::PROCESSING_ERROR, "filter '" + filter + "' produced no image: " + av_error_text(ret));
    }
    output = frame_to_buffer(filtered);
    av_frame_free(&filtered);
    return Result::ok();
}

}
