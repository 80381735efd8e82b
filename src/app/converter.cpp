#include "app/converter.hpp"
#include "media/preprocess.hpp"
#include "pipeline/image_io.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

namespace cascii {

namespace fs = std::filesystem;

std::string format_details(const Details& details) {
    std::ostringstream ss;
    ss << "Version: " << CASCII_VERSION << "\n"
       << "Frames: " << details.frames << "\n"
       << "Luminance: " << details.luminance << "\n"
       << "Font Ratio: " << details.font_ratio << "\n"
       << "Columns: " << details.columns;
    if (details.fps) {
        ss << "\nFPS: " << *details.fps;
    }
    return ss.str();
}

Result write_details(const std::string& directory, const Details& details) {
    return FrameStore::write_file((fs::path(directory) / DETAILS_FILENAME).string(), format_details(details));
}

std::string used_characters(const FrameSequence& sequence) {
    std::set<char> seen;
    for (const IndexedFrame& f : sequence) {
        for (const Cell& c : f.frame.cells()) {
            if (c.ch != ' ') seen.insert(c.ch);
        }
    }
    return std::string(seen.begin(), seen.end());
}

Converter::Converter(MediaToolkit& toolkit, const ConversionPipeline::Config& pipeline_config)
    : toolkit_(toolkit), pipeline_(pipeline_config) {}

Result Converter::convert_image(const std::string& input, const std::string& output_path,
                                const ConversionOptions& options, const std::string& preprocess_filter,
                                Frame& frame) {
    Result r = options.validate();
    if (r.failure()) return r;

    SourceFrame source;
    source.index = 1;
    source.path = input;
    r = load_image(input, source.pixels);
    if (r.failure()) return r;

    if (!preprocess_filter.empty()) {
        FrameBuffer filtered;
        r = toolkit_.filter_image(source.pixels, preprocess_filter, filtered);
        if (r.failure()) return Result::fail(r.error, input + ": " + r.message);
        source.pixels = std::move(filtered);
    }

    r = ConversionPipeline::convert_one(source, options, frame);
    if (r.failure()) return Result::fail(r.error, input + ": " + r.message);

    const fs::path out(output_path);
    if (out.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out.parent_path(), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR,
                "cannot create directory " + out.parent_path().string() + ": " + ec.message());
        }
    }

    r = FrameStore::write_file(output_path, encode_plain(frame));
    if (r.failure()) return r;
    if (frame.has_color()) {
        fs::path color_path = out;
        color_path.replace_extension(COLOR_EXTENSION);
        r = FrameStore::write_file(color_path.string(), encode_color(frame));
    }
    return r;
}

Result Converter::convert_directory(const std::string& input_dir, const std::string& output_dir,
                                    const ConversionOptions& options, bool keep_images,
                                    ConversionSummary& summary, const Progress& progress) {
    Result r = options.validate();
    if (r.failure()) return r;

    std::error_code ec;
    if (!fs::is_directory(fs::path(input_dir), ec)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "not a directory: " + input_dir);
    }

    std::vector<std::string> images;
    for (const auto& entry : fs::directory_iterator(fs::path(input_dir), ec)) {
        if (entry.is_regular_file(ec) && is_image_path(entry.path().string())) {
            images.push_back(entry.path().string());
        }
    }
    if (ec) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot list " + input_dir + ": " + ec.message());
    }
    if (images.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "no images found in " + input_dir);
    }
    std::sort(images.begin(), images.end());

    // frame_NNNN images keep their index; anything else is numbered by name order.
    std::vector<SourceFrame> sources(images.size());
    bool all_named = true;
    for (size_t i = 0; i < images.size(); ++i) {
        sources[i].path = images[i];
        int index = 0;
        if (!FrameStore::parse_frame_name(fs::path(images[i]).filename().string(), ".png", index)) {
            all_named = false;
        }
        sources[i].index = index;
    }
    if (all_named) {
        std::sort(sources.begin(), sources.end(),
                  [](const SourceFrame& a, const SourceFrame& b) { return a.index < b.index; });
        std::vector<int> indices;
        indices.reserve(sources.size());
        for (const SourceFrame& source : sources) indices.push_back(source.index);
        r = check_contiguous(indices, input_dir);
        if (r.failure()) return r;
    } else {
        for (size_t i = 0; i < sources.size(); ++i) {
            sources[i].index = static_cast<int>(i) + 1;
        }
    }

    Size first;
    r = probe_image(sources.front().path, first);
    if (r.failure()) return r;
    const Size grid = target_grid_size(first.width, first.height, options);

    FrameStore store(output_dir);
    r = store.prepare();
    if (r.failure()) return r;

    PipelineReport report = pipeline_.run(sources, options, &store, grid, progress);

    summary.output_dir = output_dir;
    summary.frames = report.converted();
    summary.failed = report.failed();
    summary.grid = grid;

    // Only images living in the output directory are ours to remove.
    if (!keep_images && fs::equivalent(fs::path(input_dir), fs::path(output_dir), ec)) {
        for (size_t i = 0; i < report.slots.size(); ++i) {
            if (report.slots[i].status.failure()) continue;
            const std::string& path = sources[i].path;
            fs::remove(fs::path(path), ec);
            if (ec) {
                return Result::fail(ErrorCode::IO_ERROR, "cannot remove " + path + ": " + ec.message());
            }
        }
    }
    return report.status;
}

Result Converter::run_batch(std::vector<SourceFrame>& batch, const ConversionOptions& options,
                            const FrameStore& store, std::optional<Size>& grid,
                            ConversionSummary& summary, size_t total, const Progress& progress) {
    if (batch.empty()) return Result::ok();

    if (!grid) {
        const FrameBuffer& px = batch.front().pixels;
        grid = target_grid_size(px.width(), px.height(), options);
        summary.grid = *grid;
    }

    const size_t base = summary.frames + summary.failed;
    ConversionPipeline::ProgressCallback batch_progress;
    if (progress) {
        batch_progress = [&](size_t done, size_t) {
            progress(base + done, std::max(total, base + done));
        };
    }

    PipelineReport report = pipeline_.run(batch, options, &store, grid, batch_progress);
    summary.frames += report.converted();
    summary.failed += report.failed();
    batch.clear();

    if (pipeline_.config().strict) return report.status;
    if (report.status.failure()) {
        std::cerr << "Warning: " << report.status.message << "\n";
    }
    return Result::ok();
}

Result Converter::convert_video(const VideoJob& job, const std::string& output_dir,
                                const ConversionOptions& options,
                                ConversionSummary& summary, const Progress& progress) {
    Result r = options.validate();
    if (r.failure()) return r;
    if (job.batch_size == 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "batch size must be positive");
    }
    if (job.request.fps <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "fps must be positive");
    }

    MediaInfo info;
    r = toolkit_.probe(job.request.source, info);
    if (r.failure()) return r;
    r = check_time_range(job.request.start, job.request.end, info.duration_seconds);
    if (r.failure()) return r;

    FrameStore store(output_dir);
    r = store.prepare();
    if (r.failure()) return r;
    r = store.clear();
    if (r.failure()) return r;

    // Expected frame count, only used to scale progress.
    size_t total = 0;
    if (info.duration_seconds > 0.0) {
        double span = info.duration_seconds;
        if (job.request.end) span = std::min(span, *job.request.end);
        if (job.request.start) span -= *job.request.start;
        if (span > 0.0) total = static_cast<size_t>(std::ceil(span * job.request.fps));
    }

    summary = ConversionSummary{};
    summary.output_dir = output_dir;

    std::optional<Size> grid;
    std::vector<SourceFrame> batch;
    batch.reserve(job.batch_size);

    r = toolkit_.extract_frames(job.request, [&](int index, FrameBuffer&& pixels) -> Result {
        if (job.keep_images) {
            Result saved = save_png(store.image_path(index), pixels);
            if (saved.failure()) return saved;
        }
        SourceFrame source;
        source.index = index;
        source.pixels = std::move(pixels);
        batch.push_back(std::move(source));
        if (batch.size() < job.batch_size) return Result::ok();
        return run_batch(batch, options, store, grid, summary, total, progress);
    });
    if (r.failure()) return r;

    r = run_batch(batch, options, store, grid, summary, total, progress);
    if (r.failure()) return r;

    if (job.extract_audio && info.has_audio) {
        const std::string audio_path = (fs::path(output_dir) / AUDIO_FILENAME).string();
        r = toolkit_.extract_audio(job.request.source, audio_path, job.request.start, job.request.end);
        if (r.failure()) return r;
        summary.audio_path = audio_path;
    }

    if (summary.failed > 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR,
            std::to_string(summary.failed) + " of " + std::to_string(summary.frames + summary.failed) +
            " frames failed");
    }
    return Result::ok();
}

Result Converter::render_video(const std::string& frames_dir, const VideoRenderOptions& options,
                               const Progress& progress) {
    Result r = options.validate();
    if (r.failure()) return r;
    if (options.output_target.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "render needs an output file");
    }

    FrameStore store(frames_dir);
    FrameSequence sequence;
    r = store.load_sequence(sequence);
    if (r.failure()) return r;
    if (sequence.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "no frames found in " + frames_dir);
    }

    FrameRenderer renderer(options);
    r = renderer.load_font(used_characters(sequence));
    if (r.failure()) return r;

    return render_sequence_to(sequence, renderer, progress);
}

Result Converter::render_sequence_to(const FrameSequence& sequence, FrameRenderer& renderer,
                                     const Progress& progress) {
    const VideoRenderOptions& options = renderer.options();
    if (sequence.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "nothing to render");
    }

    const fs::path target(options.output_target);
    std::string video_path = options.output_target;
    if (options.mux_audio) {
        fs::path tmp = target;
        tmp.replace_filename(target.stem().string() + ".video" + target.extension().string());
        video_path = tmp.string();
    }

    EncoderSettings settings;
    const Size size = renderer.output_size(sequence.front().frame);
    settings.width = size.width;
    settings.height = size.height;
    settings.fps = options.fps;
    settings.quality_factor = options.quality_factor;

    std::unique_ptr<FrameEncoder> encoder;
    Result r = toolkit_.open_encoder(video_path, settings, encoder);
    if (r.failure()) return r;

    r = render_sequence(renderer, sequence, *encoder, progress);
    encoder.reset();
    if (r.failure()) return r;

    if (!options.mux_audio) return Result::ok();

    r = toolkit_.mux_audio(video_path, options.audio_source, options.output_target);
    std::error_code ec;
    fs::remove(fs::path(video_path), ec);
    if (r.failure()) return r;
    if (ec) {
        std::cerr << "Warning: could not remove " << video_path << ": " << ec.message() << "\n";
    }
    return Result::ok();
}

}
