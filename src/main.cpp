#include "core/types.hpp"
#include "core/config.hpp"
#include "codec/frame_store.hpp"
#include "analysis/loop_detector.hpp"
#include "analysis/grid_trimmer.hpp"
#include "app/converter.hpp"
#include "media/ffmpeg_toolkit.hpp"
#include "media/preprocess.hpp"
#include "pipeline/image_io.hpp"
#include "cli/args.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <optional>

namespace cascii {
namespace {

namespace fs = std::filesystem;

int fail(const Result& r) {
    std::cerr << "Error: " << r.message << "\n";
    return 1;
}

int fail(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    return 1;
}

void print_progress(size_t done, size_t total) {
    if (total == 0) return;
    const double pct = 100.0 * static_cast<double>(done) / static_cast<double>(total);
    std::cout << "\r  " << done << "/" << total << " ("
              << std::fixed << std::setprecision(1) << pct << "%)" << std::flush;
    if (done == total) std::cout << "\n";
}

Result parse_time_option(const std::string& text, const char* name, std::optional<double>& out) {
    out.reset();
    if (text.empty()) return Result::ok();
    out = parse_timestamp(text);
    if (!out) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE,
            std::string(name) + " '" + text + "' is not a timestamp (SS, SS.mmm, MM:SS or HH:MM:SS.mmm)");
    }
    return Result::ok();
}

int run_convert(const Config& config, const Args& args, bool verbose) {
    const fs::path input(args.input);
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        return fail("input path does not exist: " + args.input);
    }

    ConversionOptions options;
    Result r = config.conversion_options(options);
    if (r.failure()) return fail(r);

    std::string filter;
    std::optional<std::string> raw_filter;
    std::optional<std::string> preset_name;
    if (!config.video.preprocess.empty() || args.preprocess_set) raw_filter = config.video.preprocess;
    if (!config.video.preprocess_preset.empty()) preset_name = config.video.preprocess_preset;
    r = resolve_preprocess_filter(raw_filter, preset_name, filter);
    if (r.failure()) return fail(r);

    fs::path output = args.output.empty() ? fs::path(".") : fs::path(args.output);
    const bool is_file = fs::is_regular_file(input, ec);
    if (is_file) {
        output /= input.stem();
    }

    ConversionPipeline::Config pipeline_cfg;
    pipeline_cfg.workers = config.pipeline.workers;
    pipeline_cfg.strict = config.pipeline.strict;

    FFmpegToolkit toolkit;
    Converter converter(toolkit, pipeline_cfg);

    if (verbose) {
        std::cout << "Columns: " << config.columns() << ", font ratio: " << config.font_ratio()
                  << ", luminance: " << config.luminance() << ", palette: " << options.palette.size()
                  << " characters" << (options.color ? ", color" : "") << "\n";
        if (!filter.empty()) std::cout << "Preprocess: " << filter << "\n";
    }

    Details details;
    details.luminance = config.luminance();
    details.font_ratio = config.font_ratio();
    details.columns = config.columns();

    if (is_file && is_image_path(args.input)) {
        std::cout << "Converting image to ASCII...\n";
        const fs::path out_txt = output / (input.stem().string() + PLAIN_EXTENSION);
        Frame frame;
        r = converter.convert_image(args.input, out_txt.string(), options, filter, frame);
        if (r.failure()) return fail(r);
        details.frames = 1;
        if (verbose) {
            std::cout << "Grid: " << frame.width() << "x" << frame.height() << "\n";
        }
    } else if (is_file) {
        VideoJob job;
        job.request.source = args.input;
        job.request.fps = config.fps();
        job.request.columns = config.columns();
        job.request.preprocess_filter = filter;
        r = parse_time_option(config.video.start, "start", job.request.start);
        if (r.failure()) return fail(r);
        r = parse_time_option(config.video.end, "end", job.request.end);
        if (r.failure()) return fail(r);
        job.keep_images = config.video.keep_images;
        job.extract_audio = config.video.extract_audio;
        job.batch_size = static_cast<size_t>(config.pipeline.batch_size);

        std::cout << "Extracting and converting video frames...\n";
        ConversionSummary summary;
        r = converter.convert_video(job, output.string(), options, summary, print_progress);
        details.frames = summary.frames;
        details.fps = job.request.fps;
        if (r.failure()) {
            if (summary.frames == 0) return fail(r);
            std::cerr << "Error: " << r.message << "\n";
        }
        if (verbose) {
            std::cout << "Grid: " << summary.grid.width << "x" << summary.grid.height << "\n";
            if (!summary.audio_path.empty()) std::cout << "Audio: " << summary.audio_path << "\n";
        }
        if (r.failure()) return 1;
    } else {
        std::cout << "Converting directory of images...\n";
        ConversionSummary summary;
        r = converter.convert_directory(args.input, output.string(), options,
                                        config.video.keep_images, summary, print_progress);
        details.frames = summary.frames;
        if (r.failure()) return fail(r);
    }

    std::cout << "\nASCII generation complete in " << output.string() << "\n";

    r = write_details(output.string(), details);
    if (r.failure()) return fail(r);
    if (args.log_details) {
        std::cout << "\n--- Generation Details ---\n" << format_details(details) << "\n";
    }
    return 0;
}

int run_find_loop(const Args& args) {
    FrameStore store(args.input);
    FrameSequence sequence;
    Result r = store.load_sequence(sequence);
    if (r.failure()) return fail(r);

    LoopDetector detector;
    std::optional<LoopMatch> match;
    r = detector.find(sequence, match);
    if (r.failure()) return fail(r);
    const std::vector<FramePair> pairs = detector.repeated_pairs(sequence);

    if (match) {
        std::cout << "Loop: frames " << sequence[match->offset].index << ".."
                  << sequence[match->end() - 1].index << " (period " << match->period
                  << ", " << match->repeats << " repeats)\n";
    } else {
        std::cout << "No loop found.\n";
    }
    if (pairs.empty()) {
        std::cout << "No repeated frames detected.\n";
    } else {
        std::cout << "Repeated frame pairs:\n";
        for (size_t i = 0; i < pairs.size(); ++i) {
            std::cout << "  " << (i + 1) << ": frames " << sequence[pairs[i].first].index
                      << ".." << sequence[pairs[i].second].index << "\n";
        }
    }

    if (args.loop_action == LoopAction::List) return 0;

    size_t first = 0;
    size_t last = 0;
    if (args.loop_choice == 0) {
        if (!match) return fail("no loop detected in " + args.input);
        if (args.loop_action == LoopAction::Export) {
            first = static_cast<size_t>(match->offset);
            last = first + static_cast<size_t>(match->period) - 1;
        } else {
            last = static_cast<size_t>(match->offset + match->repeats * match->period - 1);
            first = last + 1 - static_cast<size_t>(match->period);
        }
    } else {
        if (static_cast<size_t>(args.loop_choice) > pairs.size()) {
            return fail("loop " + std::to_string(args.loop_choice) + " does not exist; " +
                        std::to_string(pairs.size()) + " pairs were found");
        }
        first = pairs[args.loop_choice - 1].first;
        last = pairs[args.loop_choice - 1].second;
    }

    if (args.loop_action == LoopAction::Export) {
        std::string output_dir;
        r = export_range(store, sequence, first, last, output_dir);
        if (r.failure()) return fail(r);
        std::cout << "Exported " << (last - first + 1) << " frames to " << output_dir << "\n";
    } else {
        r = repeat_range_in_place(store, sequence, first, last, args.repeat_times);
        if (r.failure()) return fail(r);
        std::cout << "Loop repeated " << args.repeat_times << " time(s); "
                  << sequence.size() + (last - first + 1) * static_cast<size_t>(args.repeat_times)
                  << " frames written\n";
    }
    return 0;
}

int run_trim(const Args& args) {
    const int base = std::max(0, args.trim);
    TrimMargins margins;
    margins.left = args.trim_left >= 0 ? args.trim_left : base;
    margins.right = args.trim_right >= 0 ? args.trim_right : base;
    margins.top = args.trim_top >= 0 ? args.trim_top : base;
    margins.bottom = args.trim_bottom >= 0 ? args.trim_bottom : base;
    if (margins.is_zero()) {
        return fail("nothing to trim; give --trim or a per-edge trim greater than 0");
    }

    if (args.in_place == !args.trim_output.empty()) {
        return fail("choose exactly one of --in-place or --trim-output <DIR>");
    }
    const TrimTarget target = args.in_place ? TrimTarget::InPlace : TrimTarget::Directory;

    std::error_code ec;
    TrimReport report;
    Result r;
    if (fs::is_regular_file(args.input, ec)) {
        r = trim_file(args.input, margins, target, args.trim_output, report);
    } else if (fs::is_directory(args.input, ec)) {
        r = trim_directory(FrameStore(args.input), margins, target, args.trim_output, report);
    } else {
        return fail("path does not exist: " + args.input);
    }
    if (r.failure()) return fail(r);

    std::cout << "Trim completed: left=" << margins.left << ", right=" << margins.right
              << ", top=" << margins.top << ", bottom=" << margins.bottom << "\n";
    std::cout << report.frame_count << " frames, now " << report.trimmed_size.width << "x"
              << report.trimmed_size.height << ", " << report.bytes_written << " bytes written to "
              << report.output_dir << "\n";
    return 0;
}

int run_render(const Config& config, const Args& args) {
    if (args.output.empty()) {
        return fail("--render needs an output video path");
    }

    VideoRenderOptions options;
    options.output_target = args.output;
    options.font_size_px = config.render.font_size;
    options.font_ratio = config.font_ratio();
    options.quality_factor = config.render.quality;
    options.mux_audio = config.render.mux_audio;
    options.fps = config.fps();
    options.font_path = config.render.font_path;
    options.foreground = config.render.foreground;
    options.background = config.render.background;
    if (options.mux_audio) {
        options.audio_source = args.audio_source.empty()
            ? (fs::path(args.input) / AUDIO_FILENAME).string() : args.audio_source;
        std::error_code ec;
        if (!fs::exists(fs::path(options.audio_source), ec)) {
            return fail("audio source not found: " + options.audio_source);
        }
    }

    FFmpegToolkit toolkit;
    Converter converter(toolkit, ConversionPipeline::Config{});

    std::cout << "Rendering " << args.input << " to " << args.output << "...\n";
    Result r = converter.render_video(args.input, options, print_progress);
    if (r.failure()) return fail(r);
    std::cout << "Video written to " << args.output << "\n";
    return 0;
}

}  // namespace
}

int main(int argc, char* argv[]) {
    cascii::Args args = cascii::parse_args(argc, argv);

    if (args.show_help) {
        cascii::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        cascii::print_help(argv[0]);
        return 1;
    }

    cascii::Config config = cascii::Config::defaults();
    std::string config_error;
    if (!args.config_path.empty()) {
        auto loaded = cascii::Config::load(args.config_path, config_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << config_error << "\n";
            return 1;
        }
        config = *loaded;
    } else if (std::filesystem::exists(cascii::Config::default_config_path())) {
        auto loaded = cascii::Config::load_default(config_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << config_error << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (args.verbose && !config.config_path.empty()) {
        std::cout << "Config: " << config.config_path << "\n";
    }

    config = cascii::apply_cli_overrides(config, args);

    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    if (args.input.empty()) {
        std::cerr << "Error: No input specified\n";
        cascii::print_help(argv[0]);
        return 1;
    }

    switch (args.mode) {
        case cascii::Mode::FindLoop: return cascii::run_find_loop(args);
        case cascii::Mode::Trim: return cascii::run_trim(args);
        case cascii::Mode::Render: return cascii::run_render(config, args);
        case cascii::Mode::Convert: break;
    }
    return cascii::run_convert(config, args, args.verbose);
}
