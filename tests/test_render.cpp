#include <iostream>
#include <cassert>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/frame.hpp"
#include "../src/codec/frame_store.hpp"
#include "../src/glyph/glyph_cache.hpp"
#include "../src/render/frame_renderer.hpp"
#include "../src/render/video_encoder.hpp"
#include "../src/app/converter.hpp"

using namespace cascii;
namespace fs = std::filesystem;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

class RecordingEncoder : public FrameEncoder {
public:
    std::vector<FrameBuffer> frames;
    bool finished = false;
    int fail_at = -1;

    Result write(const FrameBuffer& frame) override {
        if (static_cast<int>(frames.size()) == fail_at) {
            return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "encoder rejected frame");
        }
        frames.push_back(frame);
        return Result::ok();
    }
    Result finish() override {
        finished = true;
        return Result::ok();
    }
};

class CountingEncoder : public FrameEncoder {
public:
    explicit CountingEncoder(size_t* count) : count_(count) {}
    Result write(const FrameBuffer&) override {
        ++*count_;
        return Result::ok();
    }
    Result finish() override { return Result::ok(); }

private:
    size_t* count_;
};

// Only the encoder and muxer are exercised; everything else refuses.
class EncodeOnlyToolkit : public MediaToolkit {
public:
    size_t frames_written = 0;
    EncoderSettings settings;
    std::string encoder_path;
    std::string mux_video;
    std::string mux_audio_path;
    std::string mux_output;

    Result probe(const std::string&, MediaInfo&) override {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "probe unavailable");
    }
    Result extract_frames(const ExtractRequest&, const FrameSink&) override {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "extract unavailable");
    }
    Result extract_audio(const std::string&, const std::string&,
                         std::optional<double>, std::optional<double>) override {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "audio unavailable");
    }
    Result mux_audio(const std::string& video_path, const std::string& audio_path,
                     const std::string& output_path) override {
        mux_video = video_path;
        mux_audio_path = audio_path;
        mux_output = output_path;
        if (!fs::exists(video_path)) {
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "missing " + video_path);
        }
        return FrameStore::write_file(output_path, "muxed");
    }
    Result open_encoder(const std::string& path, const EncoderSettings& s,
                        std::unique_ptr<FrameEncoder>& encoder) override {
        encoder_path = path;
        settings = s;
        Result r = FrameStore::write_file(path, "video");
        if (r.failure()) return r;
        encoder = std::make_unique<CountingEncoder>(&frames_written);
        return Result::ok();
    }
    Result filter_image(const FrameBuffer&, const std::string&, FrameBuffer&) override {
        return Result::fail(ErrorCode::TOOL_NOT_FOUND, "filter unavailable");
    }
};

static VideoRenderOptions small_options() {
    VideoRenderOptions opts;
    opts.font_size_px = 4.0f;
    opts.font_ratio = 0.5f;
    opts.foreground = Color(230, 230, 230);
    opts.background = Color(10, 20, 30);
    return opts;
}

static GlyphBitmap filled(int w, int h, uint8_t coverage) {
    GlyphBitmap g;
    g.width = w;
    g.height = h;
    g.advance = w;
    g.pixels.assign(static_cast<size_t>(w) * h, coverage);
    return g;
}

static Frame row_frame(const std::string& chars) {
    Frame f(static_cast<int>(chars.size()), 1);
    for (int x = 0; x < f.width(); ++x) f.set(x, 0, Cell(chars[x]));
    return f;
}

static FrameSequence three_frames() {
    FrameSequence seq;
    seq.push_back({1, row_frame("# ")});
    seq.push_back({2, row_frame(" #")});
    seq.push_back({3, row_frame("##")});
    return seq;
}

TEST(glyph_cell_dimensions) {
    assert(glyph_width(13.0f, 0.7f) == 9);
    assert(glyph_height(13.0f) == 13);
    assert(glyph_width(1.0f, 0.1f) == 1);
    assert(glyph_height(0.2f) == 1);

    FrameRenderer renderer(small_options());
    assert(renderer.cell_width() == 2);
    assert(renderer.cell_height() == 4);
    assert(renderer.output_size(Frame(3, 2)) == (Size{6, 8}));
}

TEST(render_options_validation) {
    VideoRenderOptions opts;
    assert(opts.validate().success());

    opts.quality_factor = 52;
    assert(opts.validate().error == ErrorCode::INVALID_ARGUMENT);
    opts.quality_factor = 0;
    assert(opts.validate().success());

    opts.fps = 0;
    assert(opts.validate().failure());
    opts.fps = 24;

    opts.mux_audio = true;
    assert(opts.validate().failure());
    opts.audio_source = "audio.mka";
    assert(opts.validate().success());

    opts.font_size_px = 0.0f;
    assert(opts.validate().failure());
}

TEST(glyph_cache_pads_injected_bitmaps) {
    GlyphCache cache;
    cache.set_cell_size(2, 4);
    cache.add_bitmap('a', filled(1, 1, 200));
    const GlyphBitmap* a = cache.get_bitmap('a');
    assert(a != nullptr);
    assert(a->width == 2 && a->height == 4);
    assert(a->coverage(0, 0) == 200);
    assert(a->coverage(1, 0) == 0);
    assert(a->coverage(0, 3) == 0);

    cache.add_bitmap('b', filled(5, 6, 90));
    const GlyphBitmap* b = cache.get_bitmap('b');
    assert(b->width == 2 && b->height == 4);
    assert(b->coverage(1, 3) == 90);

    assert(cache.get_bitmap('c') == nullptr);
    assert(cache.glyph('c') == nullptr);
    assert(cache.size() == 2);

    FontLoader unloaded;
    assert(cache.initialize(&unloaded, "abc", 2, 4).error == ErrorCode::FONT_ERROR);
}

TEST(render_colors_and_background) {
    FrameRenderer renderer(small_options());
    renderer.cache().add_bitmap('#', filled(2, 4, 255));

    Frame frame(3, 2);
    frame.set(0, 0, Cell('#'));
    frame.set(1, 0, Cell('#', 255, 0, 0));
    frame.set(2, 1, Cell('x'));

    FrameBuffer out;
    assert(renderer.render(frame, out).success());
    assert(out.width() == 6 && out.height() == 8);

    assert(out.get_pixel(0, 0) == Color(230, 230, 230));
    assert(out.get_pixel(1, 3) == Color(230, 230, 230));
    assert(out.get_pixel(2, 0) == Color(255, 0, 0));
    assert(out.get_pixel(3, 3) == Color(255, 0, 0));
    assert(out.get_pixel(4, 0) == Color(10, 20, 30));
    assert(out.get_pixel(0, 4) == Color(10, 20, 30));
    // No glyph for 'x' and no font to render one.
    assert(out.get_pixel(4, 4) == Color(10, 20, 30));
}

TEST(render_blends_partial_coverage) {
    VideoRenderOptions opts = small_options();
    opts.background = Color(0, 0, 0);
    opts.foreground = Color(255, 255, 255);
    FrameRenderer renderer(opts);
    renderer.cache().add_bitmap('+', filled(2, 4, 128));

    FrameBuffer out;
    assert(renderer.render(row_frame("+"), out).success());
    const Color c = out.get_pixel(0, 0);
    assert(c.r == 128 && c.g == 128 && c.b == 128);
    assert(c.a == 255);
}

TEST(render_rejects_empty_frame) {
    FrameRenderer renderer(small_options());
    FrameBuffer out;
    assert(renderer.render(Frame(), out).error == ErrorCode::INVALID_ARGUMENT);
}

TEST(render_sequence_in_order) {
    FrameRenderer renderer(small_options());
    renderer.cache().add_bitmap('#', filled(2, 4, 255));

    RecordingEncoder encoder;
    std::vector<size_t> progress;
    Result r = render_sequence(renderer, three_frames(), encoder,
        [&](size_t done, size_t total) {
            assert(total == 3);
            progress.push_back(done);
        });
    assert(r.success());
    assert(encoder.finished);
    assert(encoder.frames.size() == 3);
    assert(progress.back() == 3);

    const Color fg(230, 230, 230);
    const Color bg(10, 20, 30);
    assert(encoder.frames[0].get_pixel(0, 0) == fg && encoder.frames[0].get_pixel(2, 0) == bg);
    assert(encoder.frames[1].get_pixel(0, 0) == bg && encoder.frames[1].get_pixel(2, 0) == fg);
    assert(encoder.frames[2].get_pixel(0, 0) == fg && encoder.frames[2].get_pixel(2, 0) == fg);
}

TEST(render_sequence_errors) {
    FrameRenderer renderer(small_options());

    FrameSequence mixed = three_frames();
    mixed[1].frame = row_frame("###");
    RecordingEncoder encoder;
    assert(render_sequence(renderer, mixed, encoder).error == ErrorCode::DIMENSION_MISMATCH);
    assert(encoder.frames.empty());
    assert(!encoder.finished);

    RecordingEncoder failing;
    failing.fail_at = 1;
    Result r = render_sequence(renderer, three_frames(), failing);
    assert(r.error == ErrorCode::EXTERNAL_TOOL_ERROR);
    assert(r.message.find("frame 2") != std::string::npos);
    assert(!failing.finished);
}

TEST(render_sequence_to_encoder) {
    const fs::path dir = fs::temp_directory_path() / "cascii_test_render_plain";
    fs::remove_all(dir);
    fs::create_directories(dir);

    VideoRenderOptions opts = small_options();
    opts.output_target = (dir / "out.mp4").string();
    opts.fps = 12;
    opts.quality_factor = 23;
    FrameRenderer renderer(opts);
    renderer.cache().add_bitmap('#', filled(2, 4, 255));

    EncodeOnlyToolkit toolkit;
    Converter converter(toolkit, ConversionPipeline::Config{});
    assert(converter.render_sequence_to(three_frames(), renderer).success());

    assert(toolkit.encoder_path == opts.output_target);
    assert(toolkit.settings.width == 4 && toolkit.settings.height == 4);
    assert(toolkit.settings.fps == 12);
    assert(toolkit.settings.quality_factor == 23);
    assert(toolkit.frames_written == 3);
    assert(toolkit.mux_output.empty());

    assert(converter.render_sequence_to(FrameSequence{}, renderer).error == ErrorCode::INVALID_ARGUMENT);
    fs::remove_all(dir);
}

TEST(render_sequence_to_muxes_audio) {
    const fs::path dir = fs::temp_directory_path() / "cascii_test_render_mux";
    fs::remove_all(dir);
    fs::create_directories(dir);

    VideoRenderOptions opts = small_options();
    opts.output_target = (dir / "clip.mp4").string();
    opts.mux_audio = true;
    opts.audio_source = (dir / "audio.mka").string();
    FrameRenderer renderer(opts);
    renderer.cache().add_bitmap('#', filled(2, 4, 255));

    EncodeOnlyToolkit toolkit;
    Converter converter(toolkit, ConversionPipeline::Config{});
    assert(converter.render_sequence_to(three_frames(), renderer).success());

    assert(toolkit.encoder_path == (dir / "clip.video.mp4").string());
    assert(toolkit.mux_video == toolkit.encoder_path);
    assert(toolkit.mux_audio_path == opts.audio_source);
    assert(toolkit.mux_output == opts.output_target);
    assert(fs::exists(opts.output_target));
    assert(!fs::exists(toolkit.encoder_path));
    fs::remove_all(dir);
}

TEST(render_video_argument_errors) {
    EncodeOnlyToolkit toolkit;
    Converter converter(toolkit, ConversionPipeline::Config{});

    VideoRenderOptions opts = small_options();
    assert(converter.render_video("frames", opts).error == ErrorCode::INVALID_ARGUMENT);

    opts.output_target = "out.mp4";
    opts.quality_factor = 99;
    assert(converter.render_video("frames", opts).error == ErrorCode::INVALID_ARGUMENT);

    opts.quality_factor = 18;
    const std::string missing = (fs::temp_directory_path() / "cascii_test_no_such_frames").string();
    fs::remove_all(missing);
    assert(converter.render_video(missing, opts).error == ErrorCode::FILE_NOT_FOUND);
    assert(toolkit.encoder_path.empty());
}

TEST(used_characters_skips_blanks) {
    FrameSequence seq;
    seq.push_back({1, row_frame("x # ")});
    seq.push_back({2, row_frame("##x@")});
    assert(used_characters(seq) == "#@x");
    assert(used_characters(FrameSequence{}).empty());
}

TEST(encoder_quality_mapping) {
    assert(VideoEncoder::clamp_quality(-3) == 0);
    assert(VideoEncoder::clamp_quality(60) == 51);
    assert(VideoEncoder::clamp_quality(18) == 18);
    assert(VideoEncoder::quantizer_for_quality(0) == 2);
    assert(VideoEncoder::quantizer_for_quality(51) == 31);
    assert(VideoEncoder::quantizer_for_quality(18) == 12);
}

TEST(encoder_rejects_bad_settings) {
    VideoEncoder encoder;
    EncoderSettings settings;
    settings.width = 0;
    settings.height = 10;
    assert(encoder.open("never_written.mp4", settings).error == ErrorCode::INVALID_ARGUMENT);
    assert(!encoder.is_open());

    settings.width = 16;
    settings.fps = 0;
    assert(encoder.open("never_written.mp4", settings).error == ErrorCode::INVALID_ARGUMENT);
    assert(!fs::exists("never_written.mp4"));
}

int main() {
    std::cout << "=== Render Tests ===\n\n";

    RUN_TEST(glyph_cell_dimensions);
    RUN_TEST(render_options_validation);
    RUN_TEST(glyph_cache_pads_injected_bitmaps);
    RUN_TEST(render_colors_and_background);
    RUN_TEST(render_blends_partial_coverage);
    RUN_TEST(render_rejects_empty_frame);
    RUN_TEST(render_sequence_in_order);
    RUN_TEST(render_sequence_errors);
    RUN_TEST(render_sequence_to_encoder);
    RUN_TEST(render_sequence_to_muxes_audio);
    RUN_TEST(render_video_argument_errors);
    RUN_TEST(used_characters_skips_blanks);
    RUN_TEST(encoder_quality_mapping);
    RUN_TEST(encoder_rejects_bad_settings);

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "SOME FAILED") << " ===\n";
    return failures;
}
