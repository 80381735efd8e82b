#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/frame.hpp"
#include "../src/mapping/char_sets.hpp"
#include "../src/mapping/char_mapper.hpp"
#include "../src/codec/frame_codec.hpp"
#include "../src/analysis/grid_trimmer.hpp"
#include "../src/analysis/loop_detector.hpp"
#include "../src/glyph/font_loader.hpp"

using namespace cascii;

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

static ConversionOptions options_with(const std::string& chars, int threshold, bool color = false) {
    ConversionOptions opts;
    Palette palette;
    Result r = Palette::create(chars, palette);
    assert(r.success());
    opts.palette = palette;
    opts.luminance_threshold = threshold;
    opts.color = color;
    return opts;
}

static Frame frame_from_rows(const std::vector<std::string>& rows) {
    Frame f(static_cast<int>(rows[0].size()), static_cast<int>(rows.size()));
    for (int y = 0; y < f.height(); ++y) {
        for (int x = 0; x < f.width(); ++x) {
            f.set(x, y, Cell(rows[y][x]));
        }
    }
    return f;
}

static Frame solid(char c, int w = 3, int h = 2) {
    Frame f(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) f.set(x, y, Cell(c));
    }
    return f;
}

static FrameSequence sequence_of(const std::string& letters) {
    FrameSequence seq;
    for (size_t i = 0; i < letters.size(); ++i) {
        seq.push_back({static_cast<int>(i) + 1, solid(letters[i])});
    }
    return seq;
}

TEST(palette_validation) {
    Palette p;
    assert(Palette::create(" .:#", p).success());
    assert(p.size() == 4);
    assert(p.at(0) == ' ');

    assert(Palette::create("", p).error == ErrorCode::INVALID_ARGUMENT);
    assert(Palette::create("aba", p).error == ErrorCode::INVALID_ARGUMENT);
    assert(Palette::create("a\tb", p).error == ErrorCode::INVALID_ARGUMENT);
    assert(Palette::create("a\xC3\xA9", p).error == ErrorCode::INVALID_ARGUMENT);

    Palette def;
    assert(def.chars() == CharSet::DEFAULT);
}

TEST(char_sets_available) {
    assert(CharSet::get_set("default") == CharSet::DEFAULT);
    assert(CharSet::get_set("short") == CharSet::SHORT);
    assert(CharSet::get_set("blocky") == CharSet::BLOCKY);
    assert(CharSet::get_set("unknown").empty());
}

TEST(luminance_weights) {
    assert(luminance(0, 0, 0) == 0);
    assert(luminance(255, 255, 255) == 255);
    // 0.2126 * 255 = 54.2
    assert(luminance(255, 0, 0) == 54);
    assert(luminance(0, 255, 0) == 182);
    assert(luminance(0, 0, 255) == 18);
}

TEST(mapper_bright_gray) {
    ConversionOptions opts = options_with(" .:-=+*#%@", 20);
    // L = 200, effective 180, range 235, idx = 180 * 9 / 235 = 6
    Cell c = map_pixel(200, 200, 200, opts);
    assert(c.ch == '*');
    assert(!c.has_color);
}

TEST(mapper_below_threshold_is_blank) {
    ConversionOptions opts = options_with(" .:-=+*#%@", 20, true);
    Cell c = map_pixel(10, 10, 10, opts);
    assert(c.is_blank());
    assert(!c.has_color);
}

TEST(mapper_threshold_boundary) {
    ConversionOptions opts = options_with("abc", 100);
    Cell c = map_pixel(100, 100, 100, opts);
    assert(c.ch == 'a');

    c = map_pixel(255, 255, 255, opts);
    assert(c.ch == 'c');
}

TEST(mapper_threshold_255) {
    ConversionOptions opts = options_with("xy", 255);
    assert(map_pixel(255, 255, 255, opts).ch == 'x');
    assert(map_pixel(254, 254, 254, opts).is_blank());
}

TEST(mapper_single_char_palette) {
    ConversionOptions opts = options_with("#", 0);
    assert(map_pixel(0, 0, 0, opts).ch == '#');
    assert(map_pixel(255, 255, 255, opts).ch == '#');
}

TEST(mapper_color_mode_keeps_source) {
    ConversionOptions opts = options_with(" .:-=+*#%@", 20, true);
    Cell c = map_pixel(250, 40, 90, opts);
    assert(c.has_color);
    assert(c.r == 250 && c.g == 40 && c.b == 90);
}

TEST(mapper_monotonic_in_red) {
    const std::string chars = " .:-=+*#%@";
    ConversionOptions opts = options_with(chars, 20);
    const int fixed[][2] = {{0, 0}, {120, 40}, {255, 255}, {30, 200}};
    for (const auto& gb : fixed) {
        int previous = -1;
        for (int r = 0; r <= 255; ++r) {
            Cell c = map_pixel(static_cast<uint8_t>(r), static_cast<uint8_t>(gb[0]),
                               static_cast<uint8_t>(gb[1]), opts);
            const int index = c.is_blank() ? -1 : static_cast<int>(chars.find(c.ch));
            assert(index >= previous);
            previous = index;
        }
    }
}

TEST(options_validation) {
    ConversionOptions opts;
    assert(opts.validate().success());
    assert(opts.columns && *opts.columns == 400);

    opts.columns = 0;
    assert(opts.validate().error == ErrorCode::INVALID_ARGUMENT);
    opts.columns = 80;
    opts.font_ratio = 0.0f;
    assert(opts.validate().failure());
    opts.font_ratio = 0.5f;
    opts.luminance_threshold = 256;
    assert(opts.validate().failure());
}

TEST(target_grid_size) {
    ConversionOptions opts;
    opts.columns = 100;
    opts.font_ratio = 0.5f;
    Size s = target_grid_size(200, 100, opts);
    assert(s.width == 100);
    assert(s.height == 25);

    opts.columns.reset();
    s = target_grid_size(40, 10, opts);
    assert(s.width == 40);
    assert(s.height == 5);

    opts.font_ratio = 0.01f;
    s = target_grid_size(40, 10, opts);
    assert(s.height == 1);
}

TEST(map_image_dimensions) {
    FrameBuffer img(4, 3, Color(255, 255, 255));
    img.set_pixel(0, 0, Color(0, 0, 0));
    ConversionOptions opts = options_with(" .#", 20);
    Frame f = map_image(img, opts);
    assert(f.width() == 4 && f.height() == 3);
    assert(f.at(0, 0).is_blank());
    assert(f.at(3, 2).ch == '#');
}

TEST(frame_equality_and_fingerprint) {
    Frame a = frame_from_rows({"ab", "cd"});
    Frame b = frame_from_rows({"ab", "cd"});
    Frame c = frame_from_rows({"ab", "ce"});
    assert(a == b);
    assert(a.fingerprint() == b.fingerprint());
    assert(a != c);
    assert(a.fingerprint() != c.fingerprint());

    Frame colored = a;
    colored.set(0, 0, Cell('a', 1, 2, 3));
    assert(colored != a);
    assert(colored.has_color());
    assert(!a.has_color());
    assert(a.row_text(1) == "cd");
}

TEST(uniform_size_check) {
    FrameSequence seq;
    seq.push_back({1, solid('a', 3, 2)});
    seq.push_back({2, solid('a', 4, 2)});
    Result r = check_uniform_size(seq);
    assert(r.error == ErrorCode::DIMENSION_MISMATCH);
    assert(r.message.find("2") != std::string::npos);
}

TEST(codec_plain_roundtrip) {
    Frame f = frame_from_rows({"#. ", " @:"});
    std::string text = encode(f);
    assert(!is_color_form(text));
    assert(text == "#. \n @:\n");

    Frame back;
    assert(decode(text, back).success());
    assert(back == f);
}

TEST(codec_plain_line_endings) {
    Frame out;
    assert(decode_plain("ab\r\ncd\r\n", out).success());
    assert(out.width() == 2 && out.height() == 2);
    assert(out.at(1, 1).ch == 'd');

    assert(decode_plain("ab\ncd", out).success());
    assert(out.height() == 2);
}

TEST(codec_plain_rejects_ragged_rows) {
    Frame out;
    Result r = decode_plain("abc\nab\n", out);
    assert(r.error == ErrorCode::DECODE_ERROR);
    assert(r.message.find("row 2 has 2 columns, expected 3") != std::string::npos);

    assert(decode_plain("", out).error == ErrorCode::DECODE_ERROR);
}

TEST(codec_plain_row_starting_with_magic) {
    Frame f = frame_from_rows({"CFRM", "abcd"});
    Palette palette;
    assert(Palette::create("CFRM", palette).success());

    std::string text = encode(f);
    assert(text == "CFRM\nabcd\n");
    assert(!is_color_form(text));

    Frame back;
    Result r = decode(text, back);
    assert(r.success());
    assert(back == f);

    Frame single = frame_from_rows({"CFRM"});
    assert(decode(encode(single), back).success());
    assert(back == single);
}

TEST(codec_color_roundtrip) {
    Frame f(5, 2);
    for (int x = 0; x < 5; ++x) {
        f.set(x, 0, Cell('#', 255, 0, 0));
        f.set(x, 1, Cell(x < 2 ? ' ' : '@'));
    }
    f.set(4, 0, Cell('#', 0, 255, 0));

    std::string data = encode(f);
    assert(is_color_form(data));
    assert(data[4] == static_cast<char>(COLOR_FORMAT_VERSION));

    Frame back;
    assert(decode(data, back).success());
    assert(back == f);
}

TEST(codec_color_run_merging) {
    Frame f(4, 1);
    for (int x = 0; x < 4; ++x) f.set(x, 0, Cell('a', 10, 20, 30));
    std::string data = encode_color(f);
    // magic, version, W, H, run count, one colored run
    assert(data.size() == 4 + 1 + 4 + 4 + 4 + (4 + 1 + 1 + 3));

    Frame mixed(2, 1);
    mixed.set(0, 0, Cell('a'));
    mixed.set(1, 0, Cell('a', 0, 0, 0));
    std::string mixed_data = encode_color(mixed);
    assert(mixed_data.size() == 4 + 1 + 4 + 4 + 4 + (4 + 1 + 1) + (4 + 1 + 1 + 3));
}

static uint32_t u32_at(const std::string& data, size_t pos) {
    const auto* p = reinterpret_cast<const unsigned char*>(data.data() + pos);
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

TEST(codec_color_single_color_3x2) {
    Frame f(3, 2);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) f.set(x, y, Cell('o', 40, 80, 120));
    }
    std::string data = encode(f);
    assert(is_color_form(data));
    assert(u32_at(data, 5) == 3);
    assert(u32_at(data, 9) == 2);

    // each row: run count, then one colored run of 4 + 1 + 1 + 3 bytes
    const size_t row_bytes = 4 + 9;
    assert(data.size() == 13 + 2 * row_bytes);
    assert(u32_at(data, 13) == 1);
    assert(u32_at(data, 17) == 3);
    assert(u32_at(data, 13 + row_bytes) == 1);
    assert(u32_at(data, 17 + row_bytes) == 3);

    Frame back;
    assert(decode(data, back).success());
    assert(back.width() == 3 && back.height() == 2);
    assert(back == f);
}

TEST(codec_color_rejects_truncation_and_extra_rows) {
    Frame f(3, 2);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) f.set(x, y, Cell('x', 9, 9, 9));
    }
    std::string data = encode_color(f);
    Frame out;

    std::string truncated = data.substr(0, data.size() - 4);
    assert(decode_color(truncated, out).error == ErrorCode::DECODE_ERROR);

    std::string row_only = data.substr(0, data.size() / 2 + 4);
    assert(decode_color(row_only, out).failure());

    std::string extra = data + data.substr(13, (data.size() - 13) / 2);
    Result r = decode_color(extra, out);
    assert(r.error == ErrorCode::DECODE_ERROR);
    assert(r.message.find("rows") != std::string::npos);
}

TEST(codec_color_rejects_bad_runs) {
    Frame f(2, 1);
    f.set(0, 0, Cell('a', 1, 1, 1));
    f.set(1, 0, Cell('b', 1, 1, 1));
    std::string data = encode_color(f);
    Frame out;

    // First run length lives right after the row's run count.
    std::string zero = data;
    zero[17] = 0;
    assert(decode_color(zero, out).error == ErrorCode::DECODE_ERROR);

    std::string wide = data;
    wide[17] = 2;
    assert(decode_color(wide, out).error == ErrorCode::DECODE_ERROR);

    std::string bad_magic = data;
    bad_magic[0] = 'X';
    assert(decode_color(bad_magic, out).failure());
}

TEST(trim_basic) {
    Frame f = frame_from_rows({"abcd", "efgh", "ijkl"});
    Frame out;
    assert(trim(f, {1, 1, 1, 0}, out).success());
    assert(out.width() == 2 && out.height() == 2);
    assert(out.row_text(0) == "fg");
    assert(out.row_text(1) == "jk");
}

TEST(trim_identity_and_composition) {
    Frame f = frame_from_rows({"abcdef", "ghijkl", "mnopqr", "stuvwx"});
    Frame same;
    assert(trim(f, TrimMargins{}, same).success());
    assert(same == f);

    Frame once, twice, both;
    assert(trim(f, {1, 0, 0, 0}, once).success());
    assert(trim(once, {2, 0, 0, 0}, twice).success());
    assert(trim(f, {3, 0, 0, 0}, both).success());
    assert(twice == both);
}

TEST(trim_rejects_consuming_dimension) {
    Frame f = frame_from_rows({"abc", "def"});
    Frame out;
    Result r = trim(f, {2, 1, 0, 0}, out);
    assert(r.error == ErrorCode::DIMENSION_MISMATCH);
    assert(trim(f, {0, 0, 1, 1}, out).error == ErrorCode::DIMENSION_MISMATCH);
    assert(trim(f, {-1, 0, 0, 0}, out).error == ErrorCode::INVALID_ARGUMENT);
}

TEST(trim_keeps_color) {
    Frame f(3, 1);
    f.set(0, 0, Cell('a', 1, 2, 3));
    f.set(1, 0, Cell('b', 4, 5, 6));
    f.set(2, 0, Cell('c'));
    Frame out;
    assert(trim(f, {1, 0, 0, 0}, out).success());
    assert(out.at(0, 0) == Cell('b', 4, 5, 6));
    assert(!out.at(1, 0).has_color);
}

TEST(trim_sequence_reports_index) {
    FrameSequence seq;
    seq.push_back({7, frame_from_rows({"ab"})});
    FrameSequence out;
    Result r = trim_sequence(seq, {1, 1, 0, 0}, out);
    assert(r.failure());
    assert(r.message.find("frame 7") != std::string::npos);
}

TEST(loop_identical_frames) {
    FrameSequence seq = sequence_of("AAAAAAAAAA");
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(seq, match).success());
    assert(match);
    assert(match->period == 1);
    assert(match->offset == 0);
    assert(match->length == 10);
}

TEST(loop_excludes_trailing_frame) {
    FrameSequence seq = sequence_of("ABCDABCDABCDX");
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(seq, match).success());
    assert(match);
    assert(match->period == 4);
    assert(match->offset == 0);
    assert(match->repeats == 3);
    assert(match->length == 12);
}

TEST(loop_offset_search) {
    FrameSequence seq = sequence_of("XYABABAB");
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(seq, match).success());
    assert(match);
    assert(match->period == 2);
    assert(match->offset == 2);
    assert(match->repeats == 3);
}

TEST(loop_none_found) {
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(sequence_of("ABCDEFG"), match).success());
    assert(!match);

    assert(detector.find(sequence_of("AAA"), match).success());
    assert(!match);
}

TEST(loop_rejects_mixed_sizes) {
    FrameSequence seq = sequence_of("ABAB");
    seq[2].frame = solid('A', 5, 5);
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(seq, match).error == ErrorCode::DIMENSION_MISMATCH);
}

TEST(loop_min_period_config) {
    LoopDetector::Config cfg;
    cfg.min_period = 2;
    LoopDetector detector(cfg);
    std::optional<LoopMatch> match;
    assert(detector.find(sequence_of("AAAAAA"), match).success());
    assert(match);
    assert(match->period == 2);

    cfg.min_repeats = 1;
    LoopDetector bad(cfg);
    assert(bad.find(sequence_of("AAAAAA"), match).error == ErrorCode::INVALID_ARGUMENT);
}

TEST(loop_repeated_pairs) {
    LoopDetector detector;
    std::vector<FramePair> pairs = detector.repeated_pairs(sequence_of("ABCAB"));
    assert(pairs.size() == 2);
    assert(pairs[0] == (FramePair{0, 3}));
    assert(pairs[1] == (FramePair{1, 4}));

    // Neighbours never form a pair.
    assert(detector.repeated_pairs(sequence_of("AAB")).empty());
}

TEST(loop_extract_and_repeat) {
    FrameSequence seq = sequence_of("ABCABCX");
    LoopDetector detector;
    std::optional<LoopMatch> match;
    assert(detector.find(seq, match).success());
    assert(match && match->period == 3);

    FrameSequence loop = extract_loop(seq, *match);
    assert(loop.size() == 3);
    assert(loop[0].index == 1 && loop[2].index == 3);
    assert(loop[1].frame == solid('B'));

    FrameSequence repeated = repeat_loop(seq, *match, 1);
    assert(repeated.size() == 10);
    const std::string expected = "ABCABCABCX";
    for (size_t i = 0; i < repeated.size(); ++i) {
        assert(repeated[i].index == static_cast<int>(i) + 1);
        assert(repeated[i].frame == solid(expected[i]));
    }
}

TEST(loop_export_directory_name) {
    assert(loop_export_directory("/tmp/frames", 3, 7) == "/tmp/frames_loop_3_7");
    assert(loop_export_directory("/tmp/frames/", 1, 4) == "/tmp/frames_loop_1_4");
}

TEST(font_loader_path_traversal) {
    FontLoader loader;

    auto result = loader.load("../../../etc/passwd");
    assert(!result.success());

    result = loader.load("/nonexistent/font.ttf");
    assert(!result.success());
}

TEST(font_loader_invalid_data) {
    FontLoader loader;

    uint8_t tiny_data[] = {0x00, 0x01, 0x00, 0x00};
    auto result = loader.load_from_memory(tiny_data, 4);
    assert(!result.success());

    uint8_t invalid_sig[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                             0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    result = loader.load_from_memory(invalid_sig, 13);
    assert(!result.success());
    assert(!loader.is_loaded());
}

TEST(result_type) {
    Result ok = Result::ok();
    assert(ok.success());
    assert(!ok.failure());

    Result err = Result::fail(ErrorCode::INDEX_GAP, "gap");
    assert(!err.success());
    assert(err.message == "gap");
    assert(std::string(error_code_name(ErrorCode::INDEX_GAP)) == "index gap");
}

TEST(types_framebuffer) {
    FrameBuffer fb(10, 10);
    assert(fb.width() == 10);
    assert(fb.byte_size() == 400);

    fb.set_pixel(5, 5, Color(255, 128, 64, 255));
    Color c = fb.get_pixel(5, 5);
    assert(c.r == 255 && c.g == 128 && c.b == 64);

    Color out_of_bounds = fb.get_pixel(100, 100);
    assert(out_of_bounds.r == 0);

    const uint8_t rgb[] = {1, 2, 3, 4, 5, 6};
    FrameBuffer from = FrameBuffer::from_rgb(rgb, 2, 1, 6);
    assert(from.get_pixel(1, 0) == Color(4, 5, 6));
}

int main() {
    std::cout << "=== cascii Comprehensive Test Suite ===\n\n";

    std::cout << "--- Mapper Tests ---\n";
    RUN_TEST(palette_validation);
    RUN_TEST(char_sets_available);
    RUN_TEST(luminance_weights);
    RUN_TEST(mapper_bright_gray);
    RUN_TEST(mapper_below_threshold_is_blank);
    RUN_TEST(mapper_threshold_boundary);
    RUN_TEST(mapper_threshold_255);
    RUN_TEST(mapper_single_char_palette);
    RUN_TEST(mapper_color_mode_keeps_source);
    RUN_TEST(mapper_monotonic_in_red);
    RUN_TEST(options_validation);
    RUN_TEST(target_grid_size);
    RUN_TEST(map_image_dimensions);

    std::cout << "\n--- Frame Tests ---\n";
    RUN_TEST(frame_equality_and_fingerprint);
    RUN_TEST(uniform_size_check);

    std::cout << "\n--- Codec Tests ---\n";
    RUN_TEST(codec_plain_roundtrip);
    RUN_TEST(codec_plain_line_endings);
    RUN_TEST(codec_plain_rejects_ragged_rows);
    RUN_TEST(codec_plain_row_starting_with_magic);
    RUN_TEST(codec_color_roundtrip);
    RUN_TEST(codec_color_run_merging);
    RUN_TEST(codec_color_single_color_3x2);
    RUN_TEST(codec_color_rejects_truncation_and_extra_rows);
    RUN_TEST(codec_color_rejects_bad_runs);

    std::cout << "\n--- Trimmer Tests ---\n";
    RUN_TEST(trim_basic);
    RUN_TEST(trim_identity_and_composition);
    RUN_TEST(trim_rejects_consuming_dimension);
    RUN_TEST(trim_keeps_color);
    RUN_TEST(trim_sequence_reports_index);

    std::cout << "\n--- Loop Detector Tests ---\n";
    RUN_TEST(loop_identical_frames);
    RUN_TEST(loop_excludes_trailing_frame);
    RUN_TEST(loop_offset_search);
    RUN_TEST(loop_none_found);
    RUN_TEST(loop_rejects_mixed_sizes);
    RUN_TEST(loop_min_period_config);
    RUN_TEST(loop_repeated_pairs);
    RUN_TEST(loop_extract_and_repeat);
    RUN_TEST(loop_export_directory_name);

    std::cout << "\n--- Font Loader Tests ---\n";
    RUN_TEST(font_loader_path_traversal);
    RUN_TEST(font_loader_invalid_data);

    std::cout << "\n--- Types Tests ---\n";
    RUN_TEST(result_type);
    RUN_TEST(types_framebuffer);

    std::cout << "=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    } else {
        std::cout << "\nSome tests failed!\n";
        return 1;
    }
}
