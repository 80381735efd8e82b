#include "args.hpp"
#include "media/preprocess.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <algorithm>

namespace cascii {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static float clamp_float(float val, float min_val, float max_val, float default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static void set_mode(Args& args, Mode mode, const char* flag) {
    if (args.mode != Mode::Convert && args.mode != mode && args.error.empty()) {
        args.error = std::string(flag) + " cannot be combined with another mode";
    }
    args.mode = mode;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    int positional = 0;

    auto need_value = [&](int i, const char* flag) {
        if (i + 1 < argc) return true;
        if (args.error.empty()) args.error = std::string(flag) + " needs a value";
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (need_value(i, arg)) {
                args.output = argv[++i];
                if (!validate_path(args.output)) args.output.clear();
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (need_value(i, arg)) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) args.config_path.clear();
            }
        }
        else if (strcmp(arg, "--columns") == 0 || strcmp(arg, "-c") == 0) {
            if (need_value(i, arg)) args.columns = clamp_int(std::atoi(argv[++i]), 1, 10000, 0);
        }
        else if (strcmp(arg, "--fps") == 0 || strcmp(arg, "-f") == 0) {
            if (need_value(i, arg)) args.fps = clamp_int(std::atoi(argv[++i]), 1, 240, 0);
        }
        else if (strcmp(arg, "--font-ratio") == 0) {
            if (need_value(i, arg)) args.font_ratio = clamp_float(static_cast<float>(std::atof(argv[++i])), 0.01f, 10.0f, 0.0f);
        }
        else if (strcmp(arg, "--luminance") == 0) {
            if (need_value(i, arg)) args.luminance = clamp_int(std::atoi(argv[++i]), 0, 255, -1);
        }
        else if (strcmp(arg, "--default") == 0) {
            args.preset = "default";
        }
        else if (strcmp(arg, "--small") == 0 || strcmp(arg, "-s") == 0) {
            args.preset = "small";
        }
        else if (strcmp(arg, "--large") == 0 || strcmp(arg, "-l") == 0) {
            args.preset = "large";
        }
        else if (strcmp(arg, "--preset") == 0) {
            if (need_value(i, arg)) args.preset = argv[++i];
        }
        else if (strcmp(arg, "--palette") == 0) {
            if (need_value(i, arg)) args.palette = argv[++i];
        }
        else if (strcmp(arg, "--char-set") == 0) {
            if (need_value(i, arg)) {
                std::string cs = argv[++i];
                if (cs == "default" || cs == "short" || cs == "blocky") {
                    args.char_set = cs;
                }
            }
        }
        else if (strcmp(arg, "--color") == 0 || strcmp(arg, "--colors") == 0) {
            args.color = true;
        }
        else if (strcmp(arg, "--start") == 0) {
            if (need_value(i, arg)) args.start = argv[++i];
        }
        else if (strcmp(arg, "--end") == 0) {
            if (need_value(i, arg)) args.end = argv[++i];
        }
        else if (strcmp(arg, "--preprocess") == 0) {
            if (need_value(i, arg)) {
                args.preprocess = argv[++i];
                args.preprocess_set = true;
            }
        }
        else if (strcmp(arg, "--preprocess-preset") == 0) {
            if (need_value(i, arg)) args.preprocess_preset = argv[++i];
        }
        else if (strcmp(arg, "--keep-images") == 0) {
            args.keep_images = true;
        }
        else if (strcmp(arg, "--audio") == 0) {
            args.extract_audio = true;
        }
        else if (strcmp(arg, "--find-loop") == 0) {
            set_mode(args, Mode::FindLoop, arg);
        }
        else if (strcmp(arg, "--export-loop") == 0) {
            set_mode(args, Mode::FindLoop, arg);
            args.loop_action = LoopAction::Export;
            if (need_value(i, arg)) args.loop_choice = clamp_int(std::atoi(argv[++i]), 0, 1 << 30, 0);
        }
        else if (strcmp(arg, "--repeat-loop") == 0) {
            set_mode(args, Mode::FindLoop, arg);
            args.loop_action = LoopAction::Repeat;
            if (need_value(i, arg)) args.loop_choice = clamp_int(std::atoi(argv[++i]), 0, 1 << 30, 0);
        }
        else if (strcmp(arg, "--repeat-times") == 0) {
            if (need_value(i, arg)) args.repeat_times = clamp_int(std::atoi(argv[++i]), 1, 1000, 1);
        }
        else if (strcmp(arg, "--trim") == 0) {
            set_mode(args, Mode::Trim, arg);
            if (need_value(i, arg)) args.trim = clamp_int(std::atoi(argv[++i]), 0, 1 << 20, -1);
        }
        else if (strcmp(arg, "--trim-left") == 0) {
            set_mode(args, Mode::Trim, arg);
            if (need_value(i, arg)) args.trim_left = clamp_int(std::atoi(argv[++i]), 0, 1 << 20, -1);
        }
        else if (strcmp(arg, "--trim-right") == 0) {
            set_mode(args, Mode::Trim, arg);
            if (need_value(i, arg)) args.trim_right = clamp_int(std::atoi(argv[++i]), 0, 1 << 20, -1);
        }
        else if (strcmp(arg, "--trim-top") == 0) {
            set_mode(args, Mode::Trim, arg);
            if (need_value(i, arg)) args.trim_top = clamp_int(std::atoi(argv[++i]), 0, 1 << 20, -1);
        }
        else if (strcmp(arg, "--trim-bottom") == 0) {
            set_mode(args, Mode::Trim, arg);
            if (need_value(i, arg)) args.trim_bottom = clamp_int(std::atoi(argv[++i]), 0, 1 << 20, -1);
        }
        else if (strcmp(arg, "--trim-output") == 0) {
            if (need_value(i, arg)) {
                args.trim_output = argv[++i];
                if (!validate_path(args.trim_output)) args.trim_output.clear();
            }
        }
        else if (strcmp(arg, "--in-place") == 0) {
            args.in_place = true;
        }
        else if (strcmp(arg, "--render") == 0) {
            set_mode(args, Mode::Render, arg);
        }
        else if (strcmp(arg, "--font") == 0) {
            if (need_value(i, arg)) {
                args.font_path = argv[++i];
                if (!validate_path(args.font_path)) args.font_path.clear();
            }
        }
        else if (strcmp(arg, "--font-size") == 0) {
            if (need_value(i, arg)) args.font_size = clamp_float(static_cast<float>(std::atof(argv[++i])), 1.0f, 512.0f, 0.0f);
        }
        else if (strcmp(arg, "--quality") == 0) {
            if (need_value(i, arg)) args.quality = clamp_int(std::atoi(argv[++i]), 0, 51, -1);
        }
        else if (strcmp(arg, "--mux-audio") == 0) {
            args.mux_audio = true;
        }
        else if (strcmp(arg, "--audio-source") == 0) {
            if (need_value(i, arg)) {
                args.audio_source = argv[++i];
                if (!validate_path(args.audio_source)) args.audio_source.clear();
            }
        }
        else if (strcmp(arg, "--workers") == 0 || strcmp(arg, "-j") == 0) {
            if (need_value(i, arg)) args.workers = clamp_int(std::atoi(argv[++i]), 0, 256, -1);
        }
        else if (strcmp(arg, "--strict") == 0) {
            args.strict = true;
        }
        else if (strcmp(arg, "--verbose") == 0 || strcmp(arg, "-v") == 0) {
            args.verbose = true;
        }
        else if (strcmp(arg, "--log-details") == 0) {
            args.log_details = true;
        }
        else if (arg[0] != '-') {
            std::string path = arg;
            if (!validate_path(path)) continue;
            if (positional == 0) args.input = path;
            else if (positional == 1 && args.output.empty()) args.output = path;
            ++positional;
        }
        else if (args.error.empty()) {
            args.error = std::string("unknown option ") + arg;
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT> [OUTPUT]\n\n", prog);
    printf("INPUT:\n");
    printf("  Image, video file, or directory of images (a frames directory for\n");
    printf("  --find-loop, --trim and --render)\n\n");
    printf("CONVERSION:\n");
    printf("  -o, --output <PATH>         Output directory (default: ./<input name>)\n");
    printf("      --config <FILE>         Config file path (default: ~/.config/cascii/config.toml)\n");
    printf("  -c, --columns <N>           Output width in characters\n");
    printf("  -f, --fps <N>               Frames per second extracted from video\n");
    printf("      --font-ratio <F>        Character width to height ratio\n");
    printf("      --luminance <N>         Threshold (0-255) below which cells are blank\n");
    printf("      --default               Default preset (400 columns, 30 fps, ratio 0.7)\n");
    printf("  -s, --small                 Small preset (80 columns, 24 fps, ratio 0.44)\n");
    printf("  -l, --large                 Large preset (800 columns, 60 fps, ratio 0.7)\n");
    printf("      --preset <NAME>         Named preset from the config file\n");
    printf("      --palette <CHARS>       Characters ordered darkest to lightest\n");
    printf("      --char-set <NAME>       Built-in palette: default, short, blocky\n");
    printf("      --color                 Keep per-cell color (.cframe output)\n");
    printf("      --start <TIME>          Video start (SS, SS.mmm, MM:SS, HH:MM:SS.mmm)\n");
    printf("      --end <TIME>            Video end\n");
    printf("      --preprocess <FILTER>   FFmpeg filter chain applied before scaling\n");
    printf("      --preprocess-preset <NAME>\n");
    printf("                              Named filter chain:");
    for (const PreprocessPreset& p : preprocess_presets()) {
        printf(" %s", p.name);
    }
    printf("\n");
    printf("      --keep-images           Keep extracted frame_NNNN.png images\n");
    printf("      --audio                 Extract the audio track to audio.mka\n");
    printf("      --log-details           Print the details.md summary\n\n");
    printf("LOOPS:\n");
    printf("      --find-loop             List the detected loop and repeated frame pairs\n");
    printf("      --export-loop <N>       Export loop N (0 = detected loop) to <dir>_loop_<a>_<b>\n");
    printf("      --repeat-loop <N>       Insert loop N again right after itself\n");
    printf("      --repeat-times <N>      Extra copies for --repeat-loop (default: 1)\n\n");
    printf("TRIM:\n");
    printf("      --trim <N>              Trim N cells from every edge\n");
    printf("      --trim-left/--trim-right/--trim-top/--trim-bottom <N>\n");
    printf("                              Per-edge trim, overrides --trim\n");
    printf("      --trim-output <DIR>     Write trimmed frames to DIR\n");
    printf("      --in-place              Overwrite the frames in place\n\n");
    printf("RENDER:\n");
    printf("      --render                Render a frames directory to OUTPUT (.mp4, .mkv, .gif)\n");
    printf("      --font <PATH>           TrueType font (auto-detects a monospace font if not set)\n");
    printf("      --font-size <PX>        Glyph height in pixels (default: 13)\n");
    printf("      --quality <N>           Quality factor 0-51, lower is better (default: 18)\n");
    printf("      --mux-audio             Mux audio into the rendered video\n");
    printf("      --audio-source <FILE>   Audio to mux (default: audio.mka in the frames directory)\n\n");
    printf("PIPELINE:\n");
    printf("  -j, --workers <N>           Worker threads (default: all cores)\n");
    printf("      --strict                Stop at the first failed frame\n");
    printf("  -v, --verbose               Print per-frame details\n");
    printf("  -h, --help                  Show this help\n");
}

}
