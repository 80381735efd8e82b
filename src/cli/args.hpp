#pragma once

#include <string>

namespace cascii {

enum class Mode {
    Convert,
    FindLoop,
    Trim,
    Render
};

enum class LoopAction {
    List,
    Export,
    Repeat
};

struct Args {
    Mode mode = Mode::Convert;

    std::string input;
    std::string output;
    std::string config_path;
    std::string font_path;
    std::string palette;
    std::string char_set;
    std::string preset;
    std::string start;
    std::string end;
    std::string preprocess;
    std::string preprocess_preset;
    bool preprocess_set = false;

    // Zero or negative means "not given"; config and preset fill in.
    int columns = 0;
    int fps = 0;
    float font_ratio = 0.0f;
    int luminance = -1;
    bool color = false;
    bool keep_images = false;
    bool extract_audio = false;

    LoopAction loop_action = LoopAction::List;
    // 0 selects the detected loop, N selects the Nth listed pair.
    int loop_choice = 0;
    int repeat_times = 1;

    int trim = -1;
    int trim_left = -1;
    int trim_right = -1;
    int trim_top = -1;
    int trim_bottom = -1;
    std::string trim_output;
    bool in_place = false;

    float font_size = 0.0f;
    int quality = -1;
    bool mux_audio = false;
    std::string audio_source;

    int workers = -1;
    bool strict = false;

    bool verbose = false;
    bool log_details = false;
    bool show_help = false;

    // First rejected argument, reported by main.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
