#include "media/preprocess.hpp"
#include <cctype>
#include <charconv>
#include <system_error>
#include <strings.h>

namespace cascii {

const std::vector<PreprocessPreset>& preprocess_presets() {
    static const std::vector<PreprocessPreset> presets = {
        {"contours", "Grayscale edge detection with strong contrast",
         "format=gray,edgedetect=mode=colormix:high=0.2:low=0.05,eq=contrast=2.5:brightness=-0.1"},
        {"contours-soft", "Softer contours with less aggressive edges",
         "format=gray,edgedetect=mode=colormix:high=0.12:low=0.03,eq=contrast=2.0:brightness=-0.05"},
        {"contours-strong", "Sharp contours for bold linework",
         "format=gray,edgedetect=mode=colormix:high=0.35:low=0.08,eq=contrast=3.2:brightness=-0.12"},
        {"bw-contrast", "Grayscale with a contrast boost",
         "format=gray,eq=contrast=2.2:brightness=-0.08"},
        {"noir-detail", "Sharpened grayscale that brings out texture",
         "format=gray,unsharp=5:5:1.0:5:5:0.0,eq=contrast=1.8:brightness=-0.04"},
        {"vivid", "Saturation and contrast boost with sharpening",
         "eq=saturation=1.8:contrast=1.2:brightness=0.02,unsharp=5:5:0.8:5:5:0.0"},
        {"warm-pop", "Warmer balance with moderate saturation",
         "colorbalance=rs=0.06:gs=0.02:bs=-0.04,eq=saturation=1.35:contrast=1.12"},
        {"cool-pop", "Cooler balance with moderate saturation",
         "colorbalance=rs=-0.04:gs=0.02:bs=0.07,eq=saturation=1.28:contrast=1.10"},
        {"soft-glow", "Gentle blur and color lift",
         "gblur=sigma=1.0,eq=saturation=1.15:contrast=1.08:brightness=0.02"},
    };
    return presets;
}

static std::string trim_copy(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

const PreprocessPreset* find_preprocess_preset(const std::string& name) {
    const std::string key = trim_copy(name);
    for (const PreprocessPreset& preset : preprocess_presets()) {
        if (strcasecmp(preset.name, key.c_str()) == 0) return &preset;
    }
    return nullptr;
}

Result resolve_preprocess_filter(const std::optional<std::string>& raw_filter,
                                 const std::optional<std::string>& preset_name,
                                 std::string& filter) {
    filter.clear();
    if (raw_filter) {
        std::string f = trim_copy(*raw_filter);
        if (f.empty()) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "--preprocess cannot be empty");
        }
        filter = f;
        return Result::ok();
    }

    if (preset_name) {
        const PreprocessPreset* preset = find_preprocess_preset(*preset_name);
        if (!preset) {
            std::string available;
            for (const PreprocessPreset& p : preprocess_presets()) {
                if (!available.empty()) available += ", ";
                available += p.name;
            }
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                "unknown preprocessing preset '" + *preset_name + "'. Available presets: " + available);
        }
        filter = preset->filter;
    }
    return Result::ok();
}

std::string build_frame_extraction_vf(int columns, int fps, const std::string& preprocess_filter) {
    std::string base = "scale=" + std::to_string(columns) + ":-2,fps=" + std::to_string(fps);
    std::string pre = trim_copy(preprocess_filter);
    while (!pre.empty() && pre.back() == ',') pre.pop_back();
    pre = trim_copy(pre);
    if (pre.empty()) return base;
    return pre + "," + base;
}

static bool parse_field(const std::string& text, bool allow_fraction, double& value) {
    if (text.empty()) return false;
    size_t dots = 0;
    for (char c : text) {
        if (c == '.') {
            ++dots;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (dots > (allow_fraction ? 1u : 0u) || text == ".") return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

std::optional<double> parse_timestamp(const std::string& text) {
    const std::string s = trim_copy(text);
    if (s.empty()) return std::nullopt;

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t colon = s.find(':', start);
        parts.push_back(s.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    if (parts.size() > 3) return std::nullopt;

    double total = 0.0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const bool last = i + 1 == parts.size();
        double v = 0.0;
        if (!parse_field(parts[i], last, v)) return std::nullopt;
        // Minutes and seconds after the leading field stay below 60.
        if (i > 0 && v >= 60.0) return std::nullopt;
        total = total * 60.0 + v;
    }
    return total;
}

Result check_time_range(std::optional<double> start, std::optional<double> end, double duration) {
    if (start && *start < 0.0) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE, "start time is negative");
    }
    if (end && *end <= 0.0) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE, "end time must be positive");
    }
    if (start && end && *end <= *start) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE,
            "end time " + std::to_string(*end) + "s is not after start time " + std::to_string(*start) + "s");
    }
    if (start && duration > 0.0 && *start >= duration) {
        return Result::fail(ErrorCode::INVALID_TIME_RANGE,
            "start time " + std::to_string(*start) + "s is past the end of the media (" + std::to_string(duration) + "s)");
    }
    return Result::ok();
}

}
