#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cascii {

struct PreprocessPreset {
    const char* name;
    const char* description;
    const char* filter;
};

const std::vector<PreprocessPreset>& preprocess_presets();

// Case-insensitive lookup.
const PreprocessPreset* find_preprocess_preset(const std::string& name);

// A raw filter wins over a preset name. Leaves filter empty when neither is set.
Result resolve_preprocess_filter(const std::optional<std::string>& raw_filter,
                                 const std::optional<std::string>& preset_name,
                                 std::string& filter);

// "[preprocess,]scale=<columns>:-2,fps=<fps>"
std::string build_frame_extraction_vf(int columns, int fps, const std::string& preprocess_filter);

// Accepts SS, SS.mmm, MM:SS and HH:MM:SS.mmm.
std::optional<double> parse_timestamp(const std::string& text);

// Rejects negative or inverted ranges and a start past a known duration.
Result check_time_range(std::optional<double> start, std::optional<double> end, double duration);

}
