#pragma once

#include "core/types.hpp"
#include "mapping/char_mapper.hpp"
#include <map>
#include <optional>
#include <string>

namespace cascii {

constexpr int CONFIG_VERSION = 1;

struct Args;

struct Preset {
    int columns = 400;
    int fps = 30;
    float font_ratio = 0.7f;
    int luminance = 20;
};

struct ConfigConversion {
    std::string preset = "default";
    // Explicit palette; wins over char_set when set.
    std::string palette;
    std::string char_set = "default";
    // Unset values come from the active preset.
    std::optional<int> columns;
    std::optional<float> font_ratio;
    std::optional<int> luminance;
    bool color = false;
};

struct ConfigVideo {
    std::optional<int> fps;
    std::string start;
    std::string end;
    std::string preprocess;
    std::string preprocess_preset;
    bool extract_audio = false;
    bool keep_images = false;
};

struct ConfigRender {
    std::string font_path;
    float font_size = 13.0f;
    int quality = 18;
    bool mux_audio = false;
    Color foreground = Color(230, 230, 230);
    Color background = Color(0, 0, 0);
};

struct ConfigPipeline {
    int workers = 0;
    bool strict = false;
    int batch_size = 64;
};

struct Config {
    int version = CONFIG_VERSION;
    std::string config_path;

    ConfigConversion conversion;
    ConfigVideo video;
    ConfigRender render;
    ConfigPipeline pipeline;
    std::map<std::string, Preset> presets;

    static Config defaults();
    static std::string default_config_dir();
    static std::string default_config_path();

    bool validate(std::string& error) const;

    static std::optional<Config> load(const std::string& path, std::string& error);
    static std::optional<Config> load_default(std::string& error);

    const Preset* active_preset() const;
    int columns() const;
    float font_ratio() const;
    int luminance() const;
    int fps() const;

    Result conversion_options(ConversionOptions& out) const;
};

Config apply_cli_overrides(Config config, const Args& args);

}
