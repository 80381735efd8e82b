#include "core/config.hpp"
#include "cli/args.hpp"
#include "mapping/char_sets.hpp"
#include "media/preprocess.hpp"
#include <toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>

#include <unistd.h>
#include <pwd.h>

namespace cascii {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_app_data_dir() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

bool read_color(const toml::node_view<toml::node>& node, const char* key, Color& out, std::string& error) {
    if (!node) return true;
    const toml::array* arr = node.as_array();
    if (!arr || arr->size() != 3) {
        error = std::string(key) + " must be an array of three integers [r, g, b]";
        return false;
    }
    int rgb[3];
    for (size_t i = 0; i < 3; ++i) {
        auto v = arr->get(i)->value<int64_t>();
        if (!v || *v < 0 || *v > 255) {
            error = std::string(key) + " components must be integers between 0 and 255";
            return false;
        }
        rgb[i] = static_cast<int>(*v);
    }
    out = Color(static_cast<uint8_t>(rgb[0]), static_cast<uint8_t>(rgb[1]), static_cast<uint8_t>(rgb[2]));
    return true;
}

bool valid_timestamp(const std::string& text) {
    return text.empty() || parse_timestamp(text).has_value();
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    cfg.presets["default"] = Preset{400, 30, 0.7f, 20};
    cfg.presets["small"] = Preset{80, 24, 0.44f, 20};
    cfg.presets["large"] = Preset{800, 60, 0.7f, 20};
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/cascii";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

const Preset* Config::active_preset() const {
    auto it = presets.find(conversion.preset);
    return it != presets.end() ? &it->second : nullptr;
}

int Config::columns() const {
    if (conversion.columns) return *conversion.columns;
    const Preset* p = active_preset();
    return p ? p->columns : Preset{}.columns;
}

float Config::font_ratio() const {
    if (conversion.font_ratio) return *conversion.font_ratio;
    const Preset* p = active_preset();
    return p ? p->font_ratio : Preset{}.font_ratio;
}

int Config::luminance() const {
    if (conversion.luminance) return *conversion.luminance;
    const Preset* p = active_preset();
    return p ? p->luminance : Preset{}.luminance;
}

int Config::fps() const {
    if (video.fps) return *video.fps;
    const Preset* p = active_preset();
    return p ? p->fps : Preset{}.fps;
}

bool Config::validate(std::string& error) const {
    if (!active_preset()) {
        error = "conversion.preset '" + conversion.preset + "' is not defined";
        return false;
    }
    for (const auto& [name, p] : presets) {
        const std::string key = "presets." + name;
        if (p.columns < 1 || p.columns > 10000) {
            error = key + ".columns must be between 1 and 10000";
            return false;
        }
        if (p.fps < 1 || p.fps > 240) {
            error = key + ".fps must be between 1 and 240";
            return false;
        }
        if (!(p.font_ratio > 0.0f) || !std::isfinite(p.font_ratio)) {
            error = key + ".font_ratio must be > 0";
            return false;
        }
        if (p.luminance < 0 || p.luminance > 255) {
            error = key + ".luminance must be between 0 and 255";
            return false;
        }
    }
    if (conversion.columns && (*conversion.columns < 1 || *conversion.columns > 10000)) {
        error = "conversion.columns must be between 1 and 10000";
        return false;
    }
    if (conversion.font_ratio && (!(*conversion.font_ratio > 0.0f) || !std::isfinite(*conversion.font_ratio))) {
        error = "conversion.font_ratio must be > 0";
        return false;
    }
    if (conversion.luminance && (*conversion.luminance < 0 || *conversion.luminance > 255)) {
        error = "conversion.luminance must be between 0 and 255";
        return false;
    }
    if (conversion.palette.empty() && CharSet::get_set(conversion.char_set).empty()) {
        error = "conversion.char_set must be one of: default, short, blocky";
        return false;
    }
    if (!conversion.palette.empty()) {
        Palette palette;
        Result r = Palette::create(conversion.palette, palette);
        if (r.failure()) {
            error = "conversion.palette: " + r.message;
            return false;
        }
    }
    if (video.fps && (*video.fps < 1 || *video.fps > 240)) {
        error = "video.fps must be between 1 and 240";
        return false;
    }
    if (!valid_timestamp(video.start)) {
        error = "video.start '" + video.start + "' is not a valid timestamp";
        return false;
    }
    if (!valid_timestamp(video.end)) {
        error = "video.end '" + video.end + "' is not a valid timestamp";
        return false;
    }
    if (!video.preprocess_preset.empty() && !find_preprocess_preset(video.preprocess_preset)) {
        error = "video.preprocess_preset '" + video.preprocess_preset + "' is not a known preset";
        return false;
    }
    if (!(render.font_size >= 1.0f && render.font_size <= 512.0f)) {
        error = "render.font_size must be between 1 and 512";
        return false;
    }
    if (render.quality < 0 || render.quality > 51) {
        error = "render.quality must be between 0 and 51";
        return false;
    }
    if (pipeline.workers < 0 || pipeline.workers > 256) {
        error = "pipeline.workers must be between 0 and 256";
        return false;
    }
    if (pipeline.batch_size < 1 || pipeline.batch_size > 100000) {
        error = "pipeline.batch_size must be between 1 and 100000";
        return false;
    }
    return true;
}

Result Config::conversion_options(ConversionOptions& out) const {
    const std::string chars = conversion.palette.empty()
        ? CharSet::get_set(conversion.char_set) : conversion.palette;
    Palette palette;
    Result r = Palette::create(chars, palette);
    if (r.failure()) return r;

    out = ConversionOptions{};
    out.columns = columns();
    out.font_ratio = font_ratio();
    out.luminance_threshold = luminance();
    out.palette = palette;
    out.color = conversion.color;
    return out.validate();
}

std::optional<Config> Config::load(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        error = "config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                error = "config_version " + std::to_string(*v) + " is not supported (expected " +
                        std::to_string(CONFIG_VERSION) + ")";
                return std::nullopt;
            }
        }

        if (auto presets = tbl["presets"].as_table()) {
            for (auto&& [name, node] : *presets) {
                const toml::table* t = node.as_table();
                if (!t) {
                    error = "presets." + std::string(name.str()) + " must be a table";
                    return std::nullopt;
                }
                Preset p = cfg.presets.count(std::string(name.str())) ? cfg.presets[std::string(name.str())] : Preset{};
                if (auto v = (*t)["columns"].value<int>()) p.columns = *v;
                if (auto v = (*t)["fps"].value<int>()) p.fps = *v;
                if (auto v = (*t)["font_ratio"].value<double>()) p.font_ratio = static_cast<float>(*v);
                if (auto v = (*t)["luminance"].value<int>()) p.luminance = *v;
                cfg.presets[std::string(name.str())] = p;
            }
        }

        if (auto conversion = tbl["conversion"]) {
            if (auto v = conversion["preset"].value<std::string>()) cfg.conversion.preset = *v;
            if (auto v = conversion["palette"].value<std::string>()) cfg.conversion.palette = *v;
            if (auto v = conversion["char_set"].value<std::string>()) cfg.conversion.char_set = *v;
            if (auto v = conversion["columns"].value<int>()) cfg.conversion.columns = *v;
            if (auto v = conversion["font_ratio"].value<double>()) cfg.conversion.font_ratio = static_cast<float>(*v);
            if (auto v = conversion["luminance"].value<int>()) cfg.conversion.luminance = *v;
            if (auto v = conversion["color"].value<bool>()) cfg.conversion.color = *v;
        }

        if (auto video = tbl["video"]) {
            if (auto v = video["fps"].value<int>()) cfg.video.fps = *v;
            if (auto v = video["start"].value<std::string>()) cfg.video.start = *v;
            if (auto v = video["end"].value<std::string>()) cfg.video.end = *v;
            if (auto v = video["preprocess"].value<std::string>()) cfg.video.preprocess = *v;
            if (auto v = video["preprocess_preset"].value<std::string>()) cfg.video.preprocess_preset = *v;
            if (auto v = video["extract_audio"].value<bool>()) cfg.video.extract_audio = *v;
            if (auto v = video["keep_images"].value<bool>()) cfg.video.keep_images = *v;
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["font_path"].value<std::string>()) cfg.render.font_path = *v;
            if (auto v = render["font_size"].value<double>()) cfg.render.font_size = static_cast<float>(*v);
            if (auto v = render["quality"].value<int>()) cfg.render.quality = *v;
            if (auto v = render["mux_audio"].value<bool>()) cfg.render.mux_audio = *v;
            if (!read_color(render["foreground"], "render.foreground", cfg.render.foreground, error)) {
                return std::nullopt;
            }
            if (!read_color(render["background"], "render.background", cfg.render.background, error)) {
                return std::nullopt;
            }
        }

        if (auto pipeline = tbl["pipeline"]) {
            if (auto v = pipeline["workers"].value<int>()) cfg.pipeline.workers = *v;
            if (auto v = pipeline["strict"].value<bool>()) cfg.pipeline.strict = *v;
            if (auto v = pipeline["batch_size"].value<int>()) cfg.pipeline.batch_size = *v;
        }

        if (!cfg.validate(error)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        error = path + ": " + std::string(e.description());
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default(std::string& error) {
    return load(default_config_path(), error);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.preset.empty()) config.conversion.preset = args.preset;
    if (!args.palette.empty()) config.conversion.palette = args.palette;
    if (!args.char_set.empty()) {
        config.conversion.char_set = args.char_set;
        if (args.palette.empty()) config.conversion.palette.clear();
    }
    if (args.columns > 0) config.conversion.columns = args.columns;
    if (args.font_ratio > 0.0f) config.conversion.font_ratio = args.font_ratio;
    if (args.luminance >= 0) config.conversion.luminance = args.luminance;
    if (args.color) config.conversion.color = true;

    if (args.fps > 0) config.video.fps = args.fps;
    if (!args.start.empty()) config.video.start = args.start;
    if (!args.end.empty()) config.video.end = args.end;
    if (args.preprocess_set) {
        config.video.preprocess = args.preprocess;
        config.video.preprocess_preset.clear();
    }
    if (!args.preprocess_preset.empty()) config.video.preprocess_preset = args.preprocess_preset;
    if (args.keep_images) config.video.keep_images = true;
    if (args.extract_audio) config.video.extract_audio = true;

    if (!args.font_path.empty()) config.render.font_path = args.font_path;
    if (args.font_size > 0.0f) config.render.font_size = args.font_size;
    if (args.quality >= 0) config.render.quality = args.quality;
    if (args.mux_audio) config.render.mux_audio = true;

    if (args.workers >= 0) config.pipeline.workers = args.workers;
    if (args.strict) config.pipeline.strict = true;

    return config;
}

}
