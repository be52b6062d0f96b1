#include "core/config.hpp"
#include "cli/args.hpp"
#include "core/delta_e.hpp"
#include "palette/style_selection.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>
#include <pwd.h>

namespace dipc {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_config_home() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_config_home() + "/dipc";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    StyleSelection selection;
    Result r = parse_style_selection(palette.styles, selection);
    if (r.failure()) {
        error = "palette.styles: " + describe(r);
        return false;
    }
    if (!parse_distance_method(palette.method)) {
        error = "palette.method must be one of de2000, de1994g, de1994t, de1976";
        return false;
    }
    if (output.directory.empty()) {
        error = "output.directory must not be empty";
        return false;
    }
    if (output.jpeg_quality < 1 || output.jpeg_quality > 100) {
        error = "output.jpeg_quality must be between 1 and 100";
        return false;
    }
    if (performance.threads < 0 || performance.threads > 1024) {
        error = "performance.threads must be between 0 and 1024";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        set_error(error, "file does not exist");
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                set_error(error, "unsupported config_version " + std::to_string(*v));
                return std::nullopt;
            }
        }

        if (auto palette = tbl["palette"]) {
            if (auto v = palette["styles"].value<std::string>()) cfg.palette.styles = *v;
            if (auto v = palette["method"].value<std::string>()) cfg.palette.method = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["directory"].value<std::string>()) cfg.output.directory = *v;
            if (auto v = output["jpeg_quality"].value<int>()) cfg.output.jpeg_quality = *v;
        }

        if (auto performance = tbl["performance"]) {
            if (auto v = performance["threads"].value<int>()) cfg.performance.threads = *v;
        }

        std::string validation_error;
        if (!cfg.validate(validation_error)) {
            set_error(error, validation_error);
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << e.description() << " (" << e.source().begin << ")";
        set_error(error, ss.str());
        return std::nullopt;
    }
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config defaults = Config::defaults();

    if (override.palette.styles != defaults.palette.styles) result.palette.styles = override.palette.styles;
    if (override.palette.method != defaults.palette.method) result.palette.method = override.palette.method;
    if (override.output.directory != defaults.output.directory) result.output.directory = override.output.directory;
    if (override.output.jpeg_quality != defaults.output.jpeg_quality)
        result.output.jpeg_quality = override.output.jpeg_quality;
    if (override.performance.threads != defaults.performance.threads)
        result.performance.threads = override.performance.threads;
    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.styles_set) config.palette.styles = args.styles;
    if (!args.method.empty()) config.palette.method = args.method;
    if (!args.output_dir.empty()) config.output.directory = args.output_dir;
    if (args.threads >= 0) config.performance.threads = args.threads;
    if (!args.config_path.empty()) config.config_path = args.config_path;
    return config;
}

}
