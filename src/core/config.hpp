#pragma once

#include "core/types.hpp"
#include <string>
#include <optional>

namespace dipc {

constexpr int CONFIG_VERSION = 1;

struct ConfigPalette {
    std::string styles = "all";
    std::string method = "de2000";
};

struct ConfigOutput {
    std::string directory = "output";
    int jpeg_quality = 95;
};

struct ConfigPerformance {
    int threads = 0;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigPalette palette;
    ConfigOutput output;
    ConfigPerformance performance;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    // On failure returns nullopt and, when given, fills error with the reason.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
