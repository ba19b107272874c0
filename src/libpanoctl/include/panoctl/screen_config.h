#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "step_result.h"

// Display settings for one session. The protocol layer only reads it.
struct ScreenConfig {
    std::string id = "Customization";
    std::string screen_mode = "Full Screen";
    std::string play_mode = "Single";
    std::string ratio = "2:1";
    std::string color = "#dcdcdc";
    std::string align = "Left";
    int filter_opacity = 100;
    std::vector<std::string> badges = {"GPU Badge", "CPU Badge"};
    std::vector<std::string> sysinfo_display = {"CPU Temperature", "GPU Temperature"};
};

const std::vector<std::string>& screen_mode_options();
const std::vector<std::string>& play_mode_options();
const std::vector<std::string>& ratio_options();
const std::vector<std::string>& align_options();
const std::vector<std::string>& badge_options();
const std::vector<std::string>& sysinfo_options();

// Body of the waterBlockScreenId command for `media_file`.
nlohmann::json screen_config_command_body(const ScreenConfig& config, const std::string& media_file);

// Settings file format (snake_case keys); missing keys keep their defaults.
void to_json(nlohmann::json& j, const ScreenConfig& config);
void from_json(const nlohmann::json& j, ScreenConfig& config);

StepResult load_screen_config(const std::string& path, ScreenConfig& config);
StepResult save_screen_config(const std::string& path, const ScreenConfig& config);

/**
 * Apply one "field=value" assignment as typed in the shell.
 * Fields: id, screen_mode, play_mode, ratio, color, align, filter_opacity,
 * badges, sysinfo (comma separated lists; "+name"/"-name" toggles one entry).
 */
StepResult set_screen_config_field(ScreenConfig& config, const std::string& field, const std::string& value);

std::vector<std::string> screen_config_field_names();

// Adds `item` if missing, removes it otherwise.
void toggle_item(std::vector<std::string>& items, const std::string& item);
