#include <panoctl/screen_config.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const std::vector<std::string>& screen_mode_options() {
    static const std::vector<std::string> options = {"Full Screen", "Window"};
    return options;
}

const std::vector<std::string>& play_mode_options() {
    static const std::vector<std::string> options = {"Single", "Loop", "Slideshow"};
    return options;
}

const std::vector<std::string>& ratio_options() {
    static const std::vector<std::string> options = {"2:1", "16:9", "4:3", "1:1"};
    return options;
}

const std::vector<std::string>& align_options() {
    static const std::vector<std::string> options = {"Left", "Center", "Right"};
    return options;
}

const std::vector<std::string>& badge_options() {
    static const std::vector<std::string> options = {"CPU Badge", "GPU Badge", "RAM Badge", "FPS Badge"};
    return options;
}

const std::vector<std::string>& sysinfo_options() {
    static const std::vector<std::string> options = {
        "CPU Temperature", "GPU Temperature", "CPU Usage",
        "GPU Usage", "RAM Usage", "Fan Speed",
    };
    return options;
}

json screen_config_command_body(const ScreenConfig& config, const std::string& media_file) {
    return json{
        {"id", config.id},
        {"screenMode", config.screen_mode},
        {"playMode", config.play_mode},
        {"ratio", config.ratio},
        {"media", json::array({media_file})},
        {"settings", {
            {"color", config.color},
            {"align", config.align},
            {"filter", {
                {"value", nullptr},
                {"opacity", config.filter_opacity},
            }},
            {"badges", config.badges},
        }},
        {"sysinfoDisplay", config.sysinfo_display},
    };
}

void to_json(json& j, const ScreenConfig& config) {
    j = json{
        {"id", config.id},
        {"screen_mode", config.screen_mode},
        {"play_mode", config.play_mode},
        {"ratio", config.ratio},
        {"color", config.color},
        {"align", config.align},
        {"filter_opacity", config.filter_opacity},
        {"badges", config.badges},
        {"sysinfo_display", config.sysinfo_display},
    };
}

void from_json(const json& j, ScreenConfig& config) {
    ScreenConfig defaults;
    config.id = j.value("id", defaults.id);
    config.screen_mode = j.value("screen_mode", defaults.screen_mode);
    config.play_mode = j.value("play_mode", defaults.play_mode);
    config.ratio = j.value("ratio", defaults.ratio);
    config.color = j.value("color", defaults.color);
    config.align = j.value("align", defaults.align);
    config.filter_opacity = std::max(0, std::min(100, j.value("filter_opacity", defaults.filter_opacity)));
    config.badges = j.value("badges", defaults.badges);
    config.sysinfo_display = j.value("sysinfo_display", defaults.sysinfo_display);
}

StepResult load_screen_config(const std::string& path, ScreenConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StepResult::fail("Cannot read config file: " + path);
    }

    try {
        json j = json::parse(file);
        config = j.get<ScreenConfig>();
    } catch (const json::exception& e) {
        return StepResult::fail("Invalid config file " + path + ": " + e.what());
    }
    return StepResult::ok();
}

StepResult save_screen_config(const std::string& path, const ScreenConfig& config) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return StepResult::fail("Cannot write config file: " + path);
    }

    file << json(config).dump(2) << "\n";
    if (!file) {
        return StepResult::fail("Write failed: " + path);
    }
    return StepResult::ok();
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    size_t end = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

static bool is_one_of(const std::string& value, const std::vector<std::string>& options) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

static StepResult set_choice(std::string& target, const std::string& value,
                             const std::vector<std::string>& options) {
    if (!is_one_of(value, options)) {
        return StepResult::fail("'" + value + "' is not one of: " + join(options));
    }
    target = value;
    return StepResult::ok();
}

void toggle_item(std::vector<std::string>& items, const std::string& item) {
    auto it = std::find(items.begin(), items.end(), item);
    if (it != items.end()) {
        items.erase(it);
    } else {
        items.push_back(item);
    }
}

static StepResult set_list(std::vector<std::string>& target, const std::string& value,
                           const std::vector<std::string>& options) {
    if (!value.empty() && (value[0] == '+' || value[0] == '-')) {
        std::string item = trim(value.substr(1));
        if (!is_one_of(item, options)) {
            return StepResult::fail("'" + item + "' is not one of: " + join(options));
        }
        bool present = std::find(target.begin(), target.end(), item) != target.end();
        if ((value[0] == '+') != present) {
            toggle_item(target, item);
        }
        return StepResult::ok();
    }

    std::vector<std::string> items = split_list(value);
    for (const auto& item : items) {
        if (!is_one_of(item, options)) {
            return StepResult::fail("'" + item + "' is not one of: " + join(options));
        }
    }
    target = items;
    return StepResult::ok();
}

StepResult set_screen_config_field(ScreenConfig& config, const std::string& field, const std::string& value) {
    std::string v = trim(value);

    if (field == "id") {
        if (v.empty()) return StepResult::fail("id must not be empty");
        config.id = v;
    } else if (field == "screen_mode") {
        return set_choice(config.screen_mode, v, screen_mode_options());
    } else if (field == "play_mode") {
        return set_choice(config.play_mode, v, play_mode_options());
    } else if (field == "ratio") {
        return set_choice(config.ratio, v, ratio_options());
    } else if (field == "align") {
        return set_choice(config.align, v, align_options());
    } else if (field == "color") {
        if (v.size() != 7 || v[0] != '#' ||
            v.find_first_not_of("0123456789abcdefABCDEF", 1) != std::string::npos) {
            return StepResult::fail("color must look like #rrggbb");
        }
        config.color = v;
    } else if (field == "filter_opacity") {
        int opacity = 0;
        try {
            size_t used = 0;
            opacity = std::stoi(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
        } catch (const std::exception&) {
            return StepResult::fail("filter_opacity must be a number");
        }
        if (opacity < 0 || opacity > 100) {
            return StepResult::fail("filter_opacity must be within 0-100");
        }
        config.filter_opacity = opacity;
    } else if (field == "badges") {
        return set_list(config.badges, v, badge_options());
    } else if (field == "sysinfo") {
        return set_list(config.sysinfo_display, v, sysinfo_options());
    } else {
        return StepResult::fail("Unknown field: " + field);
    }
    return StepResult::ok();
}

std::vector<std::string> screen_config_field_names() {
    return {"id", "screen_mode", "play_mode", "ratio", "color", "align",
            "filter_opacity", "badges", "sysinfo"};
}
