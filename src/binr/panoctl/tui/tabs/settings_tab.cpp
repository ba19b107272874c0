#include "settings_tab.h"
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <algorithm>
#include <deque>

using namespace ftxui;

static int index_of(const std::vector<std::string>& options, const std::string& value) {
    auto it = std::find(options.begin(), options.end(), value);
    return it == options.end() ? 0 : static_cast<int>(it - options.begin());
}

class SettingsTabImpl : public ComponentBase {
public:
    explicit SettingsTabImpl(TransferController& controller)
        : controller_(controller) {
        const TransferRequest& req = controller_.request();
        const ScreenConfig& c = req.config;

        image_path_ = req.local_path;
        port_ = req.serial.address;
        id_ = c.id;
        color_ = c.color;
        opacity_ = c.filter_opacity;
        legacy_ = req.mode == SessionMode::LEGACY;
        screen_mode_idx_ = index_of(screen_mode_options(), c.screen_mode);
        play_mode_idx_ = index_of(play_mode_options(), c.play_mode);
        ratio_idx_ = index_of(ratio_options(), c.ratio);
        align_idx_ = index_of(align_options(), c.align);

        for (const auto& b : badge_options()) {
            badge_checked_.push_back(std::find(c.badges.begin(), c.badges.end(), b) != c.badges.end());
        }
        for (const auto& s : sysinfo_options()) {
            sysinfo_checked_.push_back(
                std::find(c.sysinfo_display.begin(), c.sysinfo_display.end(), s) != c.sysinfo_display.end());
        }

        image_input_ = Input(&image_path_, "path/to/image.png");
        port_input_ = Input(&port_, DEFAULT_SERIAL_PORT);
        id_input_ = Input(&id_, "Customization");
        color_input_ = Input(&color_, "#rrggbb");
        screen_mode_ = Dropdown(&screen_mode_options(), &screen_mode_idx_);
        play_mode_ = Dropdown(&play_mode_options(), &play_mode_idx_);
        ratio_ = Radiobox(&ratio_options(), &ratio_idx_);
        align_ = Radiobox(&align_options(), &align_idx_);
        opacity_slider_ = Slider("", &opacity_, 0, 100, 5);
        legacy_box_ = Checkbox("Legacy announce (transport/transported)", &legacy_);

        auto badges = Container::Vertical({});
        for (size_t i = 0; i < badge_options().size(); i++) {
            badges->Add(Checkbox(badge_options()[i], &badge_checked_[i]));
        }
        badges_ = badges;

        auto sysinfo = Container::Vertical({});
        for (size_t i = 0; i < sysinfo_options().size(); i++) {
            sysinfo->Add(Checkbox(sysinfo_options()[i], &sysinfo_checked_[i]));
        }
        sysinfo_ = sysinfo;

        transfer_button_ = Button(" Transfer ", [this] { on_transfer(); });

        Add(Container::Vertical({
            image_input_,
            port_input_,
            id_input_,
            screen_mode_,
            play_mode_,
            ratio_,
            align_,
            color_input_,
            opacity_slider_,
            badges_,
            sysinfo_,
            legacy_box_,
            transfer_button_,
        }));
    }

    Element Render() override {
        bool busy = controller_.is_processing();
        if (!busy) {
            apply_form();
        }

        auto label = [](const std::string& name) {
            return text(" " + name) | color(Color::GrayLight) | size(WIDTH, EQUAL, 14);
        };
        auto row = [&](const std::string& name, Element value) {
            return hbox({label(name), value | flex});
        };

        Element color_row = row("Color", hbox({
            color_input_->Render() | size(WIDTH, EQUAL, 10),
            color_error_.empty() ? text("") : text(" " + color_error_) | color(Color::Red),
        }));

        Element notice_el = text("");
        if (!notice_.empty()) {
            notice_el = text(" " + notice_) | color(Color::Yellow);
        }

        return vbox({
            text(" Transfer") | bold | color(Color::Cyan),
            separator() | color(Color::GrayDark),
            row("Image", image_input_->Render()),
            row("Serial port", port_input_->Render()),
            separator() | color(Color::GrayDark),
            text(" Screen") | bold | color(Color::Cyan),
            row("Id", id_input_->Render()),
            row("Screen mode", screen_mode_->Render()),
            row("Play mode", play_mode_->Render()),
            row("Ratio", ratio_->Render()),
            row("Align", align_->Render()),
            color_row,
            row("Opacity", hbox({
                opacity_slider_->Render() | flex,
                text(" " + std::to_string(opacity_) + "% "),
            })),
            hbox({
                vbox({text(" Badges") | color(Color::GrayLight), badges_->Render()}) | flex,
                vbox({text(" Sysinfo") | color(Color::GrayLight), sysinfo_->Render()}) | flex,
            }),
            legacy_box_->Render(),
            separator() | color(Color::GrayDark),
            hbox({
                busy ? (transfer_button_->Render() | dim) : transfer_button_->Render(),
                notice_el,
            }),
        }) | flex;
    }

private:
    // Copies widget values into the request for the next transfer.
    void apply_form() {
        TransferRequest& req = controller_.request();
        ScreenConfig& c = req.config;

        req.local_path = image_path_;
        req.serial.address = port_.empty() ? DEFAULT_SERIAL_PORT : port_;
        req.mode = legacy_ ? SessionMode::LEGACY : SessionMode::STANDARD;

        if (!id_.empty()) c.id = id_;
        c.screen_mode = screen_mode_options()[screen_mode_idx_];
        c.play_mode = play_mode_options()[play_mode_idx_];
        c.ratio = ratio_options()[ratio_idx_];
        c.align = align_options()[align_idx_];
        c.filter_opacity = opacity_;

        StepResult r = set_screen_config_field(c, "color", color_);
        color_error_ = r ? "" : r.error;

        c.badges.clear();
        for (size_t i = 0; i < badge_options().size(); i++) {
            if (badge_checked_[i]) c.badges.push_back(badge_options()[i]);
        }
        c.sysinfo_display.clear();
        for (size_t i = 0; i < sysinfo_options().size(); i++) {
            if (sysinfo_checked_[i]) c.sysinfo_display.push_back(sysinfo_options()[i]);
        }
    }

    void on_transfer() {
        if (!controller_.is_processing()) {
            apply_form();
        }
        if (!color_error_.empty()) {
            notice_ = "Fix the color first";
            return;
        }

        switch (controller_.start_transfer()) {
        case StartResult::STARTED:
            notice_.clear();
            break;
        case StartResult::BUSY:
            notice_ = "A transfer is already running";
            break;
        case StartResult::NO_FILE:
            notice_ = "Select an image first";
            break;
        }
    }

    TransferController& controller_;

    std::string image_path_;
    std::string port_;
    std::string id_;
    std::string color_;
    int opacity_ = 100;
    bool legacy_ = false;
    int screen_mode_idx_ = 0;
    int play_mode_idx_ = 0;
    int ratio_idx_ = 0;
    int align_idx_ = 0;
    // deque keeps element addresses stable for the checkboxes
    std::deque<bool> badge_checked_;
    std::deque<bool> sysinfo_checked_;

    std::string color_error_;
    std::string notice_;

    Component image_input_;
    Component port_input_;
    Component id_input_;
    Component color_input_;
    Component screen_mode_;
    Component play_mode_;
    Component ratio_;
    Component align_;
    Component opacity_slider_;
    Component badges_;
    Component sysinfo_;
    Component legacy_box_;
    Component transfer_button_;
};

Component CreateSettingsTab(TransferController& controller) {
    return Make<SettingsTabImpl>(controller);
}
