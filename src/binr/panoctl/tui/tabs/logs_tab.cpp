#include "logs_tab.h"
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>

using namespace ftxui;

class LogsTabImpl : public ComponentBase {
public:
    explicit LogsTabImpl(const TransferController& controller)
        : controller_(controller) {}

    Element Render() override {
        const auto& lines = controller_.state().log_lines;

        auto header = hbox({
            controller_.is_processing()
                ? (text(" \u25CF LIVE") | bold | color(Color::Green))
                : (text(" \u25CB IDLE") | color(Color::GrayDark)),
            filler(),
            text(std::to_string(lines.size()) + " lines ") | color(Color::GrayDark),
        });

        Elements log_elements;
        if (lines.empty()) {
            log_elements.push_back(text("  No transfer yet") | color(Color::GrayDark));
        }

        for (const auto& line : lines) {
            Element el;
            if (line.rfind("Sending ", 0) == 0 || line.rfind("  ", 0) == 0) {
                el = text(" " + line) | color(Color::Cyan);
            } else if (line.find("failed") != std::string::npos ||
                       line.find("mismatch") != std::string::npos ||
                       line.find("Could not") != std::string::npos) {
                el = text(" " + line) | color(Color::Red);
            } else if (line == "Transfer complete!") {
                el = text(" " + line) | bold | color(Color::Green);
            } else {
                el = text(" " + line) | color(Color::GrayLight);
            }
            log_elements.push_back(el);
        }

        auto log_box = vbox(std::move(log_elements));
        if (auto_scroll_) {
            log_box = log_box | focusPositionRelative(0, 1);
        }
        log_box = log_box | vscroll_indicator | yframe | flex;

        auto controls = hbox({
            text(" a") | bold | color(Color::White),
            text(":scroll") | color(Color::GrayDark),
            text(auto_scroll_ ? "[on]" : "[off]")
                | color(auto_scroll_ ? Color::Green : Color::GrayDark),
        });

        auto title = hbox({
            text(" Log") | bold | color(Focused() ? Color::Cyan : Color::GrayLight),
            header | flex,
        });

        return vbox({
            title,
            separator() | color(Color::GrayDark),
            log_box | flex,
            controls,
        }) | flex;
    }

    bool OnEvent(Event event) override {
        if (event == Event::Character('a')) {
            auto_scroll_ = !auto_scroll_;
            return true;
        }
        return false;
    }

    bool Focusable() const override { return true; }

private:
    const TransferController& controller_;
    bool auto_scroll_ = true;
};

Component CreateLogsTab(const TransferController& controller) {
    return Make<LogsTabImpl>(controller);
}
