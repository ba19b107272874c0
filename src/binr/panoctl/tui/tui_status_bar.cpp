#include "tui_status_bar.h"
#include <ftxui/dom/elements.hpp>

using namespace ftxui;

Element render_status_bar(const TransferController& controller) {
    const TransferRequest& req = controller.request();
    const TransferState& state = controller.state();

    auto sep = text(" \u2502 ") | color(Color::GrayDark); // │

    Elements items;

    // Badge
    items.push_back(text(" PANOCTL ") | bold | color(Color::Black) | bgcolor(Color::Cyan));
    items.push_back(text(" "));

    // Port
    items.push_back(text(req.serial.address) | bold | color(Color::White));
    items.push_back(text(" @" + std::to_string(req.serial.baud_rate)) | color(Color::GrayLight));

    // Mode
    items.push_back(sep);
    items.push_back(text(req.mode == SessionMode::LEGACY ? "legacy" : "standard") | color(Color::GrayLight));

    // Image
    if (!req.local_path.empty()) {
        items.push_back(sep);
        items.push_back(text(req.local_path) | color(Color::Yellow));
    }

    items.push_back(filler());

    if (state.is_processing) {
        items.push_back(text("\u25CF") | blink | color(Color::Yellow));
        items.push_back(text(" transferring ") | color(Color::Yellow));
    } else if (state.status_message.rfind("Error", 0) == 0) {
        items.push_back(text("\u25CF failed ") | color(Color::Red));
    } else {
        items.push_back(text("\u25CF idle ") | color(Color::Green));
    }

    return hbox(std::move(items)) | bgcolor(Color::Palette256(235));
}

Element render_progress_bar(const TransferState& state) {
    int percent = static_cast<int>(state.progress * 100.0f + 0.5f);

    Color bar_color = Color::Cyan;
    if (state.status_message.rfind("Error", 0) == 0) {
        bar_color = Color::Red;
    } else if (!state.is_processing && state.progress >= 1.0f) {
        bar_color = Color::Green;
    }

    return hbox({
        text(" " + state.status_message + " ") | bold | color(bar_color),
        gauge(state.progress) | color(bar_color) | flex,
        text(" " + std::to_string(percent) + "% ") | color(Color::GrayLight),
    });
}
