#include "tui_app.h"
#include "tui_status_bar.h"
#include "tabs/settings_tab.h"
#include "tabs/logs_tab.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

using namespace ftxui;

#define TICK_INTERVAL_MS 100

TuiApp::TuiApp(TransferController& controller)
    : controller_(controller) {}

int TuiApp::run() {
    auto screen = ScreenInteractive::Fullscreen();

    auto settings_panel = CreateSettingsTab(controller_);
    auto logs_panel = CreateLogsTab(controller_);
    auto layout = Container::Horizontal({settings_panel, logs_panel});

    auto app_renderer = Renderer(layout, [&] {
        // Events are applied on the UI thread only.
        controller_.poll();

        auto dim_c = Color::GrayDark;

        auto main_content = hbox({
            settings_panel->Render() | size(WIDTH, GREATER_THAN, 48),
            separator(),
            logs_panel->Render() | flex,
        }) | border | flex;

        auto status = render_status_bar(controller_);
        auto progress = render_progress_bar(controller_.state());

        auto help = hbox({
            text(" Tab") | bold | color(Color::White),
            text(" next field") | color(dim_c),
            text("  \u2190\u2192") | bold | color(Color::White),
            text(" panel") | color(dim_c),
            text("  Enter") | bold | color(Color::White),
            text(" select") | color(dim_c),
            text("  ^Q") | bold | color(Color::White),
            text(" quit") | color(dim_c),
            filler(),
        }) | bgcolor(Color::Palette256(235));

        return vbox({
            status,
            main_content | flex,
            progress,
            help,
        });
    });

    auto app = CatchEvent(app_renderer, [&](Event event) -> bool {
        if (event == Event::Special("\x11")) {
            screen.Exit();
            return true;
        }
        return false;
    });

    // Drives poll() while a worker is producing events.
    std::atomic<bool> ticking{true};
    std::thread ticker([&] {
        while (ticking.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(TICK_INTERVAL_MS));
            screen.Post(Event::Custom);
        }
    });

    screen.Loop(app);

    ticking.store(false);
    ticker.join();
    return 0;
}
