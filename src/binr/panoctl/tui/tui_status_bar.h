#pragma once

#include <ftxui/dom/elements.hpp>
#include <panoctl/transfer_controller.h>

ftxui::Element render_status_bar(const TransferController& controller);
ftxui::Element render_progress_bar(const TransferState& state);
