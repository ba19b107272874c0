#pragma once

#include <ftxui/component/component.hpp>
#include <panoctl/transfer_controller.h>

ftxui::Component CreateSettingsTab(TransferController& controller);
