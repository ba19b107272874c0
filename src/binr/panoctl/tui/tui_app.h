#pragma once

#include <panoctl/transfer_controller.h>

class TuiApp {
public:
    explicit TuiApp(TransferController& controller);
    int run();

private:
    TransferController& controller_;
};
