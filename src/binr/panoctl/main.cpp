#include <iostream>
#include <string>
#include <cstdlib>
#include <memory>
#include <panoctl/adb_agent.h>
#include <panoctl/screen_config.h>
#include <panoctl/telemetry.h>
#include <panoctl/transfer_controller.h>
#include "tui/tui_app.h"

static void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --port <tty>         Serial device (default: " DEFAULT_SERIAL_PORT ")\n";
    std::cout << "  -d, --device <id>        ADB device serial (optional)\n";
    std::cout << "  -f, --file <image>       Preselect an image\n";
    std::cout << "  -c, --config <json>      Load screen settings from file\n";
    std::cout << "  --legacy                 Announce the file over serial (transport/transported)\n";
    std::cout << "  -v, --verbose            Log frame hex dumps\n";
    std::cout << "  -h, --help               Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string serial_port;
    std::string device_id;
    std::string image_file;
    std::string config_file;
    bool legacy = false;
    bool verbose = false;

    if (const char* env = getenv("PANOCTL_SERIAL_PORT")) serial_port = env;
    if (const char* env = getenv("PANOCTL_DEVICE_ID")) device_id = env;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            serial_port = argv[++i];
        } else if ((arg == "-d" || arg == "--device") && i + 1 < argc) {
            device_id = argv[++i];
        } else if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            image_file = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--legacy") {
            legacy = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    TransferController controller(std::make_shared<AdbAgent>(device_id),
                                  std::make_shared<SysfsTelemetrySource>());

    TransferRequest& req = controller.request();
    if (!serial_port.empty()) req.serial.address = serial_port;
    req.local_path = image_file;
    req.mode = legacy ? SessionMode::LEGACY : SessionMode::STANDARD;
    req.verbose = verbose;

    if (!config_file.empty()) {
        StepResult r = load_screen_config(config_file, req.config);
        if (!r) {
            std::cerr << "ERROR: " << r.error << "\n";
            return 1;
        }
    }

    TuiApp app(controller);
    int rc = app.run();

    if (controller.is_processing()) {
        std::cout << "[*] Waiting for the running transfer to finish...\n";
    }
    return rc;
}
