#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <vector>
#include <chrono>
#include <thread>
#include <memory>
#include <iomanip>
#include <fstream>
#include <readline/readline.h>
#include <readline/history.h>
#include <panoctl/adb_agent.h>
#include <panoctl/screen_config.h>
#include <panoctl/telemetry.h>
#include <panoctl/transfer_controller.h>
#include "colors.h"

#define POLL_INTERVAL_MS 100

static const std::vector<std::pair<std::string, std::string>> shell_commands = {
    {"file", "Select the image to transfer (file <path>)"},
    {"port", "Set the serial device (port /dev/ttyACM0)"},
    {"set", "Change a screen setting (set ratio=16:9, set badges=+RAM Badge)"},
    {"show", "Show the current settings"},
    {"mode", "Session flow: standard or legacy"},
    {"load", "Load screen settings from a JSON file"},
    {"save", "Save screen settings to a JSON file"},
    {"transfer", "Push the image and configure the panel"},
    {"help", "Show available commands"},
    {"q", "Exit"},
};

static bool g_completing_fields = false;

char* command_generator(const char* text, int state) {
    static size_t list_index, len;

    if (!state) {
        list_index = 0;
        len = strlen(text);
    }

    while (list_index < shell_commands.size()) {
        const auto& name = shell_commands[list_index++].first;
        if (strncmp(name.c_str(), text, len) == 0) {
            return strdup(name.c_str());
        }
    }
    return NULL;
}

char* field_generator(const char* text, int state) {
    static size_t list_index, len;
    static std::vector<std::string> fields;

    if (!state) {
        list_index = 0;
        len = strlen(text);
        fields = screen_config_field_names();
    }

    while (list_index < fields.size()) {
        std::string name = fields[list_index++] + "=";
        if (strncmp(name.c_str(), text, len) == 0) {
            return strdup(name.c_str());
        }
    }
    return NULL;
}

char** shell_completion(const char* text, int start, int /*end*/) {
    std::string line(rl_line_buffer, start);
    g_completing_fields = false;

    if (start == 0) {
        rl_attempted_completion_over = 1;
        return rl_completion_matches(text, command_generator);
    }
    if (line.rfind("set ", 0) == 0) {
        rl_attempted_completion_over = 1;
        rl_completion_append_character = '\0';
        g_completing_fields = true;
        return rl_completion_matches(text, field_generator);
    }
    if (line.rfind("mode ", 0) == 0) {
        rl_attempted_completion_over = 1;
        return rl_completion_matches(text, [](const char* t, int state) -> char* {
            static const char* modes[] = {"standard", "legacy"};
            static size_t idx;
            if (!state) idx = 0;
            while (idx < 2) {
                const char* m = modes[idx++];
                if (strncmp(m, t, strlen(t)) == 0) return strdup(m);
            }
            return (char*)NULL;
        });
    }

    // file / load / save: fall back to filename completion
    return NULL;
}

extern "C" void display_matches(char** matches, int num_matches, int /*max_length*/) {
    if (!matches || num_matches <= 0) {
        return;
    }

    printf("\n");
    for (int i = 1; i <= num_matches; i++) {
        if (!matches[i]) continue;

        std::string desc;
        for (const auto& [name, d] : shell_commands) {
            if (name == matches[i]) {
                desc = d;
                break;
            }
        }

        if (!desc.empty() && !g_completing_fields) {
            printf("  %-12s - %s\n", matches[i], desc.c_str());
        } else {
            printf("  %s\n", matches[i]);
        }
    }
    printf("\n");

    rl_forced_update_display();
}

void show_help() {
    printf("\nAvailable commands:\n");
    printf("─────────────────────────────────────────────────\n");
    for (const auto& [name, desc] : shell_commands) {
        printf("  %-12s - %s\n", name.c_str(), desc.c_str());
    }
    printf("\nFields: ");
    for (const auto& f : screen_config_field_names()) {
        printf("%s ", f.c_str());
    }
    printf("\n─────────────────────────────────────────────────\n\n");
}

static std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out.empty() ? "(none)" : out;
}

void show_settings(const TransferRequest& req) {
    const ScreenConfig& c = req.config;
    std::cout << BOLDWHITE << "Device" << RESET << "\n";
    std::cout << "  port            " << req.serial.address << " @ " << req.serial.baud_rate << "\n";
    std::cout << "  image           " << (req.local_path.empty() ? "(none)" : req.local_path) << "\n";
    std::cout << "  mode            " << (req.mode == SessionMode::LEGACY ? "legacy" : "standard") << "\n";
    std::cout << BOLDWHITE << "Screen" << RESET << "\n";
    std::cout << "  id              " << c.id << "\n";
    std::cout << "  screen_mode     " << c.screen_mode << "\n";
    std::cout << "  play_mode       " << c.play_mode << "\n";
    std::cout << "  ratio           " << c.ratio << "\n";
    std::cout << "  color           " << c.color << "\n";
    std::cout << "  align           " << c.align << "\n";
    std::cout << "  filter_opacity  " << c.filter_opacity << "%\n";
    std::cout << "  badges          " << join_list(c.badges) << "\n";
    std::cout << "  sysinfo         " << join_list(c.sysinfo_display) << "\n";
}

void print_event(const SessionEvent& event) {
    switch (event.kind) {
    case SessionEvent::Kind::LOG:
        std::cout << "[*] " << event.text << "\n";
        break;
    case SessionEvent::Kind::PROGRESS:
        std::cout << CYAN << "[" << std::setw(3) << static_cast<int>(event.progress * 100) << "%] "
                  << event.text << RESET << "\n";
        break;
    case SessionEvent::Kind::SUCCESS:
        std::cout << BOLDGREEN << "[+] " << event.text << RESET << "\n";
        break;
    case SessionEvent::Kind::ERROR:
        std::cerr << BOLDRED << "ERROR: " << event.text << RESET << "\n";
        break;
    }
}

bool run_transfer(TransferController& controller) {
    switch (controller.start_transfer()) {
    case StartResult::BUSY:
        std::cerr << "ERROR: A transfer is already running\n";
        return false;
    case StartResult::NO_FILE:
        std::cerr << "ERROR: " << controller.state().status_message << " (use: file <path>)\n";
        return false;
    case StartResult::STARTED:
        break;
    }

    bool succeeded = false;
    while (true) {
        for (const auto& event : controller.poll()) {
            print_event(event);
            if (event.kind == SessionEvent::Kind::SUCCESS) succeeded = true;
        }
        if (!controller.is_processing()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    controller.join_worker();
    return succeeded;
}

static std::string clean_input(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\n\r");
    size_t end = input.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return input.substr(start, end - start + 1);
}

bool handle_set_command(TransferController& controller, const std::string& args) {
    size_t eq_pos = args.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "ERROR: Invalid format. Use: set <field>=<value>\n";
        return false;
    }

    std::string field = clean_input(args.substr(0, eq_pos));
    std::string value = args.substr(eq_pos + 1);

    StepResult r = set_screen_config_field(controller.request().config, field, value);
    if (!r) {
        std::cerr << "ERROR: " << r.error << "\n";
        return false;
    }
    std::cout << "Set " << field << "\n";
    return true;
}

void handle_command(TransferController& controller, const std::string& command) {
    size_t space_pos = command.find(' ');
    std::string name = command.substr(0, space_pos);
    std::string args = space_pos == std::string::npos ? "" : clean_input(command.substr(space_pos + 1));

    TransferRequest& req = controller.request();

    if (name == "help") {
        show_help();
    } else if (name == "show") {
        show_settings(req);
    } else if (name == "file") {
        if (args.empty()) {
            std::cerr << "Usage: file <path>\n";
            return;
        }
        std::ifstream image_file(args, std::ios::binary);
        if (!image_file.is_open()) {
            std::cerr << "ERROR: Cannot read file: " << args << "\n";
            return;
        }
        req.local_path = args;
        std::cout << "Selected: " << args << "\n";
    } else if (name == "port") {
        if (args.empty()) {
            std::cout << req.serial.address << "\n";
            return;
        }
        req.serial.address = args;
        std::cout << "Serial port: " << args << "\n";
    } else if (name == "set") {
        handle_set_command(controller, args);
    } else if (name == "mode") {
        if (args == "legacy") {
            req.mode = SessionMode::LEGACY;
        } else if (args == "standard") {
            req.mode = SessionMode::STANDARD;
        } else {
            std::cerr << "Usage: mode standard|legacy\n";
        }
    } else if (name == "load") {
        StepResult r = load_screen_config(args, req.config);
        if (!r) {
            std::cerr << "ERROR: " << r.error << "\n";
        } else {
            std::cout << "[*] Loaded " << args << "\n";
        }
    } else if (name == "save") {
        StepResult r = save_screen_config(args, req.config);
        if (!r) {
            std::cerr << "ERROR: " << r.error << "\n";
        } else {
            std::cout << "[*] Saved " << args << "\n";
        }
    } else if (name == "transfer") {
        run_transfer(controller);
    } else {
        std::cerr << "ERROR: Unknown command. Type 'help' for available commands.\n";
    }
}

static void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --port <tty>         Serial device (default: " DEFAULT_SERIAL_PORT ")\n";
    std::cout << "  -d, --device <id>        ADB device serial (optional)\n";
    std::cout << "  -f, --file <image>       Transfer this image and exit\n";
    std::cout << "  -c, --config <json>      Load screen settings from file\n";
    std::cout << "  --legacy                 Announce the file over serial (transport/transported)\n";
    std::cout << "  -v, --verbose            Log frame hex dumps\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PANOCTL_SERIAL_PORT, PANOCTL_DEVICE_ID\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << prog_name << " -f wallpaper.png\n";
    std::cout << "  " << prog_name << " -p /dev/ttyACM1 -c panel.json -f loop.gif\n";
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
    req.mode = legacy ? SessionMode::LEGACY : SessionMode::STANDARD;
    req.verbose = verbose;

    if (!config_file.empty()) {
        StepResult r = load_screen_config(config_file, req.config);
        if (!r) {
            std::cerr << "ERROR: " << r.error << "\n";
            return 1;
        }
        std::cout << "[*] Loaded settings from " << config_file << "\n";
    }

    if (!image_file.empty()) {
        req.local_path = image_file;
        return run_transfer(controller) ? 0 : 1;
    }

    std::cout << "\npanoctl interactive shell\n";
    std::cout << "Type 'help' for commands, 'q' to exit.\n\n";

    rl_attempted_completion_function = shell_completion;
    rl_completion_display_matches_hook = display_matches;
    rl_variable_bind("enable-bracketed-paste", "off");

    while (true) {
        char* input = readline(BOLDCYAN "panoctl> " RESET);

        if (!input) {
            std::cout << "\nExiting...\n";
            break;
        }

        std::string command = clean_input(std::string(input));
        if (command.empty()) {
            free(input);
            continue;
        }

        add_history(input);
        free(input);

        if (command == "q" || command == "quit" || command == "exit") {
            break;
        }

        handle_command(controller, command);
    }

    return 0;
}
