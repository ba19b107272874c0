#include <panoctl/adb_agent.h>
#include <sys/wait.h>
#include <cstdio>
#include <algorithm>
#include <sstream>

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

int run_command(const std::string& command, std::string& output) {
    std::string full = command + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        return -1;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

static std::string trim_output(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    size_t end = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

std::vector<std::string> parse_adb_devices(const std::string& output) {
    std::vector<std::string> devices;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim_output(line);
        if (line.empty() || line.rfind("List of devices", 0) == 0 || line[0] == '*') {
            continue;
        }

        size_t tab_pos = line.find_first_of("\t ");
        if (tab_pos == std::string::npos) {
            continue;
        }

        std::string dev_id = line.substr(0, tab_pos);
        std::string state = trim_output(line.substr(tab_pos + 1));
        if (state == "device") {
            devices.push_back(dev_id);
        }
    }

    return devices;
}

AdbAgent::AdbAgent(const std::string& device_id, const std::string& adb_path)
    : device_id(device_id), adb_path(adb_path) {}

std::string AdbAgent::adb_command(const std::string& args) const {
    std::string cmd = adb_path;
    if (!device_id.empty()) {
        cmd += " -s " + shell_quote(device_id);
    }
    return cmd + " " + args;
}

StepResult AdbAgent::list_devices(std::vector<std::string>& devices) {
    std::string output;
    int status = run_command(adb_path + " devices", output);
    if (status != 0) {
        return StepResult::fail("Failed to execute 'adb devices'" +
                                (output.empty() ? std::string() : ": " + trim_output(output)));
    }

    devices = parse_adb_devices(output);
    return StepResult::ok();
}

StepResult AdbAgent::wait_until_device_ready() {
    std::vector<std::string> devices;
    StepResult listed = list_devices(devices);
    if (!listed) {
        return listed;
    }

    // An empty list means the panel may still be booting; wait-for-device covers it.
    if (!devices.empty()) {
        if (device_id.empty() && devices.size() > 1) {
            std::string msg = "Multiple devices found, specify one with -d:";
            for (const auto& dev : devices) {
                msg += " " + dev;
            }
            return StepResult::fail(msg);
        }

        if (!device_id.empty() &&
            std::find(devices.begin(), devices.end(), device_id) == devices.end()) {
            return StepResult::fail("Specified device '" + device_id + "' not found");
        }
    }

    std::string output;
    int status = run_command(adb_command("wait-for-device"), output);
    if (status != 0) {
        return StepResult::fail("ADB wait-for-device failed" +
                                (output.empty() ? std::string() : ": " + trim_output(output)));
    }
    return StepResult::ok();
}

StepResult AdbAgent::push(const std::string& local_path, const std::string& remote_path) {
    std::string output;
    int status = run_command(adb_command("push " + shell_quote(local_path) + " " + shell_quote(remote_path)),
                             output);
    if (status < 0) {
        return StepResult::fail("Failed to execute adb push");
    }
    if (status != 0) {
        return StepResult::fail("ADB push failed (exit " + std::to_string(status) + "): " + trim_output(output));
    }
    return StepResult::ok();
}

StepResult AdbAgent::stat_size(const std::string& remote_path, std::uint64_t& size) {
    std::string output;
    // The device shell re-parses the argument, so quote for both shells.
    std::string remote_cmd = "stat -c %s " + shell_quote(remote_path);
    int status = run_command(adb_command("shell " + shell_quote(remote_cmd)), output);
    if (status != 0) {
        return StepResult::fail("stat " + remote_path + " failed: " + trim_output(output));
    }

    try {
        size_t used = 0;
        std::string text = trim_output(output);
        size = std::stoull(text, &used);
        if (used != text.size()) {
            return StepResult::fail("Unexpected stat output: " + text);
        }
    } catch (const std::exception&) {
        return StepResult::fail("Unexpected stat output: " + trim_output(output));
    }
    return StepResult::ok();
}
