#pragma once

#include "file_agent.h"
#include <string>
#include <vector>

/**
 * IFileAgent backed by the adb command line tool.
 * With an empty device id the single attached device is used; several
 * attached devices then require an explicit id.
 */
class AdbAgent : public IFileAgent {
public:
    explicit AdbAgent(const std::string& device_id = "", const std::string& adb_path = "adb");

    StepResult wait_until_device_ready() override;
    StepResult push(const std::string& local_path, const std::string& remote_path) override;
    StepResult stat_size(const std::string& remote_path, std::uint64_t& size) override;

    /**
     * Query attached devices ("adb devices")
     * @param devices Receives serials of devices in the "device" state
     */
    StepResult list_devices(std::vector<std::string>& devices);

    const std::string& get_device_id() const { return device_id; }

private:
    std::string device_id;
    std::string adb_path;

    std::string adb_command(const std::string& args) const;
};

// Serials in the "device" state from `adb devices` output; the header line,
// offline and unauthorized entries are skipped.
std::vector<std::string> parse_adb_devices(const std::string& output);

// Single-quote `arg` for /bin/sh.
std::string shell_quote(const std::string& arg);

/**
 * Run a shell command, capturing stdout and stderr
 * @return process exit status, or -1 if it could not be started
 */
int run_command(const std::string& command, std::string& output);
