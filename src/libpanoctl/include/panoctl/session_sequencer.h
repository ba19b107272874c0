#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "serial_port.h"
#include "screen_config.h"
#include "session_event.h"
#include "step_result.h"
#include "telemetry.h"

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Pacing required by the panel firmware. Not tunables.
namespace session_timing {
constexpr std::chrono::milliseconds SETTLE{500};
constexpr std::chrono::milliseconds STEP_GAP{300};
constexpr std::chrono::milliseconds KEEPALIVE_INTERVAL{800};
constexpr int SUSTAINED_KEEPALIVES = 5;
}

// Older announce-over-serial flow; its constants are kept apart on purpose.
namespace legacy_timing {
constexpr std::chrono::milliseconds SETTLE{500};
constexpr std::chrono::milliseconds STEP_GAP{300};
constexpr std::chrono::milliseconds TAIL{500};
}

void sleep_for(std::chrono::milliseconds duration);

/**
 * Drives one configuration session over an already-open port.
 *
 *   settle, all, mediaDelete, all, waterBlockScreenId, 5 x (800ms, all)
 *
 * The port is used as a fire-and-forget command channel; nothing is read
 * back. The first failed write or flush aborts the remaining steps.
 */
class SessionSequencer {
public:
    SessionSequencer(ISerialPort& port, ITelemetrySource& telemetry, EventChannel& events,
                     Sleeper sleeper = sleep_for);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    // Progress range reported while the session runs.
    void set_progress_range(float start, float end);

    StepResult run(const std::string& file_name, const ScreenConfig& config);

    // Announces the file over the serial link (transport / transported)
    // instead of cleaning up media and keeping the link alive.
    StepResult run_legacy(const std::string& file_name, std::uint64_t file_size,
                          const std::string& file_md5, const ScreenConfig& config);

    /**
     * Frame and write a single command, then flush
     * @param command_name Wire command name
     * @param body JSON body
     */
    StepResult send_command(const std::string& command_name, const nlohmann::json& body);

    StepResult send_keepalive();

    int commands_sent() const { return commands_sent_; }

private:
    ISerialPort& port_;
    ITelemetrySource& telemetry_;
    EventChannel& events_;
    Sleeper sleeper_;
    bool verbose_ = false;
    int commands_sent_ = 0;
    float progress_start_ = 0.5f;
    float progress_end_ = 0.95f;

    void settle(std::chrono::milliseconds delay);
    void report(int step, int total, const std::string& status);
};

std::string hex_string(const std::uint8_t* data, size_t len);
