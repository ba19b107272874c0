#pragma once

#include <string>
#include "file_agent.h"
#include "screen_config.h"
#include "serial_port.h"
#include "session_event.h"
#include "session_sequencer.h"
#include "step_result.h"
#include "telemetry.h"

enum class SessionMode {
    STANDARD,   // push via agent, mediaDelete + config + keepalives
    LEGACY,     // push via agent, announce with transport / transported
};

struct TransferRequest {
    std::string local_path;
    SerialSettings serial;
    ScreenConfig config;
    SessionMode mode = SessionMode::STANDARD;
    bool verbose = false;
};

/**
 * One end-to-end transfer: hash, push, verify, open the port, run the
 * session. Runs on the worker thread; every step is blocking.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(IFileAgent& agent, ITelemetrySource& telemetry, PortOpener opener,
                         Sleeper sleeper = sleep_for);

    // Runs all steps and stops at the first failure. Emits LOG/PROGRESS only.
    StepResult run(const TransferRequest& request, EventChannel& events);

    // run() followed by exactly one SUCCESS or ERROR event.
    void execute(const TransferRequest& request, EventChannel& events);

    const std::string& last_remote_name() const { return remote_name_; }

private:
    IFileAgent& agent_;
    ITelemetrySource& telemetry_;
    PortOpener opener_;
    Sleeper sleeper_;
    std::string remote_name_;
};
