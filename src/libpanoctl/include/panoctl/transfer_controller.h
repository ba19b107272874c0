#pragma once

#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "transfer_orchestrator.h"

// Foreground view of the current/last transfer. Only poll() and
// start_transfer() change it; the worker never touches it.
struct TransferState {
    static constexpr size_t MAX_LOG_LINES = 100;

    bool is_processing = false;
    float progress = 0.0f;
    std::string status_message = "Ready";
    std::deque<std::string> log_lines;
};

void apply_event(TransferState& state, const SessionEvent& event);

enum class StartResult { STARTED, BUSY, NO_FILE };

/**
 * Owns the event channel and at most one background transfer worker.
 * Call poll() from the foreground loop on every tick.
 */
class TransferController {
public:
    TransferController(std::shared_ptr<IFileAgent> agent,
                       std::shared_ptr<ITelemetrySource> telemetry,
                       PortOpener opener = open_serial_port,
                       Sleeper sleeper = sleep_for);
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    // Settings for the next transfer; not read by a running worker.
    TransferRequest& request() { return request_; }
    const TransferRequest& request() const { return request_; }

    /**
     * Start a transfer of request().local_path on a new worker
     * @return BUSY if one is in flight, NO_FILE if no file is selected;
     *         neither dispatches a worker nor queues events
     */
    StartResult start_transfer();

    /**
     * Drain and apply every queued event without blocking
     * @return the events applied, in order
     */
    std::vector<SessionEvent> poll();

    const TransferState& state() const { return state_; }
    bool is_processing() const { return state_.is_processing; }

    // Blocks until the worker thread has exited; for shutdown and tests.
    void join_worker();

private:
    std::shared_ptr<IFileAgent> agent_;
    std::shared_ptr<ITelemetrySource> telemetry_;
    PortOpener opener_;
    Sleeper sleeper_;
    std::shared_ptr<EventChannel> channel_;

    TransferRequest request_;
    TransferState state_;
    std::thread worker_;
};
