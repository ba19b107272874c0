#include <panoctl/transfer_controller.h>

void apply_event(TransferState& state, const SessionEvent& event) {
    switch (event.kind) {
    case SessionEvent::Kind::LOG:
        state.log_lines.push_back(event.text);
        while (state.log_lines.size() > TransferState::MAX_LOG_LINES) {
            state.log_lines.pop_front();
        }
        break;
    case SessionEvent::Kind::PROGRESS:
        state.progress = event.progress;
        state.status_message = event.text;
        break;
    case SessionEvent::Kind::SUCCESS:
        state.is_processing = false;
        state.progress = 1.0f;
        state.status_message = event.text;
        break;
    case SessionEvent::Kind::ERROR:
        state.is_processing = false;
        state.progress = 0.0f;
        state.status_message = "Error: " + event.text;
        break;
    }
}

TransferController::TransferController(std::shared_ptr<IFileAgent> agent,
                                       std::shared_ptr<ITelemetrySource> telemetry,
                                       PortOpener opener, Sleeper sleeper)
    : agent_(std::move(agent)),
      telemetry_(std::move(telemetry)),
      opener_(std::move(opener)),
      sleeper_(std::move(sleeper)),
      channel_(std::make_shared<EventChannel>()) {}

TransferController::~TransferController() {
    join_worker();
}

void TransferController::join_worker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

StartResult TransferController::start_transfer() {
    if (state_.is_processing) {
        return StartResult::BUSY;
    }

    if (request_.local_path.empty()) {
        state_.status_message = "No image selected";
        return StartResult::NO_FILE;
    }

    // The previous worker has already delivered its terminal event.
    join_worker();

    state_.is_processing = true;
    state_.progress = 0.0f;
    state_.status_message = "Starting transfer...";

    auto agent = agent_;
    auto telemetry = telemetry_;
    auto opener = opener_;
    auto sleeper = sleeper_;
    auto channel = channel_;
    TransferRequest request = request_;

    worker_ = std::thread([agent, telemetry, opener, sleeper, channel, request]() {
        TransferOrchestrator orchestrator(*agent, *telemetry, opener, sleeper);
        orchestrator.execute(request, *channel);
    });

    return StartResult::STARTED;
}

std::vector<SessionEvent> TransferController::poll() {
    std::vector<SessionEvent> events = channel_->drain();
    for (const auto& event : events) {
        apply_event(state_, event);
    }
    return events;
}
