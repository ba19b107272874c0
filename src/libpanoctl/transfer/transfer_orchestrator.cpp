#include <panoctl/transfer_orchestrator.h>
#include <panoctl/media_file.h>
#include <exception>

TransferOrchestrator::TransferOrchestrator(IFileAgent& agent, ITelemetrySource& telemetry, PortOpener opener,
                                           Sleeper sleeper)
    : agent_(agent), telemetry_(telemetry), opener_(std::move(opener)), sleeper_(std::move(sleeper)) {}

StepResult TransferOrchestrator::run(const TransferRequest& request, EventChannel& events) {
    events.progress(0.1f, "Calculating MD5...");
    events.log("Calculating file MD5...");

    std::string md5;
    std::uint64_t file_size = 0;
    StepResult r = compute_file_md5(request.local_path, md5, file_size);
    if (!r) return r.context("Failed to hash " + request.local_path);

    remote_name_ = generate_remote_name(media_extension(request.local_path));
    std::string remote_path = remote_media_path(remote_name_);

    events.log("File: " + request.local_path + " (" + std::to_string(file_size) +
               " bytes, MD5: " + md5 + ")");

    events.progress(0.2f, "Pushing to device via ADB...");
    events.log("Waiting for device...");
    r = agent_.wait_until_device_ready();
    if (!r) return r.context("Device not ready");

    events.log("Pushing " + request.local_path + " to " + remote_path);
    r = agent_.push(request.local_path, remote_path);
    if (!r) return r.context("Failed to push image");
    events.log("ADB push successful");

    events.progress(0.4f, "Verifying pushed file...");
    std::uint64_t remote_size = 0;
    StepResult verified = agent_.stat_size(remote_path, remote_size);
    if (!verified) {
        events.log("Could not verify pushed size: " + verified.error);
    } else if (remote_size != file_size) {
        events.log("Size mismatch: local " + std::to_string(file_size) + " bytes, device " +
                   std::to_string(remote_size) + " bytes");
    } else {
        events.log("Verified " + remote_path + " (" + std::to_string(remote_size) + " bytes)");
    }

    events.progress(0.5f, "Sending serial commands...");
    events.log("Opening serial port: " + request.serial.address);

    std::string open_error;
    std::unique_ptr<ISerialPort> port = opener_(request.serial, open_error);
    if (!port) {
        return StepResult::fail(open_error).context("Failed to open serial port " + request.serial.address);
    }

    SessionSequencer sequencer(*port, telemetry_, events, sleeper_);
    sequencer.set_verbose(request.verbose);

    if (request.mode == SessionMode::LEGACY) {
        r = sequencer.run_legacy(remote_name_, file_size, md5, request.config);
    } else {
        r = sequencer.run(remote_name_, request.config);
    }
    port->close();

    if (!r) return r.context("Serial session failed");
    return StepResult::ok();
}

void TransferOrchestrator::execute(const TransferRequest& request, EventChannel& events) {
    StepResult result;
    try {
        result = run(request, events);
    } catch (const std::exception& e) {
        result = StepResult::fail(std::string("Unexpected error: ") + e.what());
    }

    if (result) {
        events.log("Transfer complete!");
        events.send(SessionEvent::success("Transfer complete!"));
    } else {
        events.send(SessionEvent::error(result.error));
    }
}
