#include <panoctl/session_sequencer.h>
#include <panoctl/command_message.h>
#include <panoctl/frame_codec.h>
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

void sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::string hex_string(const std::uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    char buf[3];
    for (size_t i = 0; i < len; i++) {
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        out += buf;
    }
    return out;
}

SessionSequencer::SessionSequencer(ISerialPort& port, ITelemetrySource& telemetry, EventChannel& events,
                                   Sleeper sleeper)
    : port_(port), telemetry_(telemetry), events_(events), sleeper_(std::move(sleeper)) {}

void SessionSequencer::set_progress_range(float start, float end) {
    progress_start_ = start;
    progress_end_ = end;
}

void SessionSequencer::settle(std::chrono::milliseconds delay) {
    if (sleeper_) {
        sleeper_(delay);
    }
}

void SessionSequencer::report(int step, int total, const std::string& status) {
    float fraction = progress_start_ + (progress_end_ - progress_start_) * step / total;
    events_.progress(fraction, status);
}

StepResult SessionSequencer::send_command(const std::string& command_name, const json& body) {
    std::string json_content;
    try {
        json_content = body.dump();
    } catch (const json::exception& e) {
        return StepResult::fail("Failed to encode " + command_name + " body: " + e.what());
    }

    std::vector<std::uint8_t> frame;
    try {
        frame = encode_frame(build_command(command_name, json_content));
    } catch (const std::length_error& e) {
        return StepResult::fail("Failed to frame " + command_name + ": " + e.what());
    }

    events_.log("Sending " + command_name + " (" + std::to_string(json_content.size()) +
                " bytes, frame: " + std::to_string(frame.size()) + " bytes)");
    if (verbose_) {
        size_t head = std::min<size_t>(30, frame.size());
        size_t tail = std::min<size_t>(10, frame.size());
        events_.log("Frame hex: " + hex_string(frame.data(), head) + "..." +
                    hex_string(frame.data() + frame.size() - tail, tail));
    }

    commands_sent_++;

    StepResult written = port_.write_all(frame.data(), frame.size());
    if (!written) {
        return written.context("Failed to send " + command_name);
    }

    StepResult flushed = port_.flush();
    if (!flushed) {
        return flushed.context("Failed to flush " + command_name);
    }

    return StepResult::ok();
}

StepResult SessionSequencer::send_keepalive() {
    TelemetrySnapshot snapshot = telemetry_.read();
    return send_command(CMD_TELEMETRY, json(snapshot));
}

StepResult SessionSequencer::run(const std::string& file_name, const ScreenConfig& config) {
    const int total = 4 + session_timing::SUSTAINED_KEEPALIVES;
    int step = 0;

    settle(session_timing::SETTLE);
    StepResult cleared = port_.clear_buffers();
    if (!cleared) {
        events_.log("Ignoring buffer clear failure: " + cleared.error);
    }

    StepResult r = send_keepalive();
    if (!r) return r.context("Initial keepalive");
    report(++step, total, "Link is alive");

    settle(session_timing::STEP_GAP);
    r = send_command(CMD_MEDIA_DELETE, json{{"exclude", json::array({file_name})}});
    if (!r) return r.context("Media cleanup");
    report(++step, total, "Removed stale media");

    settle(session_timing::STEP_GAP);
    r = send_keepalive();
    if (!r) return r.context("Keepalive");
    report(++step, total, "Link is alive");

    settle(session_timing::STEP_GAP);
    r = send_command(CMD_SCREEN_CONFIG, screen_config_command_body(config, file_name));
    if (!r) return r.context("Screen configuration");
    report(++step, total, "Screen configured");

    for (int i = 1; i <= session_timing::SUSTAINED_KEEPALIVES; i++) {
        settle(session_timing::KEEPALIVE_INTERVAL);
        r = send_keepalive();
        if (!r) {
            return r.context("Keepalive " + std::to_string(i) + "/" +
                             std::to_string(session_timing::SUSTAINED_KEEPALIVES));
        }
        report(++step, total, "Keepalive " + std::to_string(i) + "/" +
                              std::to_string(session_timing::SUSTAINED_KEEPALIVES));
    }

    events_.log("All commands sent successfully!");
    return StepResult::ok();
}

StepResult SessionSequencer::run_legacy(const std::string& file_name, std::uint64_t file_size,
                                        const std::string& file_md5, const ScreenConfig& config) {
    const int total = 3;

    settle(legacy_timing::SETTLE);
    StepResult cleared = port_.clear_buffers();
    if (!cleared) {
        events_.log("Ignoring buffer clear failure: " + cleared.error);
    }

    StepResult r = send_command(CMD_TRANSPORT, json{
        {"type", "media"},
        {"fileSize", file_size},
        {"fileName", file_name},
    });
    if (!r) return r.context("File announcement");
    report(1, total, "File announced");

    settle(legacy_timing::STEP_GAP);
    r = send_command(CMD_TRANSPORTED, json{
        {"md5", file_md5},
        {"fileName", file_name},
    });
    if (!r) return r.context("Transfer confirmation");
    report(2, total, "Transfer confirmed");

    settle(legacy_timing::STEP_GAP);
    r = send_command(CMD_SCREEN_CONFIG, screen_config_command_body(config, file_name));
    if (!r) return r.context("Screen configuration");
    report(3, total, "Screen configured");

    settle(legacy_timing::TAIL);
    events_.log("All commands sent successfully!");
    return StepResult::ok();
}
