#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct SessionEvent {
    enum class Kind { LOG, PROGRESS, SUCCESS, ERROR };

    Kind kind = Kind::LOG;
    std::string text;
    float progress = 0.0f;   // PROGRESS only, 0.0 - 1.0

    static SessionEvent log(const std::string& text) {
        return SessionEvent{Kind::LOG, text, 0.0f};
    }
    static SessionEvent progress_update(float fraction, const std::string& status) {
        return SessionEvent{Kind::PROGRESS, status, fraction};
    }
    static SessionEvent success(const std::string& text) {
        return SessionEvent{Kind::SUCCESS, text, 1.0f};
    }
    static SessionEvent error(const std::string& text) {
        return SessionEvent{Kind::ERROR, text, 0.0f};
    }

    bool is_terminal() const { return kind == Kind::SUCCESS || kind == Kind::ERROR; }
};

/**
 * Unbounded multi-producer / single-consumer queue between the transfer
 * worker and the foreground loop. send() never blocks on the consumer and
 * drain() never waits for producers.
 */
class EventChannel {
public:
    void send(SessionEvent event);

    // Everything queued so far, in send order.
    std::vector<SessionEvent> drain();

    bool try_receive(SessionEvent& event);
    size_t pending() const;

    void log(const std::string& text) { send(SessionEvent::log(text)); }
    void progress(float fraction, const std::string& status) {
        send(SessionEvent::progress_update(fraction, status));
    }

private:
    mutable std::mutex mutex_;
    std::deque<SessionEvent> queue_;
};
