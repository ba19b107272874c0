#include <panoctl/session_event.h>
#include <iterator>

void EventChannel::send(SessionEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(event));
}

std::vector<SessionEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionEvent> events(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

bool EventChannel::try_receive(SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

size_t EventChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
