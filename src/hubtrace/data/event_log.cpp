#include "hubtrace/data/event_log.hpp"

#include <algorithm>
#include <cstdio>

namespace hubtrace::data {

EventLog::EventLog(size_t max_entries, bool mirror)
    : max_entries_(std::max<size_t>(max_entries, 1)), mirror_(mirror),
      start_time_(std::chrono::steady_clock::now()) {}

void EventLog::add(EventType type, const std::string &message) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(EventEntry{
        .type = type,
        .message = message,
        .wall_time = elapsed(),
    });

    if (!mirror_) {
        return;
    }

    // Mirror to terminal
    if (type == EventType::Warning || type == EventType::Error) {
        std::fprintf(stderr, "[%s] %s\n", prefix(type), message.c_str());
    } else {
        std::printf("[%s] %s\n", prefix(type), message.c_str());
    }
}

const std::deque<EventEntry> &EventLog::entries() const { return entries_; }

size_t EventLog::size() const { return entries_.size(); }

bool EventLog::empty() const { return entries_.empty(); }

size_t EventLog::count(EventType type) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [type](const EventEntry &e) { return e.type == type; }));
}

void EventLog::clear() { entries_.clear(); }

double EventLog::elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_time_);
    return delta.count();
}

const char *EventLog::prefix(EventType type) {
    switch (type) {
    case EventType::Info:
        return "INF";
    case EventType::Warning:
        return "WRN";
    case EventType::Error:
        return "ERR";
    case EventType::Command:
        return "CMD";
    case EventType::Response:
        return "RSP";
    }
    return "INF";
}

} // namespace hubtrace::data
