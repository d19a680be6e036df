#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace hubtrace::data {

/// Types of log entries for filtering and terminal prefixes.
enum class EventType {
    Info,
    Warning,
    Error,
    Command,
    Response,
};

/// A single entry in the driver log.
struct EventEntry {
    EventType type = EventType::Info;
    std::string message;
    double wall_time = 0.0;
};

/// Rolling log of driver events, mirrored to the terminal.
/// Thread safety: driver thread only.
class EventLog {
  public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit EventLog(size_t max_entries = kDefaultMaxEntries, bool mirror = true);

    void add(EventType type, const std::string &message);

    [[nodiscard]] const std::deque<EventEntry> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    /// Number of retained entries of one type.
    [[nodiscard]] size_t count(EventType type) const;

    void clear();
    [[nodiscard]] double elapsed() const;

    void set_mirror(bool mirror) { mirror_ = mirror; }

    static const char *prefix(EventType type);

  private:
    size_t max_entries_ = kDefaultMaxEntries;
    bool mirror_ = true;
    std::deque<EventEntry> entries_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace hubtrace::data
