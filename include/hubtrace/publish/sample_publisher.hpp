#pragma once

#include "hubtrace/protocol/sample.hpp"

#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace hubtrace::publish {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

/// Streams decoded samples to a WebSocket endpoint as JSON text frames.
/// IXWebSocket runs its own background thread; publish() is called from the
/// driver thread and drops samples while the link is down.
class SamplePublisher {
  public:
    explicit SamplePublisher(const std::string &url = "ws://127.0.0.1:8765");
    ~SamplePublisher();

    SamplePublisher(const SamplePublisher &) = delete;
    SamplePublisher &operator=(const SamplePublisher &) = delete;

    /// Start the WebSocket connection (non-blocking).
    void connect();

    /// Close the connection.
    void disconnect();

    /// Returns false if the sample was dropped.
    bool publish(const protocol::DecodedSample &sample);

    /// Current connection state (atomic, safe from any thread).
    [[nodiscard]] ConnectionState state() const { return state_.load(std::memory_order_relaxed); }

    [[nodiscard]] uint64_t published_count() const { return published_; }
    [[nodiscard]] uint64_t dropped_count() const { return dropped_; }
    [[nodiscard]] const std::string &url() const { return url_; }

    /// Format a sample as JSON (for testing).
    static nlohmann::json format_sample(const protocol::DecodedSample &sample);

  private:
    void on_message(const ix::WebSocketMessagePtr &msg);

    std::string url_;
    ix::WebSocket ws_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    uint64_t published_ = 0;
    uint64_t dropped_ = 0;
};

const char *connection_state_label(ConnectionState state);

} // namespace hubtrace::publish
