#include "hubtrace/publish/sample_publisher.hpp"
#include "hubtrace/data/orientation.hpp"
#include "hubtrace/protocol/report_layout.hpp"

#include <cstdio>

namespace hubtrace::publish {

SamplePublisher::SamplePublisher(const std::string &url) : url_(url) {
    ws_.setUrl(url_);

    // Auto-reconnect with exponential backoff: 1s initial, 30s max
    ws_.enableAutomaticReconnection();
    ws_.setMinWaitBetweenReconnectionRetries(1000);
    ws_.setMaxWaitBetweenReconnectionRetries(30000);

    ws_.setOnMessageCallback([this](const ix::WebSocketMessagePtr &msg) { on_message(msg); });
}

SamplePublisher::~SamplePublisher() { disconnect(); }

void SamplePublisher::connect() {
    state_.store(ConnectionState::Connecting, std::memory_order_relaxed);
    ws_.start();
}

void SamplePublisher::disconnect() {
    ws_.stop();
    state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
}

bool SamplePublisher::publish(const protocol::DecodedSample &sample) {
    if (state() != ConnectionState::Connected) {
        ++dropped_;
        return false;
    }

    const auto info = ws_.send(format_sample(sample).dump());
    if (!info.success) {
        ++dropped_;
        return false;
    }
    ++published_;
    return true;
}

nlohmann::json SamplePublisher::format_sample(const protocol::DecodedSample &sample) {
    nlohmann::json msg;
    msg["type"] = "sample";
    msg["report"] = protocol::report_name(sample.report_id);
    msg["id"] = sample.report_id;
    msg["sequence"] = sample.sequence;
    msg["delay_us"] = sample.delay_us;

    if (sample.timestamp_us.has_value()) {
        msg["timestamp_us"] = *sample.timestamp_us;
    } else {
        msg["timestamp_us"] = nullptr;
    }
    if (sample.accuracy.has_value()) {
        msg["accuracy"] = *sample.accuracy;
    } else {
        msg["accuracy"] = nullptr;
    }

    msg["fields"] = sample.fields;

    if (const auto q = data::orientation_of(sample)) {
        const auto euler = data::to_euler(*q);
        msg["euler"] = {{"yaw", euler.yaw}, {"pitch", euler.pitch}, {"roll", euler.roll}};
    }
    return msg;
}

void SamplePublisher::on_message(const ix::WebSocketMessagePtr &msg) {
    switch (msg->type) {
    case ix::WebSocketMessageType::Open:
        state_.store(ConnectionState::Connected, std::memory_order_relaxed);
        std::printf("[Publisher] Connected to %s\n", url_.c_str());
        break;

    case ix::WebSocketMessageType::Close:
        state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
        std::printf("[Publisher] Disconnected from %s\n", url_.c_str());
        break;

    case ix::WebSocketMessageType::Error:
        state_.store(ConnectionState::Error, std::memory_order_relaxed);
        std::fprintf(stderr, "[Publisher] Connection error: %s\n",
                     msg->errorInfo.reason.c_str());
        break;

    default:
        // Inbound messages are not part of the stream
        break;
    }
}

const char *connection_state_label(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Error:
        return "error";
    }
    return "unknown";
}

} // namespace hubtrace::publish
