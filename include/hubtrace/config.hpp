#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hubtrace {

/// A report to enable at startup.
struct FeatureRequest {
    uint8_t report_id = 0;
    uint32_t interval_us = 0;
};

struct DriverConfig {
    std::string bus = "/dev/i2c-1";
    uint8_t address = 0x4A;
    size_t max_read_bytes = 256;
    uint16_t max_packet_length = 4096;
    std::chrono::milliseconds command_timeout{1000};
    uint32_t idle_poll_us = 1000;
    size_t event_log_capacity = 1000;
    bool mirror_log = true;
    std::optional<std::string> publish_url;
    std::vector<FeatureRequest> features;
};

/// Report interval for a rate in Hz, rounded to the nearest microsecond.
/// Throws std::invalid_argument when the rate is not positive or the interval overflows.
uint32_t interval_from_rate(double rate_hz);

/// Parse a driver config. Every key is optional.
/// Expects: {"bus": "/dev/i2c-1", "address": 74, "features": [{"report": "rotation_vector",
/// "rate_hz": 100}], ...}
/// Throws std::runtime_error naming the offending key.
DriverConfig parse_config(const nlohmann::json &doc);

/// Read and parse a JSON config file.
DriverConfig load_config(const std::string &path);

} // namespace hubtrace
