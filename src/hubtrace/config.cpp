#include "hubtrace/config.hpp"
#include "hubtrace/protocol/report_layout.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>

namespace hubtrace {

namespace {

template <typename T>
T unsigned_value(const nlohmann::json &doc, const char *key, T fallback, T minimum = 0,
                 T maximum = std::numeric_limits<T>::max()) {
    if (!doc.contains(key)) {
        return fallback;
    }
    if (!doc[key].is_number_unsigned()) {
        throw std::runtime_error(std::string("Config '") + key +
                                 "' must be a non-negative integer");
    }
    const auto value = doc[key].get<uint64_t>();
    if (value < minimum || value > maximum) {
        throw std::runtime_error(std::string("Config '") + key + "' out of range [" +
                                 std::to_string(minimum) + ", " + std::to_string(maximum) + "]");
    }
    return static_cast<T>(value);
}

FeatureRequest parse_feature(const nlohmann::json &item) {
    if (!item.is_object()) {
        throw std::runtime_error("Config 'features' entries must be objects");
    }
    if (!item.contains("report") || !item["report"].is_string()) {
        throw std::runtime_error("Feature entry missing 'report'");
    }

    const auto name = item["report"].get<std::string>();
    const auto id = protocol::report_id_from_name(name);
    if (!id.has_value()) {
        throw std::runtime_error("Feature entry names unknown report '" + name + "'");
    }

    FeatureRequest request;
    request.report_id = *id;

    if (item.contains("interval_us")) {
        request.interval_us = unsigned_value<uint32_t>(item, "interval_us", 0, 1);
    } else if (item.contains("rate_hz")) {
        if (!item["rate_hz"].is_number() || item["rate_hz"].get<double>() <= 0.0) {
            throw std::runtime_error("Feature '" + name + "' needs a positive 'rate_hz'");
        }
        try {
            request.interval_us = interval_from_rate(item["rate_hz"].get<double>());
        } catch (const std::invalid_argument &e) {
            throw std::runtime_error("Feature '" + name + "' 'rate_hz' out of range: " +
                                     e.what());
        }
    } else {
        throw std::runtime_error("Feature '" + name + "' needs 'interval_us' or 'rate_hz'");
    }
    return request;
}

} // namespace

uint32_t interval_from_rate(double rate_hz) {
    if (rate_hz <= 0.0) {
        throw std::invalid_argument("Report rate must be positive");
    }
    const double interval = std::round(1'000'000.0 / rate_hz);
    if (interval > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        throw std::invalid_argument("Report interval for " + std::to_string(rate_hz) +
                                    " Hz exceeds 32 bits of microseconds");
    }
    return static_cast<uint32_t>(std::max(interval, 1.0));
}

DriverConfig parse_config(const nlohmann::json &doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    DriverConfig config;

    if (doc.contains("bus")) {
        if (!doc["bus"].is_string()) {
            throw std::runtime_error("Config 'bus' must be a string");
        }
        config.bus = doc["bus"].get<std::string>();
    }

    config.address = unsigned_value<uint8_t>(doc, "address", config.address, 0x08, 0x77);
    config.max_read_bytes =
        unsigned_value<size_t>(doc, "max_read_bytes", config.max_read_bytes, 5, 32767);
    config.max_packet_length =
        unsigned_value<uint16_t>(doc, "max_packet_length", config.max_packet_length, 5, 32767);
    config.command_timeout = std::chrono::milliseconds(unsigned_value<uint32_t>(
        doc, "command_timeout_ms", static_cast<uint32_t>(config.command_timeout.count()), 1));
    config.idle_poll_us = unsigned_value<uint32_t>(doc, "idle_poll_us", config.idle_poll_us);
    config.event_log_capacity =
        unsigned_value<size_t>(doc, "event_log_capacity", config.event_log_capacity, 1);

    if (doc.contains("mirror_log")) {
        if (!doc["mirror_log"].is_boolean()) {
            throw std::runtime_error("Config 'mirror_log' must be a boolean");
        }
        config.mirror_log = doc["mirror_log"].get<bool>();
    }

    if (doc.contains("publish_url")) {
        if (!doc["publish_url"].is_string()) {
            throw std::runtime_error("Config 'publish_url' must be a string");
        }
        config.publish_url = doc["publish_url"].get<std::string>();
    }

    if (doc.contains("features")) {
        if (!doc["features"].is_array()) {
            throw std::runtime_error("Config 'features' must be an array");
        }
        for (const auto &item : doc["features"]) {
            config.features.push_back(parse_feature(item));
        }
    }

    return config;
}

DriverConfig load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file '" + path + "'");
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Config file '" + path + "' is not valid JSON");
    }
    return parse_config(doc);
}

} // namespace hubtrace
