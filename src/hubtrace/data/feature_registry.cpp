#include "hubtrace/data/feature_registry.hpp"

namespace hubtrace::data {

FeatureRegistry::FeatureRegistry(protocol::CommandCoordinator &coordinator)
    : coordinator_(coordinator) {}

void FeatureRegistry::record(protocol::DecodedSample sample) {
    auto &entry = entries_[sample.report_id];
    entry.last = std::move(sample);
    entry.updated = true;
}

void FeatureRegistry::enable(uint8_t report_id, uint32_t interval_us) {
    coordinator_.set_feature(report_id, interval_us);
    auto &entry = entries_[report_id];
    entry.enabled = interval_us != 0;
    entry.interval_us = interval_us;
}

void FeatureRegistry::disable(uint8_t report_id) {
    coordinator_.set_feature(report_id, 0);
    auto &entry = entries_[report_id];
    entry.enabled = false;
    entry.interval_us = 0;
}

void FeatureRegistry::confirm(uint8_t report_id, uint32_t interval_us) {
    entries_[report_id].confirmed_interval_us = interval_us;
}

const FeatureEntry *FeatureRegistry::entry(uint8_t report_id) const {
    auto it = entries_.find(report_id);
    if (it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

const protocol::DecodedSample *FeatureRegistry::latest(uint8_t report_id) const {
    const auto *found = entry(report_id);
    if (found == nullptr || !found->last.has_value()) {
        return nullptr;
    }
    return &found->last.value();
}

std::optional<protocol::DecodedSample> FeatureRegistry::take_updated(uint8_t report_id) {
    auto it = entries_.find(report_id);
    if (it == entries_.end() || !it->second.updated) {
        return std::nullopt;
    }
    it->second.updated = false;
    return it->second.last;
}

std::vector<uint8_t> FeatureRegistry::enabled_reports() const {
    std::vector<uint8_t> result;
    for (const auto &[id, entry] : entries_) {
        if (entry.enabled) {
            result.push_back(id);
        }
    }
    return result;
}

void FeatureRegistry::reset() { entries_.clear(); }

} // namespace hubtrace::data
