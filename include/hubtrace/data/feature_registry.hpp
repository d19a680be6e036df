#pragma once

#include "hubtrace/protocol/coordinator.hpp"
#include "hubtrace/protocol/sample.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace hubtrace::data {

/// Latest state of one report type. Overwritten in place; no history.
struct FeatureEntry {
    std::optional<protocol::DecodedSample> last;
    bool enabled = false;
    uint32_t interval_us = 0;
    std::optional<uint32_t> confirmed_interval_us; // from the hub's Get Feature Response
    bool updated = false;
};

/// Latest-value-wins store per report type, plus feature enable state.
/// Thread safety: driver thread only.
class FeatureRegistry {
  public:
    explicit FeatureRegistry(protocol::CommandCoordinator &coordinator);

    void record(protocol::DecodedSample sample);

    /// Send Set Feature and mark the report enabled without waiting for the hub.
    void enable(uint8_t report_id, uint32_t interval_us);
    void disable(uint8_t report_id);

    /// Interval the hub reports having applied (0 = off).
    void confirm(uint8_t report_id, uint32_t interval_us);

    [[nodiscard]] const FeatureEntry *entry(uint8_t report_id) const;

    /// nullptr means no data yet.
    [[nodiscard]] const protocol::DecodedSample *latest(uint8_t report_id) const;

    /// The latest sample if it arrived since the last call, clearing the flag.
    [[nodiscard]] std::optional<protocol::DecodedSample> take_updated(uint8_t report_id);

    [[nodiscard]] std::vector<uint8_t> enabled_reports() const;
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /// Forget every entry (hub reset).
    void reset();

  private:
    protocol::CommandCoordinator &coordinator_;
    std::map<uint8_t, FeatureEntry> entries_;
};

} // namespace hubtrace::data
