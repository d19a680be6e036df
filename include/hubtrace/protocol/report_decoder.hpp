#pragma once

#include "hubtrace/protocol/report_layout.hpp"
#include "hubtrace/protocol/sample.hpp"

#include <cstdint>
#include <span>

namespace hubtrace::protocol {

/// Every delay and timestamp tick on the wire is 100 microseconds.
inline constexpr uint32_t kTickUs = 100;

/// 14-bit report delay: status bits 7:2 are the six MSBs, the delay byte the eight LSBs.
inline constexpr uint16_t delay_ticks(uint8_t status, uint8_t delay) {
    return static_cast<uint16_t>(((status & 0xFC) << 6) | delay);
}

/// Decoded 0xFB (Base Timestamp Reference) or 0xFA (Timestamp Rebase).
struct TimingReport {
    uint8_t report_id = 0;
    int32_t delta_ticks = 0;

    [[nodiscard]] bool is_rebase() const { return report_id == report_id::kTimestampRebase; }
    [[nodiscard]] int64_t delta_us() const {
        return static_cast<int64_t>(delta_ticks) * kTickUs;
    }
};

/// Table-driven report decoder. Pure: the same bytes always decode the same way.
class ReportDecoder {
  public:
    explicit ReportDecoder(const ReportTable &table = default_report_table());

    /// Throws ProtocolError(UnknownReportType) when the id has no layout.
    [[nodiscard]] const ReportLayout &layout(uint8_t report_id) const;

    [[nodiscard]] static bool is_timing_report(uint8_t report_id);

    /// Decode one report. `bytes` starts at the report's first byte (the id byte
    /// for standard reports, the first field for headerless ones).
    /// Throws ProtocolError for an unknown id or when bytes are shorter than the layout.
    [[nodiscard]] DecodedSample decode(uint8_t report_id, std::span<const uint8_t> bytes) const;

    /// Decode a 0xFB or 0xFA report. The delta is signed.
    [[nodiscard]] TimingReport decode_timing(std::span<const uint8_t> bytes) const;

    [[nodiscard]] const ReportTable &table() const { return table_; }

  private:
    const ReportTable &table_;
};

} // namespace hubtrace::protocol
