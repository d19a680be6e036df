#pragma once

#include "hubtrace/io/clock.hpp"

#include <cstdint>
#include <optional>

namespace hubtrace::data {

enum class BaseState { NoBase, Based };

/// Timing state shared by all reports of the current batch.
/// `base_delta_us` is how long before the host capture time the batch's
/// timing origin lies.
struct TimestampState {
    int64_t base_delta_us = 0;
    bool batch_valid = false;
    BaseState state = BaseState::NoBase;
};

/// Turns base/delay/rebase fields plus a host capture time into host timestamps:
///   base_point = T_hint - base_delta_us
///   sample     = base_point + delay_us
/// A rebase accumulates into the base point, moving it later by its delta.
/// All arithmetic runs in the host counter domain and honors its wraparound.
class TimestampReconstructor {
  public:
    explicit TimestampReconstructor(const io::Clock &clock);

    /// Open a new batch captured at host_hint_us. The previous batch's base no
    /// longer applies until the next 0xFB.
    void begin_batch(uint64_t host_hint_us);

    /// 0xFB: replace the base.
    void assign_base(int64_t delta_us);

    /// 0xFA: shift the base point by delta_us on top of any earlier shift.
    /// Returns false and changes nothing when the current batch has no base.
    [[nodiscard]] bool rebase(int64_t delta_us);

    /// Host time of a report delayed by delay_us from the batch origin.
    /// Empty when the current batch carried no 0xFB.
    [[nodiscard]] std::optional<uint64_t> sample_time(uint32_t delay_us) const;

    [[nodiscard]] std::optional<uint64_t> base_point() const;

    [[nodiscard]] uint64_t host_hint() const { return host_hint_us_; }
    [[nodiscard]] const TimestampState &state() const { return state_; }

    /// Back to no-base (hub reset).
    void reset();

  private:
    const io::Clock &clock_;
    TimestampState state_;
    uint64_t host_hint_us_ = 0;
};

} // namespace hubtrace::data
