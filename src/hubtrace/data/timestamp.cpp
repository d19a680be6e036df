#include "hubtrace/data/timestamp.hpp"

namespace hubtrace::data {

TimestampReconstructor::TimestampReconstructor(const io::Clock &clock) : clock_(clock) {}

void TimestampReconstructor::begin_batch(uint64_t host_hint_us) {
    host_hint_us_ = host_hint_us;
    state_.batch_valid = false;
}

void TimestampReconstructor::assign_base(int64_t delta_us) {
    state_.base_delta_us = delta_us;
    state_.batch_valid = true;
    state_.state = BaseState::Based;
}

bool TimestampReconstructor::rebase(int64_t delta_us) {
    if (!state_.batch_valid) {
        return false;
    }
    // base_delta_us counts backwards from the hint
    state_.base_delta_us -= delta_us;
    return true;
}

std::optional<uint64_t> TimestampReconstructor::base_point() const {
    if (state_.state != BaseState::Based || !state_.batch_valid) {
        return std::nullopt;
    }
    return clock_.advance(host_hint_us_, -state_.base_delta_us);
}

std::optional<uint64_t> TimestampReconstructor::sample_time(uint32_t delay_us) const {
    const auto base = base_point();
    if (!base.has_value()) {
        return std::nullopt;
    }
    return clock_.advance(*base, static_cast<int64_t>(delay_us));
}

void TimestampReconstructor::reset() {
    state_ = TimestampState{};
    host_hint_us_ = 0;
}

} // namespace hubtrace::data
