#pragma once

#include <chrono>
#include <cstdint>

namespace hubtrace::io {

/// Signed difference a - b on a counter that wraps at `period`.
/// The result lies in [-period/2, period/2). A period of 0 means the full 64-bit range.
int64_t ticks_diff(uint64_t a, uint64_t b, uint64_t period);

/// t + delta, wrapped into [0, period).
uint64_t ticks_add(uint64_t t, int64_t delta, uint64_t period);

/// Monotonic host counter in microseconds.
class Clock {
  public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual uint64_t now_us() = 0;

    /// Counter modulus; 0 when the counter does not wrap.
    [[nodiscard]] virtual uint64_t period_us() const { return 0; }

    [[nodiscard]] int64_t diff(uint64_t a, uint64_t b) const {
        return ticks_diff(a, b, period_us());
    }

    [[nodiscard]] uint64_t advance(uint64_t t, int64_t delta) const {
        return ticks_add(t, delta, period_us());
    }
};

/// Host clock backed by std::chrono::steady_clock. The counter starts at
/// kHeadroomUs on construction so a base point reaching back before startup
/// still lands on a positive value.
class SteadyClock final : public Clock {
  public:
    /// Furthest a 0xFB base can reach back: 2^31 ticks of 100 us.
    static constexpr uint64_t kHeadroomUs = (uint64_t{1} << 31) * 100;

    SteadyClock();

    [[nodiscard]] uint64_t now_us() override;

  private:
    std::chrono::steady_clock::time_point origin_;
};

} // namespace hubtrace::io
