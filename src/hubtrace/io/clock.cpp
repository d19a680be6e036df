#include "hubtrace/io/clock.hpp"

namespace hubtrace::io {

int64_t ticks_diff(uint64_t a, uint64_t b, uint64_t period) {
    if (period == 0) {
        // Unsigned subtraction is already modulo 2^64
        return static_cast<int64_t>(a - b);
    }

    const uint64_t d = (a % period + period - b % period) % period;
    if (d >= period - period / 2) {
        return static_cast<int64_t>(d) - static_cast<int64_t>(period);
    }
    return static_cast<int64_t>(d);
}

uint64_t ticks_add(uint64_t t, int64_t delta, uint64_t period) {
    if (period == 0) {
        return t + static_cast<uint64_t>(delta);
    }

    const auto p = static_cast<int64_t>(period);
    int64_t wrapped = (static_cast<int64_t>(t % period) + delta % p) % p;
    if (wrapped < 0) {
        wrapped += p;
    }
    return static_cast<uint64_t>(wrapped);
}

SteadyClock::SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

uint64_t SteadyClock::now_us() {
    const auto elapsed = std::chrono::steady_clock::now() - origin_;
    return kHeadroomUs + static_cast<uint64_t>(
                             std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

} // namespace hubtrace::io
