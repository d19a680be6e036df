#include "hubtrace/data/orientation.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <variant>

namespace hubtrace::data {

EulerAngles to_euler(const protocol::Quaternion &q) {
    constexpr double kDegPerRad = 180.0 / std::numbers::pi;

    const double jsqr = q.j * q.j;

    const double t0 = 2.0 * (q.real * q.i + q.j * q.k);
    const double t1 = 1.0 - 2.0 * (q.i * q.i + jsqr);
    const double roll = std::atan2(t0, t1);

    // Clamp for gimbal lock; rounding can push the term past +-1
    const double t2 = std::clamp(2.0 * (q.real * q.j - q.k * q.i), -1.0, 1.0);
    const double pitch = std::asin(t2);

    const double t3 = 2.0 * (q.real * q.k + q.i * q.j);
    const double t4 = 1.0 - 2.0 * (jsqr + q.k * q.k);
    const double yaw = std::atan2(t3, t4);

    return EulerAngles{
        .yaw = yaw * kDegPerRad,
        .pitch = pitch * kDegPerRad,
        .roll = roll * kDegPerRad,
    };
}

std::optional<protocol::Quaternion> orientation_of(const protocol::DecodedSample &sample) {
    if (const auto *q = std::get_if<protocol::Quaternion>(&sample.value)) {
        return *q;
    }
    if (const auto *rv = std::get_if<protocol::RotationVector>(&sample.value)) {
        return rv->rotation;
    }
    if (const auto *gi = std::get_if<protocol::GyroIntegratedRotation>(&sample.value)) {
        return gi->rotation;
    }
    return std::nullopt;
}

} // namespace hubtrace::data
