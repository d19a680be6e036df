#pragma once

#include "hubtrace/protocol/sample.hpp"

#include <optional>

namespace hubtrace::data {

/// Tait-Bryan angles in degrees (yaw about Z, pitch about Y, roll about X).
struct EulerAngles {
    double yaw = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
};

EulerAngles to_euler(const protocol::Quaternion &q);

/// Orientation carried by a sample, if its report has one.
std::optional<protocol::Quaternion> orientation_of(const protocol::DecodedSample &sample);

} // namespace hubtrace::data
