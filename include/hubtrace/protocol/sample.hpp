#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace hubtrace::protocol {

struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    bool operator==(const Vector3 &) const = default;
};

/// Canonical storage order is (real, i, j, k) regardless of wire order.
struct Quaternion {
    double real = 1.0;
    double i = 0.0;
    double j = 0.0;
    double k = 0.0;

    bool operator==(const Quaternion &) const = default;
};

struct UncalibratedVector {
    Vector3 value;
    Vector3 bias;

    bool operator==(const UncalibratedVector &) const = default;
};

/// Rotation vector with the hub's heading accuracy estimate (radians).
struct RotationVector {
    Quaternion rotation;
    double accuracy_rad = 0.0;

    bool operator==(const RotationVector &) const = default;
};

/// Channel 5 report: orientation plus angular velocity (rad/s).
struct GyroIntegratedRotation {
    Quaternion rotation;
    Vector3 angular_velocity;

    bool operator==(const GyroIntegratedRotation &) const = default;
};

struct Scalar {
    double value = 0.0;

    bool operator==(const Scalar &) const = default;
};

/// Unscaled ADC counts with the sensor's own microsecond timestamp.
struct RawVector {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;
    uint32_t sensor_time_us = 0;

    bool operator==(const RawVector &) const = default;
};

struct StepCount {
    uint32_t latency_us = 0;
    uint32_t steps = 0;

    bool operator==(const StepCount &) const = default;
};

struct Classification {
    uint8_t value = 0;

    bool operator==(const Classification &) const = default;
};

/// Get Feature Response: what the hub actually applied for a report.
struct FeatureReport {
    uint8_t report_id = 0;
    uint8_t flags = 0;
    uint16_t sensitivity = 0;
    uint32_t interval_us = 0;
    uint32_t batch_interval_us = 0;

    bool operator==(const FeatureReport &) const = default;
};

struct ProductId {
    uint8_t reset_cause = 0;
    uint8_t sw_major = 0;
    uint8_t sw_minor = 0;
    uint32_t part_number = 0;
    uint32_t build = 0;
    uint16_t patch = 0;

    bool operator==(const ProductId &) const = default;
};

/// One alternative per report shape.
using ReportValue = std::variant<Vector3, UncalibratedVector, Quaternion, RotationVector,
                                 GyroIntegratedRotation, Scalar, RawVector, StepCount,
                                 Classification, FeatureReport, ProductId>;

/// A decoded report.
/// `fields` holds the scaled values in storage order; `value` is the typed view.
/// `timestamp_us` is in the host counter domain and stays empty when the batch
/// carried no base timestamp.
struct DecodedSample {
    uint8_t report_id = 0;
    uint8_t sequence = 0;
    std::vector<double> fields;
    ReportValue value;
    std::optional<uint8_t> accuracy;
    uint32_t delay_us = 0;
    std::optional<uint64_t> timestamp_us;

    bool operator==(const DecodedSample &) const = default;
};

} // namespace hubtrace::protocol
