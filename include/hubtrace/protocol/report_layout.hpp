#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hubtrace::protocol {

/// SH-2 report identifiers.
namespace report_id {
inline constexpr uint8_t kAccelerometer = 0x01;
inline constexpr uint8_t kGyroscope = 0x02;
inline constexpr uint8_t kMagneticField = 0x03;
inline constexpr uint8_t kLinearAcceleration = 0x04;
inline constexpr uint8_t kRotationVector = 0x05;
inline constexpr uint8_t kGravity = 0x06;
inline constexpr uint8_t kGyroscopeUncalibrated = 0x07;
inline constexpr uint8_t kGameRotationVector = 0x08;
inline constexpr uint8_t kGeomagneticRotationVector = 0x09;
inline constexpr uint8_t kPressure = 0x0A;
inline constexpr uint8_t kAmbientLight = 0x0B;
inline constexpr uint8_t kHumidity = 0x0C;
inline constexpr uint8_t kProximity = 0x0D;
inline constexpr uint8_t kTemperature = 0x0E;
inline constexpr uint8_t kMagneticFieldUncalibrated = 0x0F;
inline constexpr uint8_t kStepCounter = 0x11;
inline constexpr uint8_t kStabilityClassifier = 0x13;
inline constexpr uint8_t kRawAccelerometer = 0x14;
inline constexpr uint8_t kRawGyroscope = 0x15;
inline constexpr uint8_t kRawMagnetometer = 0x16;
inline constexpr uint8_t kArvrRotationVector = 0x28;
inline constexpr uint8_t kArvrGameRotationVector = 0x29;
inline constexpr uint8_t kGyroIntegratedRotationVector = 0x2A;

inline constexpr uint8_t kCommandResponse = 0xF1;
inline constexpr uint8_t kCommandRequest = 0xF2;
inline constexpr uint8_t kProductIdResponse = 0xF8;
inline constexpr uint8_t kProductIdRequest = 0xF9;
inline constexpr uint8_t kTimestampRebase = 0xFA;
inline constexpr uint8_t kBaseTimestamp = 0xFB;
inline constexpr uint8_t kGetFeatureResponse = 0xFC;
inline constexpr uint8_t kSetFeatureCommand = 0xFD;
} // namespace report_id

enum class ReportShape {
    Vector3,
    UncalibratedVector,
    Quaternion,
    RotationVector,
    GyroIntegratedRotation,
    Scalar,
    RawVector,
    StepCount,
    Classification,
    FeatureReport,
    ProductId,
    TimeReference,
};

/// One integer field of a report: value = raw * 2^exponent.
struct FieldDescriptor {
    uint8_t offset = 0; // from the first byte of the report
    uint8_t width = 2;  // 1, 2 or 4 bytes
    bool is_signed = true;
    int8_t exponent = 0;
};

/// Fixed layout of one report type. Fields are listed in storage order; each
/// carries its wire offset, so storage order may differ from wire order.
struct ReportLayout {
    uint8_t report_id = 0;
    std::string name;
    size_t length = 0;
    bool standard_header = true; // report id, sequence, status, delay
    ReportShape shape = ReportShape::Scalar;
    std::vector<FieldDescriptor> fields;
};

/// Report id -> layout lookup. Read-only once built; shared by every decode.
class ReportTable {
  public:
    ReportTable() = default;
    explicit ReportTable(std::vector<ReportLayout> layouts);

    /// Add or replace a layout. Throws std::invalid_argument if a field does not
    /// fit inside the declared length.
    void add(ReportLayout layout);

    /// Returns nullptr if the id is not known.
    [[nodiscard]] const ReportLayout *find(uint8_t report_id) const;
    [[nodiscard]] const ReportLayout *find(std::string_view name) const;

    [[nodiscard]] size_t size() const { return layouts_.size(); }

  private:
    std::unordered_map<uint8_t, ReportLayout> layouts_;
};

/// SH-2 reports understood out of the box.
const ReportTable &default_report_table();

/// Layout name from the default table, or "report_0xNN" when unknown.
std::string report_name(uint8_t report_id);

std::optional<uint8_t> report_id_from_name(std::string_view name);

} // namespace hubtrace::protocol
