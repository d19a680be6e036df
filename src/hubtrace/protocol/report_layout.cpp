#include "hubtrace/protocol/report_layout.hpp"

#include <cstdio>
#include <stdexcept>

namespace hubtrace::protocol {

namespace {

constexpr size_t kStandardHeaderSize = 4;

FieldDescriptor u8(uint8_t offset) { return {offset, 1, false, 0}; }
FieldDescriptor s16(uint8_t offset, int8_t q = 0) {
    return {offset, 2, true, static_cast<int8_t>(-q)};
}
FieldDescriptor u16(uint8_t offset, int8_t q = 0) {
    return {offset, 2, false, static_cast<int8_t>(-q)};
}
FieldDescriptor s32(uint8_t offset) { return {offset, 4, true, 0}; }
FieldDescriptor u32(uint8_t offset, int8_t q = 0) {
    return {offset, 4, false, static_cast<int8_t>(-q)};
}

ReportLayout vector3(uint8_t id, const char *name, int8_t q) {
    return {id, name, 10, true, ReportShape::Vector3, {s16(4, q), s16(6, q), s16(8, q)}};
}

ReportLayout uncalibrated(uint8_t id, const char *name, int8_t q) {
    return {id,
            name,
            16,
            true,
            ReportShape::UncalibratedVector,
            {s16(4, q), s16(6, q), s16(8, q), s16(10, q), s16(12, q), s16(14, q)}};
}

// Wire order is i, j, k, real; stored as real, i, j, k
ReportLayout game_rotation(uint8_t id, const char *name) {
    return {id,
            name,
            12,
            true,
            ReportShape::Quaternion,
            {s16(10, 14), s16(4, 14), s16(6, 14), s16(8, 14)}};
}

ReportLayout rotation(uint8_t id, const char *name) {
    return {id,
            name,
            14,
            true,
            ReportShape::RotationVector,
            {s16(10, 14), s16(4, 14), s16(6, 14), s16(8, 14), s16(12, 12)}};
}

ReportLayout scalar(uint8_t id, const char *name, size_t length, FieldDescriptor field) {
    return {id, name, length, true, ReportShape::Scalar, {field}};
}

ReportLayout raw(uint8_t id, const char *name) {
    return {id, name, 16, true, ReportShape::RawVector, {s16(4), s16(6), s16(8), u32(12)}};
}

ReportLayout time_reference(uint8_t id, const char *name) {
    return {id, name, 5, false, ReportShape::TimeReference, {s32(1)}};
}

ReportTable build_default_table() {
    namespace id = report_id;
    ReportTable table;

    table.add(vector3(id::kAccelerometer, "accelerometer", 8));
    table.add(vector3(id::kGyroscope, "gyroscope", 9));
    table.add(vector3(id::kMagneticField, "magnetic_field", 4));
    table.add(vector3(id::kLinearAcceleration, "linear_acceleration", 8));
    table.add(rotation(id::kRotationVector, "rotation_vector"));
    table.add(vector3(id::kGravity, "gravity", 8));
    table.add(uncalibrated(id::kGyroscopeUncalibrated, "gyroscope_uncalibrated", 9));
    table.add(game_rotation(id::kGameRotationVector, "game_rotation_vector"));
    table.add(rotation(id::kGeomagneticRotationVector, "geomagnetic_rotation_vector"));
    table.add(scalar(id::kPressure, "pressure", 8, u32(4, 20)));
    table.add(scalar(id::kAmbientLight, "ambient_light", 8, u32(4, 8)));
    table.add(scalar(id::kHumidity, "humidity", 6, u16(4, 8)));
    table.add(scalar(id::kProximity, "proximity", 6, u16(4, 4)));
    table.add(scalar(id::kTemperature, "temperature", 6, s16(4, 7)));
    table.add(uncalibrated(id::kMagneticFieldUncalibrated, "magnetic_field_uncalibrated", 4));
    table.add({id::kStepCounter, "step_counter", 12, true, ReportShape::StepCount,
               {u32(4), u16(8)}});
    table.add({id::kStabilityClassifier, "stability_classifier", 6, true,
               ReportShape::Classification, {u8(4)}});
    table.add(raw(id::kRawAccelerometer, "raw_accelerometer"));
    table.add(raw(id::kRawGyroscope, "raw_gyroscope"));
    table.add(raw(id::kRawMagnetometer, "raw_magnetometer"));
    table.add(rotation(id::kArvrRotationVector, "arvr_rotation_vector"));
    table.add(game_rotation(id::kArvrGameRotationVector, "arvr_game_rotation_vector"));

    // Channel 5: no header at all; wire order qi, qj, qk, qr, wx, wy, wz
    table.add({id::kGyroIntegratedRotationVector,
               "gyro_integrated_rotation_vector",
               14,
               false,
               ReportShape::GyroIntegratedRotation,
               {s16(6, 14), s16(0, 14), s16(2, 14), s16(4, 14), s16(8, 10), s16(10, 10),
                s16(12, 10)}});

    table.add(time_reference(id::kTimestampRebase, "timestamp_rebase"));
    table.add(time_reference(id::kBaseTimestamp, "base_timestamp"));

    // Control channel
    table.add({id::kGetFeatureResponse, "get_feature_response", 17, false,
               ReportShape::FeatureReport, {u8(1), u8(2), u16(3), u32(5), u32(9)}});
    table.add({id::kProductIdResponse, "product_id", 16, false, ReportShape::ProductId,
               {u8(1), u8(2), u8(3), u32(4), u32(8), u16(12)}});

    return table;
}

} // namespace

ReportTable::ReportTable(std::vector<ReportLayout> layouts) {
    for (auto &layout : layouts) {
        add(std::move(layout));
    }
}

void ReportTable::add(ReportLayout layout) {
    if (layout.standard_header && layout.length < kStandardHeaderSize) {
        throw std::invalid_argument("Report '" + layout.name + "' is shorter than its header");
    }
    for (const auto &field : layout.fields) {
        if (field.width != 1 && field.width != 2 && field.width != 4) {
            throw std::invalid_argument("Report '" + layout.name + "' has a field of width " +
                                        std::to_string(field.width));
        }
        if (static_cast<size_t>(field.offset) + field.width > layout.length) {
            throw std::invalid_argument("Report '" + layout.name + "' field at offset " +
                                        std::to_string(field.offset) + " overruns length " +
                                        std::to_string(layout.length));
        }
    }
    const uint8_t id = layout.report_id;
    layouts_.insert_or_assign(id, std::move(layout));
}

const ReportLayout *ReportTable::find(uint8_t report_id) const {
    auto it = layouts_.find(report_id);
    if (it != layouts_.end()) {
        return &it->second;
    }
    return nullptr;
}

const ReportLayout *ReportTable::find(std::string_view name) const {
    for (const auto &[id, layout] : layouts_) {
        if (layout.name == name) {
            return &layout;
        }
    }
    return nullptr;
}

const ReportTable &default_report_table() {
    static const ReportTable table = build_default_table();
    return table;
}

std::string report_name(uint8_t report_id) {
    if (const auto *layout = default_report_table().find(report_id)) {
        return layout->name;
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "report_0x%02X", report_id);
    return buffer;
}

std::optional<uint8_t> report_id_from_name(std::string_view name) {
    if (const auto *layout = default_report_table().find(name)) {
        return layout->report_id;
    }
    return std::nullopt;
}

} // namespace hubtrace::protocol
