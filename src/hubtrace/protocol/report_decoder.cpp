#include "hubtrace/protocol/report_decoder.hpp"
#include "hubtrace/errors.hpp"
#include "hubtrace/protocol/packet.hpp"

#include <cmath>
#include <stdexcept>

namespace hubtrace::protocol {

namespace {

std::string hex_id(uint8_t id) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    return std::string("0x") + kDigits[id >> 4] + kDigits[id & 0x0F];
}

Vector3 vector_at(const std::vector<double> &f, size_t first) {
    return {f[first], f[first + 1], f[first + 2]};
}

Quaternion quaternion_at(const std::vector<double> &f, size_t first) {
    return {f[first], f[first + 1], f[first + 2], f[first + 3]};
}

ReportValue make_value(ReportShape shape, const std::vector<double> &f) {
    switch (shape) {
    case ReportShape::Vector3:
        return vector_at(f, 0);
    case ReportShape::UncalibratedVector:
        return UncalibratedVector{vector_at(f, 0), vector_at(f, 3)};
    case ReportShape::Quaternion:
        return quaternion_at(f, 0);
    case ReportShape::RotationVector:
        return RotationVector{quaternion_at(f, 0), f[4]};
    case ReportShape::GyroIntegratedRotation:
        return GyroIntegratedRotation{quaternion_at(f, 0), vector_at(f, 4)};
    case ReportShape::Scalar:
        return Scalar{f[0]};
    case ReportShape::RawVector:
        return RawVector{static_cast<int32_t>(f[0]), static_cast<int32_t>(f[1]),
                         static_cast<int32_t>(f[2]), static_cast<uint32_t>(f[3])};
    case ReportShape::StepCount:
        return StepCount{static_cast<uint32_t>(f[0]), static_cast<uint32_t>(f[1])};
    case ReportShape::Classification:
        return Classification{static_cast<uint8_t>(f[0])};
    case ReportShape::FeatureReport:
        return FeatureReport{static_cast<uint8_t>(f[0]), static_cast<uint8_t>(f[1]),
                             static_cast<uint16_t>(f[2]), static_cast<uint32_t>(f[3]),
                             static_cast<uint32_t>(f[4])};
    case ReportShape::ProductId:
        return ProductId{static_cast<uint8_t>(f[0]), static_cast<uint8_t>(f[1]),
                         static_cast<uint8_t>(f[2]), static_cast<uint32_t>(f[3]),
                         static_cast<uint32_t>(f[4]), static_cast<uint16_t>(f[5])};
    case ReportShape::TimeReference:
        break;
    }
    throw std::invalid_argument("Timing reports have no sample value");
}

// Minimum field count each shape reads in make_value
size_t fields_required(ReportShape shape) {
    switch (shape) {
    case ReportShape::Vector3:
        return 3;
    case ReportShape::UncalibratedVector:
        return 6;
    case ReportShape::Quaternion:
        return 4;
    case ReportShape::RotationVector:
        return 5;
    case ReportShape::GyroIntegratedRotation:
        return 7;
    case ReportShape::Scalar:
    case ReportShape::Classification:
    case ReportShape::TimeReference:
        return 1;
    case ReportShape::RawVector:
        return 4;
    case ReportShape::StepCount:
        return 2;
    case ReportShape::FeatureReport:
        return 5;
    case ReportShape::ProductId:
        return 6;
    }
    return 0;
}

} // namespace

ReportDecoder::ReportDecoder(const ReportTable &table) : table_(table) {}

const ReportLayout &ReportDecoder::layout(uint8_t report_id) const {
    const ReportLayout *found = table_.find(report_id);
    if (found == nullptr) {
        throw ProtocolError(ProtocolErrorKind::UnknownReportType,
                            "Unknown report type " + hex_id(report_id));
    }
    return *found;
}

bool ReportDecoder::is_timing_report(uint8_t report_id) {
    return report_id == report_id::kBaseTimestamp || report_id == report_id::kTimestampRebase;
}

DecodedSample ReportDecoder::decode(uint8_t id, std::span<const uint8_t> bytes) const {
    const ReportLayout &lay = layout(id);
    if (lay.shape == ReportShape::TimeReference) {
        throw std::invalid_argument("Report " + hex_id(id) + " is a timing report");
    }
    if (bytes.size() < lay.length) {
        throw ProtocolError(ProtocolErrorKind::TruncatedPayload,
                            "Report " + lay.name + " needs " + std::to_string(lay.length) +
                                " bytes, got " + std::to_string(bytes.size()));
    }
    if (lay.fields.size() < fields_required(lay.shape)) {
        throw std::invalid_argument("Layout " + lay.name + " declares too few fields");
    }

    DecodedSample sample;
    sample.report_id = id;

    if (lay.standard_header) {
        const uint8_t status = bytes[2];
        sample.sequence = bytes[1];
        sample.accuracy = static_cast<uint8_t>(status & 0x03);
        sample.delay_us = delay_ticks(status, bytes[3]) * kTickUs;
    }

    sample.fields.reserve(lay.fields.size());
    for (const auto &field : lay.fields) {
        const double raw =
            field.is_signed ? static_cast<double>(read_int_le(bytes, field.offset, field.width))
                            : static_cast<double>(read_uint_le(bytes, field.offset, field.width));
        sample.fields.push_back(std::ldexp(raw, field.exponent));
    }

    sample.value = make_value(lay.shape, sample.fields);
    return sample;
}

TimingReport ReportDecoder::decode_timing(std::span<const uint8_t> bytes) const {
    if (bytes.empty()) {
        throw ProtocolError(ProtocolErrorKind::TruncatedPayload, "Empty timing report");
    }
    const uint8_t id = bytes[0];
    if (!is_timing_report(id)) {
        throw std::invalid_argument("Report " + hex_id(id) + " is not a timing report");
    }

    const ReportLayout &lay = layout(id);
    if (bytes.size() < lay.length) {
        throw ProtocolError(ProtocolErrorKind::TruncatedPayload,
                            "Report " + lay.name + " needs " + std::to_string(lay.length) +
                                " bytes, got " + std::to_string(bytes.size()));
    }
    if (lay.fields.empty()) {
        throw std::invalid_argument("Layout " + lay.name + " declares no delta field");
    }

    const auto &field = lay.fields.front();
    return TimingReport{
        .report_id = id,
        .delta_ticks = read_int_le(bytes, field.offset, field.width),
    };
}

} // namespace hubtrace::protocol
