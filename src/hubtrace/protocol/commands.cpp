#include "hubtrace/protocol/commands.hpp"
#include "hubtrace/protocol/packet.hpp"
#include "hubtrace/protocol/report_layout.hpp"

#include <cmath>
#include <stdexcept>

namespace hubtrace::protocol {

namespace {

// Tare subcommands (P0)
constexpr uint8_t kTareNow = 0x00;
constexpr uint8_t kTarePersist = 0x01;
constexpr uint8_t kTareSetReorientation = 0x02;

// ME calibration subcommands (P3)
constexpr uint8_t kCalibrationConfigure = 0x00;
constexpr uint8_t kCalibrationGet = 0x01;

constexpr std::array<CommandDescriptor, 8> kDescriptors = {{
    {Command::ConfigureCalibration, "configure calibration", report_id::kCommandRequest,
     kCommandMeCalibration, true},
    {Command::QueryCalibration, "query calibration", report_id::kCommandRequest,
     kCommandMeCalibration, true},
    {Command::SaveDcd, "save dcd", report_id::kCommandRequest, kCommandSaveDcd, true},
    {Command::TareNow, "tare now", report_id::kCommandRequest, kCommandTare, true},
    {Command::PersistTare, "persist tare", report_id::kCommandRequest, kCommandTare, true},
    {Command::SetReorientation, "set reorientation", report_id::kCommandRequest, kCommandTare,
     true},
    {Command::ClearTare, "clear tare", report_id::kCommandRequest, kCommandTare, true},
    {Command::SetFeature, "set feature", report_id::kSetFeatureCommand, 0, false},
}};

int16_t to_q14(double value) {
    const double scaled = std::round(value * 16384.0);
    if (scaled > 32767.0) {
        return 32767;
    }
    if (scaled < -32768.0) {
        return -32768;
    }
    return static_cast<int16_t>(scaled);
}

void put_i16(CommandParams &params, size_t index, int16_t value) {
    const auto raw = static_cast<uint16_t>(value);
    params[index] = static_cast<uint8_t>(raw & 0xFF);
    params[index + 1] = static_cast<uint8_t>(raw >> 8);
}

} // namespace

const CommandDescriptor &describe(Command command) {
    for (const auto &descriptor : kDescriptors) {
        if (descriptor.command == command) {
            return descriptor;
        }
    }
    throw std::invalid_argument("Command has no descriptor");
}

CommandParams calibration_config_params(const CalibrationConfig &config) {
    CommandParams params{};
    params[0] = config.accelerometer ? 1 : 0;
    params[1] = config.gyroscope ? 1 : 0;
    params[2] = config.magnetometer ? 1 : 0;
    params[3] = kCalibrationConfigure;
    params[4] = config.planar_accelerometer ? 1 : 0;
    params[5] = config.on_table ? 1 : 0;
    return params;
}

CommandParams calibration_query_params() {
    CommandParams params{};
    params[3] = kCalibrationGet;
    return params;
}

CommandParams tare_now_params(uint8_t axes, TareBasis basis) {
    CommandParams params{};
    params[0] = kTareNow;
    params[1] = axes;
    params[2] = static_cast<uint8_t>(basis);
    return params;
}

CommandParams persist_tare_params() {
    CommandParams params{};
    params[0] = kTarePersist;
    return params;
}

CommandParams set_reorientation_params(const Quaternion &rotation) {
    CommandParams params{};
    params[0] = kTareSetReorientation;
    put_i16(params, 1, to_q14(rotation.i));
    put_i16(params, 3, to_q14(rotation.j));
    put_i16(params, 5, to_q14(rotation.k));
    put_i16(params, 7, to_q14(rotation.real));
    return params;
}

CommandParams clear_tare_params() {
    // A zero reorientation quaternion removes any tare
    CommandParams params{};
    params[0] = kTareSetReorientation;
    return params;
}

std::vector<uint8_t> encode_command_request(uint8_t command_id, uint8_t command_sequence,
                                            const CommandParams &params) {
    std::vector<uint8_t> out;
    out.reserve(kCommandRequestLength);
    out.push_back(report_id::kCommandRequest);
    out.push_back(command_sequence);
    out.push_back(command_id);
    out.insert(out.end(), params.begin(), params.end());
    return out;
}

std::vector<uint8_t> encode_set_feature(uint8_t feature_report, uint32_t interval_us,
                                        uint32_t batch_interval_us) {
    std::vector<uint8_t> out;
    out.reserve(kSetFeatureLength);
    out.push_back(report_id::kSetFeatureCommand);
    out.push_back(feature_report);
    out.push_back(0);        // feature flags
    append_u16_le(out, 0);   // change sensitivity
    append_u32_le(out, interval_us);
    append_u32_le(out, batch_interval_us);
    append_u32_le(out, 0);   // sensor-specific configuration
    return out;
}

std::vector<uint8_t> encode_product_id_request() { return {report_id::kProductIdRequest, 0}; }

std::optional<CommandResponse> parse_command_response(std::span<const uint8_t> payload) {
    if (payload.size() < kCommandResponseLength || payload[0] != report_id::kCommandResponse) {
        return std::nullopt;
    }

    CommandResponse response;
    response.sequence = payload[1];
    response.command_id = payload[2];
    response.command_sequence = payload[3];
    response.response_sequence = payload[4];
    for (size_t i = 0; i < response.result.size(); ++i) {
        response.result[i] = payload[5 + i];
    }
    return response;
}

CalibrationConfig calibration_config_from(const CommandResponse &response) {
    return CalibrationConfig{
        .accelerometer = response.result[1] != 0,
        .gyroscope = response.result[2] != 0,
        .magnetometer = response.result[3] != 0,
        .planar_accelerometer = response.result[4] != 0,
        .on_table = response.result[5] != 0,
    };
}

const char *command_status_label(CommandStatus status) {
    switch (status) {
    case CommandStatus::Pending:
        return "pending";
    case CommandStatus::Completed:
        return "completed";
    case CommandStatus::Rejected:
        return "rejected";
    }
    return "unknown";
}

} // namespace hubtrace::protocol
