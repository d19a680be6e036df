#pragma once

#include "hubtrace/protocol/sample.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace hubtrace::protocol {

/// Control-channel operations the driver can issue.
enum class Command {
    ConfigureCalibration,
    QueryCalibration,
    SaveDcd,
    TareNow,
    PersistTare,
    SetReorientation,
    ClearTare,
    SetFeature,
};

/// Static description of a command. Whether a reply must be drained is a
/// property of the command, never of the call site.
struct CommandDescriptor {
    Command command;
    const char *name;
    uint8_t report_id;  // 0xF2 command request or 0xFD set feature
    uint8_t command_id; // SH-2 command byte inside 0xF2 requests
    bool expects_response;
};

const CommandDescriptor &describe(Command command);

/// SH-2 command bytes carried in 0xF2 requests and echoed in 0xF1 responses.
inline constexpr uint8_t kCommandTare = 0x03;
inline constexpr uint8_t kCommandSaveDcd = 0x06;
inline constexpr uint8_t kCommandMeCalibration = 0x07;

inline constexpr size_t kCommandRequestLength = 12;
inline constexpr size_t kCommandResponseLength = 16;
inline constexpr size_t kSetFeatureLength = 17;

/// Tare axes bitmap (bit 0 X, bit 1 Y, bit 2 Z).
inline constexpr uint8_t kTareAllAxes = 0x07;
inline constexpr uint8_t kTareZAxis = 0x04;

enum class TareBasis : uint8_t {
    RotationVector = 0,
    GameRotationVector = 1,
    GeomagneticRotationVector = 2,
};

/// Motion engine calibration enables.
struct CalibrationConfig {
    bool accelerometer = true;
    bool gyroscope = true;
    bool magnetometer = true;
    bool planar_accelerometer = false;
    bool on_table = false;

    bool operator==(const CalibrationConfig &) const = default;
};

/// P0..P8 of a command request.
using CommandParams = std::array<uint8_t, 9>;

CommandParams calibration_config_params(const CalibrationConfig &config);
CommandParams calibration_query_params();
CommandParams tare_now_params(uint8_t axes, TareBasis basis);
CommandParams persist_tare_params();
CommandParams set_reorientation_params(const Quaternion &rotation);
CommandParams clear_tare_params();

/// 0xF2 request: [0xF2, command seq, command, P0..P8].
std::vector<uint8_t> encode_command_request(uint8_t command_id, uint8_t command_sequence,
                                            const CommandParams &params);

/// 0xFD request enabling a report at interval_us (0 disables it).
std::vector<uint8_t> encode_set_feature(uint8_t feature_report, uint32_t interval_us,
                                        uint32_t batch_interval_us = 0);

std::vector<uint8_t> encode_product_id_request();

/// 0xF1: [0xF1, seq, command, command seq, response seq, R0..R10].
struct CommandResponse {
    uint8_t sequence = 0;
    uint8_t command_id = 0;
    uint8_t command_sequence = 0;
    uint8_t response_sequence = 0;
    std::array<uint8_t, 11> result{};

    /// R0; zero means the hub accepted the command.
    [[nodiscard]] uint8_t status() const { return result[0]; }
    [[nodiscard]] bool succeeded() const { return status() == 0; }
};

/// Returns nullopt if the payload is not a complete 0xF1 report.
std::optional<CommandResponse> parse_command_response(std::span<const uint8_t> payload);

/// Enables reported by an ME calibration query (R1..R5).
CalibrationConfig calibration_config_from(const CommandResponse &response);

enum class CommandStatus { Pending, Completed, Rejected };

/// A response-bearing command in flight.
struct PendingCommand {
    Command command = Command::SaveDcd;
    uint8_t command_sequence = 0;
    uint64_t submitted_us = 0;
    std::optional<uint64_t> completed_us;
    CommandStatus status = CommandStatus::Pending;
    std::optional<CommandResponse> response;
    bool detached = false; // nobody will wait; drop once drained
};

const char *command_status_label(CommandStatus status);

} // namespace hubtrace::protocol
