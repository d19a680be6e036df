#pragma once

#include "hubtrace/config.hpp"
#include "hubtrace/data/event_log.hpp"
#include "hubtrace/data/feature_registry.hpp"
#include "hubtrace/data/timestamp.hpp"
#include "hubtrace/io/clock.hpp"
#include "hubtrace/io/transport.hpp"
#include "hubtrace/protocol/commands.hpp"
#include "hubtrace/protocol/coordinator.hpp"
#include "hubtrace/protocol/dispatcher.hpp"
#include "hubtrace/protocol/framer.hpp"
#include "hubtrace/protocol/report_decoder.hpp"

#include <functional>
#include <optional>

namespace hubtrace {

/// Outcome of one data pump cycle.
enum class PumpStatus {
    Idle,           // transport had nothing
    Dispatched,     // one packet framed and routed
    Resynchronized, // malformed header; buffered bytes discarded
};

/// One sensor hub. Owns the driver context (timestamp state, feature table,
/// event log) and every protocol component; the transport and clock belong to
/// the caller. Single-threaded: callers serialize access.
class Driver {
  public:
    using SampleCallback = std::function<void(const protocol::DecodedSample &)>;

    Driver(io::Transport &transport, io::Clock &clock, const DriverConfig &config = {});

    Driver(const Driver &) = delete;
    Driver &operator=(const Driver &) = delete;

    /// One read-assemble-dispatch cycle, timed from now.
    PumpStatus poll();

    /// Same, with the host time captured when the hub signalled data ready.
    PumpStatus poll(uint64_t host_hint_us);

    /// Poll until the transport is idle or max_packets cycles ran (dispatched or
    /// resynchronized). Returns the number of packets dispatched.
    size_t update(size_t max_packets = 64);

    void enable_feature(uint8_t report_id, uint32_t interval_us);
    void disable_feature(uint8_t report_id);

    /// nullptr means no data yet.
    [[nodiscard]] const protocol::DecodedSample *latest(uint8_t report_id) const;
    [[nodiscard]] std::optional<protocol::DecodedSample> take_updated(uint8_t report_id);

    /// Host time elapsed since the sample was taken, or nullopt if it has no timestamp.
    [[nodiscard]] std::optional<int64_t> lag_us(const protocol::DecodedSample &sample);

    /// Start motion engine calibration and wait for the hub to accept it.
    void begin_calibration(const protocol::CalibrationConfig &config = {});

    /// Which calibrations are currently running.
    [[nodiscard]] protocol::CalibrationConfig calibration_status();

    /// Persist dynamic calibration data. Throws CommandRejectedError if the hub
    /// refuses (e.g. a sensor is not calibrated yet).
    void save_calibration_data();

    void tare_now(uint8_t axes = protocol::kTareAllAxes,
                  protocol::TareBasis basis = protocol::TareBasis::RotationVector);
    void persist_tare();
    void set_reorientation(const protocol::Quaternion &rotation);
    void clear_tare();

    /// Ask the hub to reset; state clears when it reports reset complete.
    void soft_reset();
    void request_product_id();

    /// Generic response-bearing command.
    protocol::CommandTicket issue(protocol::Command command, const protocol::CommandParams &params);
    protocol::CommandResponse wait(const protocol::CommandTicket &ticket);
    protocol::CommandResponse wait(const protocol::CommandTicket &ticket,
                                   std::chrono::milliseconds timeout);

    void set_sample_callback(SampleCallback callback);

    [[nodiscard]] const DriverConfig &config() const { return config_; }
    [[nodiscard]] data::EventLog &log() { return log_; }
    [[nodiscard]] const data::FeatureRegistry &features() const { return features_; }
    [[nodiscard]] const data::TimestampReconstructor &timestamps() const { return timestamps_; }
    [[nodiscard]] const protocol::CommandCoordinator &coordinator() const { return coordinator_; }
    [[nodiscard]] const protocol::Framer &framer() const { return framer_; }
    [[nodiscard]] const protocol::ChannelDispatcher &dispatcher() const { return dispatcher_; }

  private:
    void pump_once();

    DriverConfig config_;
    io::Transport &transport_;
    io::Clock &clock_;
    data::EventLog log_;
    protocol::Framer framer_;
    protocol::ReportDecoder decoder_;
    data::TimestampReconstructor timestamps_;
    protocol::CommandCoordinator coordinator_;
    data::FeatureRegistry features_;
    protocol::ChannelDispatcher dispatcher_;
};

} // namespace hubtrace
