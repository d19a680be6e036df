#include "hubtrace/driver.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace hubtrace {

Driver::Driver(io::Transport &transport, io::Clock &clock, const DriverConfig &config)
    : config_(config), transport_(transport), clock_(clock),
      log_(config_.event_log_capacity, config_.mirror_log),
      framer_(transport_, log_, config_.max_read_bytes, config_.max_packet_length),
      timestamps_(clock_), coordinator_(framer_, clock_, log_), features_(coordinator_),
      dispatcher_(decoder_, timestamps_, features_, coordinator_, log_) {
    dispatcher_.set_reset_hook([this] { framer_.reset_sequences(); });
}

PumpStatus Driver::poll() { return poll(clock_.now_us()); }

PumpStatus Driver::poll(uint64_t host_hint_us) {
    std::optional<protocol::Packet> packet;
    try {
        packet = framer_.read_packet();
    } catch (const ProtocolError &e) {
        log_.add(data::EventType::Warning,
                 std::string("Resynchronizing after ") + protocol_error_kind_label(e.kind()) +
                     ": " + e.what());
        return PumpStatus::Resynchronized;
    }

    if (!packet.has_value()) {
        return PumpStatus::Idle;
    }

    dispatcher_.dispatch(*packet, host_hint_us);
    return PumpStatus::Dispatched;
}

size_t Driver::update(size_t max_packets) {
    size_t dispatched = 0;
    // Resyncs spend the budget too, so a bus returning garbage still yields
    for (size_t cycle = 0; cycle < max_packets; ++cycle) {
        const PumpStatus status = poll();
        if (status == PumpStatus::Idle) {
            break;
        }
        if (status == PumpStatus::Dispatched) {
            ++dispatched;
        }
    }
    return dispatched;
}

void Driver::enable_feature(uint8_t report_id, uint32_t interval_us) {
    features_.enable(report_id, interval_us);
}

void Driver::disable_feature(uint8_t report_id) { features_.disable(report_id); }

const protocol::DecodedSample *Driver::latest(uint8_t report_id) const {
    return features_.latest(report_id);
}

std::optional<protocol::DecodedSample> Driver::take_updated(uint8_t report_id) {
    return features_.take_updated(report_id);
}

std::optional<int64_t> Driver::lag_us(const protocol::DecodedSample &sample) {
    if (!sample.timestamp_us.has_value()) {
        return std::nullopt;
    }
    return clock_.diff(clock_.now_us(), *sample.timestamp_us);
}

void Driver::begin_calibration(const protocol::CalibrationConfig &config) {
    wait(issue(protocol::Command::ConfigureCalibration,
               protocol::calibration_config_params(config)));
}

protocol::CalibrationConfig Driver::calibration_status() {
    const auto response =
        wait(issue(protocol::Command::QueryCalibration, protocol::calibration_query_params()));
    return protocol::calibration_config_from(response);
}

void Driver::save_calibration_data() {
    wait(issue(protocol::Command::SaveDcd, {}));
}

void Driver::tare_now(uint8_t axes, protocol::TareBasis basis) {
    coordinator_.post(protocol::Command::TareNow, protocol::tare_now_params(axes, basis));
}

void Driver::persist_tare() {
    coordinator_.post(protocol::Command::PersistTare, protocol::persist_tare_params());
}

void Driver::set_reorientation(const protocol::Quaternion &rotation) {
    coordinator_.post(protocol::Command::SetReorientation,
                      protocol::set_reorientation_params(rotation));
}

void Driver::clear_tare() {
    coordinator_.post(protocol::Command::ClearTare, protocol::clear_tare_params());
}

void Driver::soft_reset() {
    const uint8_t payload[] = {protocol::kExecutableReset};
    framer_.write_packet(protocol::Channel::Executable, payload);
    log_.add(data::EventType::Command, "soft reset");
}

void Driver::request_product_id() { coordinator_.request_product_id(); }

protocol::CommandTicket Driver::issue(protocol::Command command,
                                      const protocol::CommandParams &params) {
    return coordinator_.issue(command, params);
}

protocol::CommandResponse Driver::wait(const protocol::CommandTicket &ticket) {
    return wait(ticket, config_.command_timeout);
}

protocol::CommandResponse Driver::wait(const protocol::CommandTicket &ticket,
                                       std::chrono::milliseconds timeout) {
    return coordinator_.wait(ticket, timeout, [this] { pump_once(); });
}

void Driver::set_sample_callback(SampleCallback callback) {
    dispatcher_.set_sample_hook(std::move(callback));
}

void Driver::pump_once() {
    if (poll() == PumpStatus::Idle && config_.idle_poll_us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(config_.idle_poll_us));
    }
}

} // namespace hubtrace
