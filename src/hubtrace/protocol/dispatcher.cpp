#include "hubtrace/protocol/dispatcher.hpp"

#include <algorithm>
#include <variant>

namespace hubtrace::protocol {

ChannelDispatcher::ChannelDispatcher(const ReportDecoder &decoder,
                                     data::TimestampReconstructor &timestamps,
                                     data::FeatureRegistry &features,
                                     CommandCoordinator &coordinator, data::EventLog &log)
    : decoder_(decoder), timestamps_(timestamps), features_(features), coordinator_(coordinator),
      log_(log) {}

size_t ChannelDispatcher::dispatch(const Packet &packet, uint64_t host_hint_us) {
    ++stats_.packets;

    switch (packet.channel) {
    case static_cast<uint8_t>(Channel::Command):
        ++stats_.advertisements;
        return 0;
    case static_cast<uint8_t>(Channel::Executable):
        handle_executable(packet);
        return 0;
    case static_cast<uint8_t>(Channel::Control):
        return handle_control(packet, host_hint_us);
    case static_cast<uint8_t>(Channel::InputReports):
    case static_cast<uint8_t>(Channel::WakeInputReports):
        return handle_input(packet, host_hint_us);
    case static_cast<uint8_t>(Channel::GyroRotationVector):
        return handle_gyro_rotation(packet, host_hint_us);
    default:
        ++stats_.dropped_packets;
        log_.add(data::EventType::Warning,
                 "Dropping packet on unknown channel " + std::to_string(packet.channel));
        return 0;
    }
}

void ChannelDispatcher::handle_executable(const Packet &packet) {
    if (packet.payload.empty() || packet.payload[0] != kExecutableResetComplete) {
        return;
    }

    ++stats_.resets;
    timestamps_.reset();
    features_.reset();
    coordinator_.reset();
    log_.add(data::EventType::Info, "Hub reset complete; driver state cleared");
    if (reset_hook_) {
        reset_hook_();
    }
}

size_t ChannelDispatcher::handle_control(const Packet &packet, uint64_t host_hint_us) {
    if (packet.payload.empty()) {
        return 0;
    }
    if (packet.payload[0] == report_id::kCommandResponse) {
        coordinator_.on_response(packet.payload);
        return 0;
    }

    std::span<const uint8_t> rest(packet.payload);
    size_t recorded = 0;
    while (!rest.empty()) {
        try {
            const ReportLayout &layout = decoder_.layout(rest[0]);
            if (layout.shape == ReportShape::TimeReference) {
                rest = rest.subspan(std::min(layout.length, rest.size()));
                continue;
            }

            DecodedSample sample = decoder_.decode(rest[0], rest);
            sample.timestamp_us = host_hint_us;

            if (const auto *feature = std::get_if<FeatureReport>(&sample.value)) {
                features_.confirm(feature->report_id, feature->interval_us);
            }
            record(std::move(sample));
            ++recorded;
            rest = rest.subspan(layout.length);
        } catch (const ProtocolError &e) {
            skip_rest(e, packet, rest.size());
            break;
        }
    }
    return recorded;
}

size_t ChannelDispatcher::handle_input(const Packet &packet, uint64_t host_hint_us) {
    timestamps_.begin_batch(host_hint_us);

    std::span<const uint8_t> rest(packet.payload);
    size_t recorded = 0;
    bool warned_untimed = false;
    while (!rest.empty()) {
        try {
            const ReportLayout &layout = decoder_.layout(rest[0]);
            if (layout.shape == ReportShape::TimeReference) {
                apply_timing(decoder_.decode_timing(rest));
                rest = rest.subspan(layout.length);
                continue;
            }

            DecodedSample sample = decoder_.decode(rest[0], rest);
            sample.timestamp_us = timestamps_.sample_time(sample.delay_us);
            if (!sample.timestamp_us.has_value()) {
                ++stats_.untimed_samples;
                if (!warned_untimed) {
                    warned_untimed = true;
                    log_.add(data::EventType::Warning,
                             "No base timestamp in batch on " +
                                 std::string(channel_label(packet.channel)) +
                                 " channel; timestamps left undefined");
                }
            }
            record(std::move(sample));
            ++recorded;
            rest = rest.subspan(layout.length);
        } catch (const ProtocolError &e) {
            skip_rest(e, packet, rest.size());
            break;
        }
    }
    return recorded;
}

size_t ChannelDispatcher::handle_gyro_rotation(const Packet &packet, uint64_t host_hint_us) {
    try {
        DecodedSample sample =
            decoder_.decode(report_id::kGyroIntegratedRotationVector, packet.payload);
        // No sensor-side timing on this path
        sample.timestamp_us = host_hint_us;
        record(std::move(sample));
        return 1;
    } catch (const ProtocolError &e) {
        skip_rest(e, packet, packet.payload.size());
        return 0;
    }
}

void ChannelDispatcher::apply_timing(const TimingReport &timing) {
    if (!timing.is_rebase()) {
        timestamps_.assign_base(timing.delta_us());
        return;
    }
    if (!timestamps_.rebase(timing.delta_us())) {
        log_.add(data::EventType::Warning, "Ignoring timestamp rebase without a base in batch");
    }
}

void ChannelDispatcher::record(DecodedSample sample) {
    ++stats_.samples;
    if (sample_hook_) {
        sample_hook_(sample);
    }
    features_.record(std::move(sample));
}

void ChannelDispatcher::skip_rest(const ProtocolError &error, const Packet &packet,
                                  size_t remaining) {
    ++stats_.skipped_reports;
    log_.add(data::EventType::Warning, std::string(error.what()) + "; skipping " +
                                           std::to_string(remaining) + " bytes on " +
                                           channel_label(packet.channel) + " channel");
}

} // namespace hubtrace::protocol
