#pragma once

#include "hubtrace/data/event_log.hpp"
#include "hubtrace/data/feature_registry.hpp"
#include "hubtrace/data/timestamp.hpp"
#include "hubtrace/protocol/coordinator.hpp"
#include "hubtrace/protocol/packet.hpp"
#include "hubtrace/protocol/report_decoder.hpp"

#include <functional>

namespace hubtrace::protocol {

struct DispatchStats {
    uint64_t packets = 0;
    uint64_t samples = 0;
    uint64_t untimed_samples = 0;
    uint64_t skipped_reports = 0;
    uint64_t dropped_packets = 0;
    uint64_t advertisements = 0;
    uint64_t resets = 0;
};

/// Routes each framed packet by channel to the decoder, the timestamp
/// reconstructor and the registry, or to the command coordinator.
class ChannelDispatcher {
  public:
    using SampleHook = std::function<void(const DecodedSample &)>;
    using ResetHook = std::function<void()>;

    ChannelDispatcher(const ReportDecoder &decoder, data::TimestampReconstructor &timestamps,
                      data::FeatureRegistry &features, CommandCoordinator &coordinator,
                      data::EventLog &log);

    /// Route one packet captured at host_hint_us. Returns samples recorded.
    size_t dispatch(const Packet &packet, uint64_t host_hint_us);

    /// Called with every sample just before it is recorded.
    void set_sample_hook(SampleHook hook) { sample_hook_ = std::move(hook); }

    /// Called after a hub reset has cleared driver state.
    void set_reset_hook(ResetHook hook) { reset_hook_ = std::move(hook); }

    [[nodiscard]] const DispatchStats &stats() const { return stats_; }

  private:
    void handle_executable(const Packet &packet);
    size_t handle_control(const Packet &packet, uint64_t host_hint_us);
    size_t handle_input(const Packet &packet, uint64_t host_hint_us);
    size_t handle_gyro_rotation(const Packet &packet, uint64_t host_hint_us);
    void apply_timing(const TimingReport &timing);
    void record(DecodedSample sample);
    void skip_rest(const ProtocolError &error, const Packet &packet, size_t remaining);

    const ReportDecoder &decoder_;
    data::TimestampReconstructor &timestamps_;
    data::FeatureRegistry &features_;
    CommandCoordinator &coordinator_;
    data::EventLog &log_;
    SampleHook sample_hook_;
    ResetHook reset_hook_;
    DispatchStats stats_;
};

} // namespace hubtrace::protocol
