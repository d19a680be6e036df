#include "hubtrace/driver.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace hubtrace;
using namespace hubtrace::protocol;
using namespace hubtrace::test;
using namespace std::chrono_literals;

namespace {

DriverConfig quiet_config() {
    DriverConfig config;
    config.mirror_log = false;
    config.idle_poll_us = 0;
    config.command_timeout = 50ms;
    return config;
}

/// Answers every command request written to the fake hub.
void auto_respond(FakeTransport &transport, uint8_t status, std::vector<uint8_t> results = {}) {
    transport.on_write = [&transport, status, results](const std::vector<uint8_t> &w) {
        if (w.size() < kPacketHeaderSize + 3 || w[kPacketHeaderSize] != report_id::kCommandRequest) {
            return;
        }
        const uint8_t command_sequence = w[kPacketHeaderSize + 1];
        const uint8_t command_id = w[kPacketHeaderSize + 2];
        transport.queue(make_packet(static_cast<uint8_t>(Channel::Control), 0,
                                    command_response(command_id, command_sequence, status,
                                                     results)));
    };
}

std::vector<uint8_t> timed_accelerometer(uint8_t seq, int32_t base_ticks, uint8_t delay) {
    return make_packet(static_cast<uint8_t>(Channel::InputReports), seq,
                       concat({base_timestamp(base_ticks),
                               accelerometer(seq, 0x03, delay, 256, 0, 0)}));
}

/// A bus stuck high: every read returns all 0xFF bytes.
class StuckBusTransport : public io::Transport {
  public:
    std::optional<std::vector<uint8_t>> read(size_t max_bytes) override {
        ++reads;
        return std::vector<uint8_t>(max_bytes, 0xFF);
    }

    bool write(std::span<const uint8_t>) override { return true; }

    size_t reads = 0;
};

} // namespace

TEST(Driver, IdleTransport) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    EXPECT_EQ(driver.poll(), PumpStatus::Idle);
    EXPECT_EQ(driver.update(), 0u);
}

TEST(Driver, PollTimesSamplesFromHostClock) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    transport.queue(timed_accelerometer(0, 120, 17));
    EXPECT_EQ(driver.poll(), PumpStatus::Dispatched);

    const auto *latest = driver.latest(report_id::kAccelerometer);
    ASSERT_NE(latest, nullptr);
    EXPECT_EQ(latest->timestamp_us, 989'700u);
    EXPECT_EQ(driver.lag_us(*latest), 10'300);
}

TEST(Driver, ExplicitHostHint) {
    FakeTransport transport;
    FakeClock clock(9'999'999);
    Driver driver(transport, clock, quiet_config());

    transport.queue(timed_accelerometer(0, 120, 0));
    EXPECT_EQ(driver.poll(2'000'000), PumpStatus::Dispatched);

    EXPECT_EQ(driver.latest(report_id::kAccelerometer)->timestamp_us, 1'988'000u);
}

TEST(Driver, UntimedSampleHasNoLag) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    transport.queue(make_packet(3, 0, accelerometer(0, 0, 0, 0, 0, 0)));
    (void)driver.poll();

    const auto *latest = driver.latest(report_id::kAccelerometer);
    ASSERT_NE(latest, nullptr);
    EXPECT_FALSE(driver.lag_us(*latest).has_value());
}

TEST(Driver, MalformedHeaderResynchronizes) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    transport.queue({0xFF, 0x7F, 0x03, 0x00}); // length 32767 exceeds the limit
    transport.queue(timed_accelerometer(1, 120, 0));

    EXPECT_EQ(driver.poll(), PumpStatus::Resynchronized);
    EXPECT_GE(driver.log().count(data::EventType::Warning), 1u);
    EXPECT_EQ(driver.poll(), PumpStatus::Dispatched);
    EXPECT_NE(driver.latest(report_id::kAccelerometer), nullptr);
}

TEST(Driver, TransportErrorPropagates) {
    FakeTransport transport;
    FakeClock clock;
    DriverConfig config = quiet_config();
    config.max_read_bytes = 8;
    Driver driver(transport, clock, config);

    transport.queue(split_packet(3, 0, accelerometer(0, 0, 0, 0, 0, 0), 8).front());
    EXPECT_THROW((void)driver.poll(), TransportError);
}

TEST(Driver, UpdateDrainsQueuedPackets) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    for (uint8_t seq = 0; seq < 3; ++seq) {
        transport.queue(timed_accelerometer(seq, 120, 0));
    }

    EXPECT_EQ(driver.update(), 3u);
    EXPECT_EQ(driver.update(), 0u);
    EXPECT_EQ(driver.latest(report_id::kAccelerometer)->sequence, 2);
}

TEST(Driver, UpdateStopsAtBudget) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    for (uint8_t seq = 0; seq < 5; ++seq) {
        transport.queue(timed_accelerometer(seq, 0, 0));
    }

    EXPECT_EQ(driver.update(2), 2u);
    EXPECT_EQ(transport.chunks.size(), 3u);
}

TEST(Driver, UpdateReturnsWhenBusKeepsResynchronizing) {
    StuckBusTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    EXPECT_EQ(driver.update(64), 0u);
    EXPECT_EQ(transport.reads, 64u);
    EXPECT_EQ(driver.framer().stats().resyncs, 64u);
}

TEST(Driver, TakeUpdatedConsumesOnce) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    transport.queue(timed_accelerometer(0, 0, 0));
    (void)driver.update();

    EXPECT_TRUE(driver.take_updated(report_id::kAccelerometer).has_value());
    EXPECT_FALSE(driver.take_updated(report_id::kAccelerometer).has_value());
}

TEST(Driver, SaveCalibrationWaitsForResponse) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    // Sensor data already queued ahead of the reply is still delivered
    transport.queue(timed_accelerometer(0, 120, 0));
    auto_respond(transport, 0);

    EXPECT_NO_THROW(driver.save_calibration_data());
    EXPECT_NE(driver.latest(report_id::kAccelerometer), nullptr);
    EXPECT_EQ(driver.coordinator().pending_count(), 0u);
}

TEST(Driver, SaveCalibrationRejected) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());
    auto_respond(transport, 0x01);

    EXPECT_THROW(driver.save_calibration_data(), CommandRejectedError);
}

TEST(Driver, CommandTimeoutThenLateResponseIsDrained) {
    FakeTransport transport;
    FakeClock clock;
    clock.step_us = 1'000;
    Driver driver(transport, clock, quiet_config());

    uint8_t command_sequence = 0xFF;
    transport.on_write = [&](const std::vector<uint8_t> &w) {
        command_sequence = w[kPacketHeaderSize + 1];
    };

    EXPECT_THROW(driver.save_calibration_data(), CommandTimeoutError);

    transport.queue(make_packet(2, 0, command_response(kCommandSaveDcd, command_sequence, 0)));
    transport.queue(timed_accelerometer(0, 120, 0));
    EXPECT_EQ(driver.update(), 2u);

    EXPECT_EQ(driver.coordinator().unmatched_responses(), 1u);
    EXPECT_NE(driver.latest(report_id::kAccelerometer), nullptr);
}

TEST(Driver, CalibrationStatusReadsEnables) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());
    auto_respond(transport, 0, {1, 1, 0, 0, 0});

    const auto status = driver.calibration_status();

    EXPECT_TRUE(status.accelerometer);
    EXPECT_TRUE(status.gyroscope);
    EXPECT_FALSE(status.magnetometer);
}

TEST(Driver, BeginCalibrationSendsConfiguration) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());
    auto_respond(transport, 0);

    driver.begin_calibration(CalibrationConfig{.accelerometer = true,
                                               .gyroscope = true,
                                               .magnetometer = false});

    ASSERT_EQ(transport.writes.size(), 1u);
    const auto &w = transport.writes[0];
    EXPECT_EQ(w[kPacketHeaderSize + 2], kCommandMeCalibration);
    EXPECT_EQ(w[kPacketHeaderSize + 3], 1); // accel
    EXPECT_EQ(w[kPacketHeaderSize + 5], 0); // mag
    EXPECT_EQ(w[kPacketHeaderSize + 6], 0); // configure
}

TEST(Driver, TareIsPostedAndItsResponseDoesNotDisturbDecoding) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    driver.tare_now();

    ASSERT_EQ(transport.writes.size(), 1u);
    const auto &w = transport.writes[0];
    EXPECT_EQ(w[kPacketHeaderSize], report_id::kCommandRequest);
    EXPECT_EQ(w[kPacketHeaderSize + 2], kCommandTare);
    EXPECT_EQ(w[kPacketHeaderSize + 3], 0);            // tare now
    EXPECT_EQ(w[kPacketHeaderSize + 4], kTareAllAxes); // axes
    EXPECT_EQ(driver.coordinator().pending_count(), 1u);

    // Nobody waits for the tare reply; it arrives ahead of sensor data
    transport.queue(make_packet(2, 0, command_response(kCommandTare, w[kPacketHeaderSize + 1], 0)));
    transport.queue(timed_accelerometer(5, 120, 17));
    EXPECT_EQ(driver.update(), 2u);

    EXPECT_EQ(driver.coordinator().pending_count(), 0u);
    const auto *latest = driver.latest(report_id::kAccelerometer);
    ASSERT_NE(latest, nullptr);
    EXPECT_EQ(latest->sequence, 5);
    EXPECT_DOUBLE_EQ(latest->fields[0], 1.0);
    EXPECT_EQ(latest->timestamp_us, 989'700u);
}

TEST(Driver, TareVariantsEncodeSubcommands) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    driver.persist_tare();
    driver.set_reorientation(Quaternion{});
    driver.clear_tare();

    ASSERT_EQ(transport.writes.size(), 3u);
    EXPECT_EQ(transport.writes[0][kPacketHeaderSize + 3], 1);
    EXPECT_EQ(transport.writes[1][kPacketHeaderSize + 3], 2);
    EXPECT_EQ(transport.writes[1][kPacketHeaderSize + 11], 0x40); // real = 1.0 in Q14
    EXPECT_EQ(transport.writes[2][kPacketHeaderSize + 3], 2);
    EXPECT_EQ(transport.writes[2][kPacketHeaderSize + 11], 0x00);
}

TEST(Driver, ResetCompleteClearsState) {
    FakeTransport transport;
    FakeClock clock(1'000'000);
    Driver driver(transport, clock, quiet_config());

    driver.enable_feature(report_id::kAccelerometer, 10'000);
    transport.queue(timed_accelerometer(0, 120, 0));
    (void)driver.update();
    ASSERT_NE(driver.latest(report_id::kAccelerometer), nullptr);

    driver.soft_reset();
    ASSERT_EQ(transport.writes.size(), 2u);
    EXPECT_EQ(transport.writes[1], (std::vector<uint8_t>{0x05, 0x00, 0x01, 0x00, 0x01}));

    transport.queue(make_packet(1, 0, {kExecutableResetComplete}));
    (void)driver.update();

    EXPECT_EQ(driver.latest(report_id::kAccelerometer), nullptr);
    EXPECT_TRUE(driver.features().empty());
    EXPECT_EQ(driver.timestamps().state().state, data::BaseState::NoBase);
    EXPECT_EQ(driver.dispatcher().stats().resets, 1u);
}

TEST(Driver, ResetDuringWaitCancelsCommand) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    transport.on_write = [&](const std::vector<uint8_t> &) {
        transport.queue(make_packet(1, 0, {kExecutableResetComplete}));
    };

    EXPECT_THROW(driver.save_calibration_data(), std::runtime_error);
    EXPECT_EQ(driver.coordinator().pending_count(), 0u);
}

TEST(Driver, SampleCallbackSeesSamples) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    int seen = 0;
    driver.set_sample_callback([&](const DecodedSample &) { ++seen; });

    transport.queue(timed_accelerometer(0, 0, 0));
    transport.queue(make_packet(5, 0, std::vector<uint8_t>(14, 0)));
    (void)driver.update();

    EXPECT_EQ(seen, 2);
}

TEST(Driver, EnableFeatureSendsSetFeature) {
    FakeTransport transport;
    FakeClock clock;
    Driver driver(transport, clock, quiet_config());

    driver.enable_feature(report_id::kRotationVector, 2'500);
    driver.request_product_id();

    ASSERT_EQ(transport.writes.size(), 2u);
    EXPECT_EQ(transport.writes[0][kPacketHeaderSize], report_id::kSetFeatureCommand);
    EXPECT_EQ(transport.writes[1][kPacketHeaderSize], report_id::kProductIdRequest);
    EXPECT_EQ(driver.features().enabled_reports(),
              (std::vector<uint8_t>{report_id::kRotationVector}));
}
