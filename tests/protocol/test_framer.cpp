#include "hubtrace/protocol/framer.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace hubtrace;
using namespace hubtrace::protocol;
using hubtrace::test::FakeTransport;
using hubtrace::test::make_packet;
using hubtrace::test::split_packet;

namespace {

std::vector<uint8_t> header_only(uint16_t raw_length, uint8_t channel, uint8_t seq) {
    return {static_cast<uint8_t>(raw_length & 0xFF), static_cast<uint8_t>(raw_length >> 8),
            channel, seq};
}

} // namespace

TEST(Framer, ParseHeaderSplitsLengthAndContinuation) {
    const std::vector<uint8_t> bytes{0x14, 0x80, 0x03, 0x07};
    const auto hdr = parse_header(bytes);
    EXPECT_EQ(hdr.length, 20);
    EXPECT_TRUE(hdr.continuation);
    EXPECT_EQ(hdr.channel, 3);
    EXPECT_EQ(hdr.sequence, 7);

    const auto encoded = encode_header(hdr);
    EXPECT_EQ(std::vector<uint8_t>(encoded.begin(), encoded.end()), bytes);
}

TEST(Framer, RejectsReadSizeWithoutRoomForPayload) {
    FakeTransport transport;
    data::EventLog log(16, false);
    EXPECT_THROW(Framer(transport, log, 4), std::invalid_argument);
}

TEST(Framer, IdleTransportYieldsNothing) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    EXPECT_FALSE(framer.read_packet().has_value());
    EXPECT_EQ(framer.stats().packets, 0u);
}

TEST(Framer, SingleReadPacket) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(make_packet(3, 9, {0xAA, 0xBB, 0xCC}));
    auto packet = framer.read_packet();

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->channel, 3);
    EXPECT_EQ(packet->sequence, 9);
    EXPECT_EQ(packet->payload, (std::vector<uint8_t>{0xAA, 0xBB, 0xCC}));
    EXPECT_EQ(framer.state(), Framer::State::AwaitingHeader);
}

TEST(Framer, ReassemblesContinuationReads) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log, 8);

    const std::vector<uint8_t> payload{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    transport.queue_all(split_packet(2, 5, payload, 8));

    auto packet = framer.read_packet();

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->channel, 2);
    EXPECT_EQ(packet->payload, payload);
    EXPECT_EQ(framer.stats().continuation_reads, 2u);
    // Continuation reads ask only for what is still outstanding
    EXPECT_EQ(transport.read_requests, (std::vector<size_t>{8, 8, 6}));
}

TEST(Framer, TrailingBusPaddingIsIgnored) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    auto bytes = make_packet(3, 0, {0x11, 0x22});
    bytes.resize(32, 0x00);
    transport.queue(bytes);

    auto packet = framer.read_packet();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->payload, (std::vector<uint8_t>{0x11, 0x22}));
}

TEST(Framer, OversizedLengthResynchronizes) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log, 256, 1024);

    transport.queue(header_only(2000, 3, 0));
    transport.queue(make_packet(3, 1, {0x42}));

    try {
        (void)framer.read_packet();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolErrorKind::MalformedHeader);
    }
    EXPECT_EQ(framer.stats().resyncs, 1u);
    EXPECT_EQ(framer.state(), Framer::State::AwaitingHeader);

    // The next well-formed packet decodes normally
    auto packet = framer.read_packet();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->payload, (std::vector<uint8_t>{0x42}));
}

TEST(Framer, LengthShorterThanHeaderIsMalformed) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(header_only(2, 3, 0));

    try {
        (void)framer.read_packet();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolErrorKind::MalformedHeader);
    }
}

TEST(Framer, ZeroLengthHeaderIsMalformed) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(header_only(0, 3, 0));
    transport.queue(make_packet(3, 1, {0x42}));

    try {
        (void)framer.read_packet();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolErrorKind::MalformedHeader);
    }
    EXPECT_EQ(framer.stats().resyncs, 1u);

    auto packet = framer.read_packet();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->payload, (std::vector<uint8_t>{0x42}));
}

TEST(Framer, OrphanContinuationIsMalformed) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(header_only(0x8000 | 8, 3, 0));
    EXPECT_THROW((void)framer.read_packet(), ProtocolError);
}

TEST(Framer, ShortReadIsTruncated) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue({0x08, 0x00});

    try {
        (void)framer.read_packet();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError &e) {
        EXPECT_EQ(e.kind(), ProtocolErrorKind::TruncatedPayload);
    }
}

TEST(Framer, ContinuationOnOtherChannelDiscardsPartialPacket) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log, 8);

    auto reads = split_packet(3, 0, {1, 2, 3, 4, 5, 6}, 8);
    ASSERT_EQ(reads.size(), 2u);
    reads[1][2] = 4; // continuation claims channel 4
    transport.queue_all(reads);
    transport.queue(make_packet(3, 1, {7}));

    EXPECT_THROW((void)framer.read_packet(), ProtocolError);
    EXPECT_EQ(framer.state(), Framer::State::AwaitingHeader);

    auto packet = framer.read_packet();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->payload, (std::vector<uint8_t>{7}));
}

TEST(Framer, QuietTransportMidPacketIsTransportError) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log, 8);

    auto reads = split_packet(3, 0, {1, 2, 3, 4, 5, 6}, 8);
    transport.queue(reads[0]);

    EXPECT_THROW((void)framer.read_packet(), TransportError);
    EXPECT_EQ(framer.state(), Framer::State::AwaitingHeader);
}

TEST(Framer, CountsSequenceGapsPerChannel) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(make_packet(3, 0, {1}));
    transport.queue(make_packet(2, 40, {1}));
    transport.queue(make_packet(3, 1, {1}));
    transport.queue(make_packet(3, 3, {1}));

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(framer.read_packet().has_value());
    }
    EXPECT_EQ(framer.stats().sequence_gaps, 1u);
    EXPECT_EQ(log.count(data::EventType::Warning), 1u);
}

TEST(Framer, SequenceWrapIsNotAGap) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    transport.queue(make_packet(3, 255, {1}));
    transport.queue(make_packet(3, 0, {1}));
    ASSERT_TRUE(framer.read_packet().has_value());
    ASSERT_TRUE(framer.read_packet().has_value());

    EXPECT_EQ(framer.stats().sequence_gaps, 0u);
}

TEST(Framer, WriteStampsPerChannelSequence) {
    FakeTransport transport;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    const std::vector<uint8_t> payload{0xF9, 0x00};
    framer.write_packet(Channel::Control, payload);
    framer.write_packet(Channel::Control, payload);
    framer.write_packet(Channel::Executable, payload);

    ASSERT_EQ(transport.writes.size(), 3u);
    EXPECT_EQ(transport.writes[0], (std::vector<uint8_t>{0x06, 0x00, 0x02, 0x00, 0xF9, 0x00}));
    EXPECT_EQ(transport.writes[1][3], 1);
    EXPECT_EQ(transport.writes[2][2], 1);
    EXPECT_EQ(transport.writes[2][3], 0);
}

TEST(Framer, RejectedWriteIsTransportError) {
    FakeTransport transport;
    transport.fail_writes = true;
    data::EventLog log(16, false);
    Framer framer(transport, log);

    const std::vector<uint8_t> payload{0x01};
    EXPECT_THROW(framer.write_packet(Channel::Executable, payload), TransportError);
}
