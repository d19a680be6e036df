#include "hubtrace/protocol/framer.hpp"

#include <algorithm>
#include <stdexcept>

namespace hubtrace::protocol {

const char *channel_label(uint8_t channel) {
    switch (channel) {
    case static_cast<uint8_t>(Channel::Command):
        return "command";
    case static_cast<uint8_t>(Channel::Executable):
        return "executable";
    case static_cast<uint8_t>(Channel::Control):
        return "control";
    case static_cast<uint8_t>(Channel::InputReports):
        return "input";
    case static_cast<uint8_t>(Channel::WakeInputReports):
        return "wake input";
    case static_cast<uint8_t>(Channel::GyroRotationVector):
        return "gyro rotation vector";
    default:
        return "unknown";
    }
}

Framer::Framer(io::Transport &transport, data::EventLog &log, size_t max_read_bytes,
               uint16_t max_packet_length)
    : transport_(transport), log_(log), max_read_bytes_(max_read_bytes),
      max_packet_length_(std::min(max_packet_length, kLengthMask)) {
    if (max_read_bytes_ <= kPacketHeaderSize) {
        throw std::invalid_argument("Framer read size must exceed the 4-byte header");
    }
}

std::optional<Packet> Framer::read_packet() {
    auto chunk = transport_.read(max_read_bytes_);
    if (!chunk.has_value()) {
        return std::nullopt;
    }

    if (chunk->size() < kPacketHeaderSize) {
        resync(ProtocolErrorKind::TruncatedPayload,
               "Read of " + std::to_string(chunk->size()) + " bytes is shorter than a header");
    }

    const PacketHeader header = parse_header(*chunk);
    if (header.length < kPacketHeaderSize || header.length > max_packet_length_) {
        resync(ProtocolErrorKind::MalformedHeader,
               "Header announces length " + std::to_string(header.length) + " on channel " +
                   std::to_string(header.channel));
    }
    if (header.continuation) {
        resync(ProtocolErrorKind::MalformedHeader,
               "Continuation header on channel " + std::to_string(header.channel) +
                   " without a packet in progress");
    }

    const size_t payload_length = header.length - kPacketHeaderSize;
    partial_.clear();
    partial_.reserve(payload_length);
    append_fragment(*chunk, payload_length);

    while (partial_.size() < payload_length) {
        state_ = State::AwaitingContinuation;
        const size_t remaining = payload_length - partial_.size();

        auto next = transport_.read(std::min(max_read_bytes_, remaining + kPacketHeaderSize));
        if (!next.has_value()) {
            state_ = State::AwaitingHeader;
            partial_.clear();
            throw TransportError("Transport went quiet with " + std::to_string(remaining) +
                                 " payload bytes outstanding on channel " +
                                 std::to_string(header.channel));
        }
        if (next->size() <= kPacketHeaderSize) {
            resync(ProtocolErrorKind::TruncatedPayload,
                   "Continuation read on channel " + std::to_string(header.channel) +
                       " carried no payload");
        }

        const PacketHeader cont = parse_header(*next);
        if (!cont.continuation || cont.channel != header.channel) {
            resync(ProtocolErrorKind::MalformedHeader,
                   "Expected continuation on channel " + std::to_string(header.channel) +
                       ", got channel " + std::to_string(cont.channel) +
                       (cont.continuation ? "" : " without continuation flag"));
        }

        ++stats_.continuation_reads;
        append_fragment(*next, payload_length);
    }

    state_ = State::AwaitingHeader;
    Packet packet{
        .channel = header.channel,
        .sequence = header.sequence,
        .payload = std::move(partial_),
    };
    partial_ = {};

    track_sequence(packet);
    ++stats_.packets;
    return packet;
}

void Framer::write_packet(Channel channel, std::span<const uint8_t> payload) {
    const auto index = static_cast<uint8_t>(channel);
    const size_t total = payload.size() + kPacketHeaderSize;
    if (total > max_packet_length_) {
        throw std::invalid_argument("Outgoing packet of " + std::to_string(total) +
                                    " bytes exceeds the packet limit");
    }

    const auto header = encode_header(PacketHeader{
        .length = static_cast<uint16_t>(total),
        .continuation = false,
        .channel = index,
        .sequence = tx_sequence_[index]++,
    });

    std::vector<uint8_t> buffer;
    buffer.reserve(total);
    buffer.insert(buffer.end(), header.begin(), header.end());
    buffer.insert(buffer.end(), payload.begin(), payload.end());

    if (!transport_.write(buffer)) {
        throw TransportError("Write of " + std::to_string(total) + " bytes on " +
                             channel_label(index) + " channel was rejected");
    }
}

void Framer::reset_sequences() { rx_sequence_.fill(std::nullopt); }

void Framer::resync(ProtocolErrorKind kind, const std::string &message) {
    partial_.clear();
    state_ = State::AwaitingHeader;
    ++stats_.resyncs;
    throw ProtocolError(kind, message);
}

void Framer::append_fragment(const std::vector<uint8_t> &chunk, size_t payload_length) {
    // Bytes past the announced length are bus padding
    const size_t available = chunk.size() - kPacketHeaderSize;
    const size_t take = std::min(available, payload_length - partial_.size());
    const auto first = chunk.begin() + static_cast<std::ptrdiff_t>(kPacketHeaderSize);
    partial_.insert(partial_.end(), first, first + static_cast<std::ptrdiff_t>(take));
}

void Framer::track_sequence(const Packet &packet) {
    if (packet.channel >= kChannelCount) {
        return;
    }

    auto &last = rx_sequence_[packet.channel];
    if (last.has_value() && packet.sequence != static_cast<uint8_t>(*last + 1)) {
        ++stats_.sequence_gaps;
        log_.add(data::EventType::Warning,
                 std::string("Sequence gap on ") + channel_label(packet.channel) +
                     " channel: expected " + std::to_string(static_cast<uint8_t>(*last + 1)) +
                     ", got " + std::to_string(packet.sequence));
    }
    last = packet.sequence;
}

} // namespace hubtrace::protocol
