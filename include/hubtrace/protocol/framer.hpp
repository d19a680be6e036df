#pragma once

#include "hubtrace/data/event_log.hpp"
#include "hubtrace/errors.hpp"
#include "hubtrace/io/transport.hpp"
#include "hubtrace/protocol/packet.hpp"

#include <array>
#include <optional>
#include <string>

namespace hubtrace::protocol {

struct FramerStats {
    uint64_t packets = 0;
    uint64_t continuation_reads = 0;
    uint64_t resyncs = 0;
    uint64_t sequence_gaps = 0;
};

/// Reassembles SHTP packets from bounded transport reads and frames outgoing ones.
/// A packet larger than one read arrives as several reads, each starting with a
/// header whose continuation bit is set.
class Framer {
  public:
    static constexpr size_t kDefaultMaxReadBytes = 256;
    static constexpr uint16_t kDefaultMaxPacketLength = 4096;

    enum class State { AwaitingHeader, AwaitingContinuation };

    Framer(io::Transport &transport, data::EventLog &log,
           size_t max_read_bytes = kDefaultMaxReadBytes,
           uint16_t max_packet_length = kDefaultMaxPacketLength);

    /// Assemble exactly one packet, or return nullopt when no data is ready.
    /// On a malformed header the partial packet is discarded and ProtocolError is
    /// thrown; the next call starts again from a fresh header.
    /// Throws TransportError if the bus fails or goes quiet mid-packet.
    std::optional<Packet> read_packet();

    /// Frame and send one packet, stamping the channel's outgoing sequence number.
    void write_packet(Channel channel, std::span<const uint8_t> payload);

    /// Forget incoming sequence numbers (the hub restarts them after a reset).
    void reset_sequences();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] const FramerStats &stats() const { return stats_; }
    [[nodiscard]] size_t max_read_bytes() const { return max_read_bytes_; }

  private:
    [[noreturn]] void resync(ProtocolErrorKind kind, const std::string &message);
    void append_fragment(const std::vector<uint8_t> &chunk, size_t payload_length);
    void track_sequence(const Packet &packet);

    io::Transport &transport_;
    data::EventLog &log_;
    size_t max_read_bytes_;
    uint16_t max_packet_length_;
    State state_ = State::AwaitingHeader;
    std::vector<uint8_t> partial_;
    std::array<uint8_t, kChannelCount> tx_sequence_{};
    std::array<std::optional<uint8_t>, kChannelCount> rx_sequence_{};
    FramerStats stats_;
};

} // namespace hubtrace::protocol
