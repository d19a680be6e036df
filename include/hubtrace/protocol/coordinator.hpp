#pragma once

#include "hubtrace/data/event_log.hpp"
#include "hubtrace/io/clock.hpp"
#include "hubtrace/protocol/commands.hpp"
#include "hubtrace/protocol/framer.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hubtrace::protocol {

/// No matching response arrived before the deadline. The command stays sent.
class CommandTimeoutError : public std::runtime_error {
  public:
    CommandTimeoutError(const std::string &message, PendingCommand pending)
        : std::runtime_error(message), pending_(std::move(pending)) {}

    /// Snapshot of the command at expiry (still in pending state).
    [[nodiscard]] const PendingCommand &pending() const { return pending_; }

  private:
    PendingCommand pending_;
};

/// The hub answered with a non-zero status.
class CommandRejectedError : public std::runtime_error {
  public:
    CommandRejectedError(const std::string &message, Command command, uint8_t status)
        : std::runtime_error(message), command_(command), status_(status) {}

    [[nodiscard]] Command command() const { return command_; }
    [[nodiscard]] uint8_t status() const { return status_; }

  private:
    Command command_;
    uint8_t status_;
};

/// Correlates a sent command with its eventual response.
struct CommandTicket {
    Command command = Command::SaveDcd;
    uint8_t command_sequence = 0;
};

/// Sends control-channel commands and matches 0xF1 responses to them.
/// Responses are fed in by the dispatcher whether or not anyone is waiting, so a
/// reply never lingers on the transport.
class CommandCoordinator {
  public:
    /// One data pump cycle, supplied by the owner of the transport.
    using PumpFn = std::function<void()>;

    CommandCoordinator(Framer &framer, io::Clock &clock, data::EventLog &log);

    /// Send a command whose reply the caller will wait for.
    /// Throws std::invalid_argument for commands without a response.
    /// Only the 16 most recent completed replies are kept for waiting.
    CommandTicket issue(Command command, const CommandParams &params);

    /// Send a command without waiting. A reply, if the command has one, is still
    /// drained and logged when it arrives.
    void post(Command command, const CommandParams &params);

    /// Fire-and-forget 0xFD Set Feature.
    void set_feature(uint8_t report_id, uint32_t interval_us);

    void request_product_id();

    /// Handle a channel-2 payload starting with 0xF1.
    void on_response(std::span<const uint8_t> payload);

    /// Keep pumping until the ticket's response arrives or the timeout expires.
    /// Consumes the pending entry. Throws CommandTimeoutError or CommandRejectedError.
    CommandResponse wait(const CommandTicket &ticket, std::chrono::milliseconds timeout,
                         const PumpFn &pump);

    /// nullptr once the ticket has been consumed, expired or reset away.
    [[nodiscard]] const PendingCommand *pending(const CommandTicket &ticket) const;
    [[nodiscard]] size_t pending_count() const { return pending_.size(); }
    [[nodiscard]] uint64_t unmatched_responses() const { return unmatched_; }

    /// Hub reset: nothing in flight will be answered.
    void reset();

  private:
    PendingCommand &send(Command command, const CommandParams &params, bool detached);
    std::vector<PendingCommand>::iterator find(const CommandTicket &ticket);
    /// Bound the replies held for tickets nobody waits on.
    void evict_unclaimed();

    Framer &framer_;
    io::Clock &clock_;
    data::EventLog &log_;
    uint8_t next_command_sequence_ = 0;
    uint64_t reset_epoch_ = 0;
    std::vector<PendingCommand> pending_;
    uint64_t unmatched_ = 0;
};

} // namespace hubtrace::protocol
