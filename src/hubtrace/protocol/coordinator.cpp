#include "hubtrace/protocol/coordinator.hpp"
#include "hubtrace/protocol/report_layout.hpp"

#include <algorithm>
#include <cstdio>

namespace hubtrace::protocol {

namespace {

// Detached commands whose reply never came are forgotten beyond this many
constexpr size_t kMaxDetached = 16;

// Completed replies nobody has waited for yet
constexpr size_t kMaxUnclaimed = 16;

std::string describe_response(const CommandResponse &response) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "command 0x%02X seq %u status %u", response.command_id,
                  static_cast<unsigned>(response.command_sequence),
                  static_cast<unsigned>(response.status()));
    return buffer;
}

} // namespace

CommandCoordinator::CommandCoordinator(Framer &framer, io::Clock &clock, data::EventLog &log)
    : framer_(framer), clock_(clock), log_(log) {}

CommandTicket CommandCoordinator::issue(Command command, const CommandParams &params) {
    const auto &descriptor = describe(command);
    if (!descriptor.expects_response) {
        throw std::invalid_argument(std::string("Command '") + descriptor.name +
                                    "' has no response to wait for");
    }
    const PendingCommand &entry = send(command, params, false);
    return CommandTicket{.command = command, .command_sequence = entry.command_sequence};
}

void CommandCoordinator::post(Command command, const CommandParams &params) {
    send(command, params, true);
}

PendingCommand &CommandCoordinator::send(Command command, const CommandParams &params,
                                         bool detached) {
    const auto &descriptor = describe(command);
    if (descriptor.report_id != report_id::kCommandRequest) {
        throw std::invalid_argument(std::string("Command '") + descriptor.name +
                                    "' is not a command request");
    }

    const uint8_t sequence = next_command_sequence_++;
    const auto payload = encode_command_request(descriptor.command_id, sequence, params);
    framer_.write_packet(Channel::Control, payload);
    log_.add(data::EventType::Command,
             std::string(descriptor.name) + " (seq " + std::to_string(sequence) + ")");

    if (detached) {
        const auto detached_count = std::count_if(
            pending_.begin(), pending_.end(), [](const PendingCommand &p) { return p.detached; });
        if (static_cast<size_t>(detached_count) >= kMaxDetached) {
            auto oldest = std::find_if(pending_.begin(), pending_.end(),
                                       [](const PendingCommand &p) { return p.detached; });
            pending_.erase(oldest);
        }
    }

    // Registered even when detached so its reply is recognized and drained
    pending_.push_back(PendingCommand{
        .command = command,
        .command_sequence = sequence,
        .submitted_us = clock_.now_us(),
        .completed_us = std::nullopt,
        .status = CommandStatus::Pending,
        .response = std::nullopt,
        .detached = detached,
    });
    return pending_.back();
}

void CommandCoordinator::set_feature(uint8_t report_id, uint32_t interval_us) {
    const auto payload = encode_set_feature(report_id, interval_us);
    framer_.write_packet(Channel::Control, payload);
    log_.add(data::EventType::Command, "set feature " + report_name(report_id) + " interval " +
                                           std::to_string(interval_us) + " us");
}

void CommandCoordinator::request_product_id() {
    const auto payload = encode_product_id_request();
    framer_.write_packet(Channel::Control, payload);
    log_.add(data::EventType::Command, "product id request");
}

void CommandCoordinator::on_response(std::span<const uint8_t> payload) {
    const auto response = parse_command_response(payload);
    if (!response.has_value()) {
        ++unmatched_;
        log_.add(data::EventType::Warning,
                 "Discarding short command response (" + std::to_string(payload.size()) +
                     " bytes)");
        return;
    }

    auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingCommand &p) {
        const auto &descriptor = describe(p.command);
        return p.status == CommandStatus::Pending &&
               descriptor.command_id == response->command_id &&
               p.command_sequence == response->command_sequence;
    });

    if (it == pending_.end()) {
        ++unmatched_;
        log_.add(data::EventType::Response,
                 "Discarding unmatched response: " + describe_response(*response));
        return;
    }

    const char *name = describe(it->command).name;
    log_.add(data::EventType::Response, std::string(name) + ": " + describe_response(*response));

    if (it->detached) {
        if (!response->succeeded()) {
            log_.add(data::EventType::Warning, std::string(name) + " rejected with status " +
                                                   std::to_string(response->status()));
        }
        pending_.erase(it);
        return;
    }

    it->completed_us = clock_.now_us();
    it->status = response->succeeded() ? CommandStatus::Completed : CommandStatus::Rejected;
    it->response = *response;
    evict_unclaimed();
}

void CommandCoordinator::evict_unclaimed() {
    auto unclaimed = [](const PendingCommand &p) { return p.status != CommandStatus::Pending; };
    while (static_cast<size_t>(std::count_if(pending_.begin(), pending_.end(), unclaimed)) >
           kMaxUnclaimed) {
        auto oldest = std::find_if(pending_.begin(), pending_.end(), unclaimed);
        log_.add(data::EventType::Warning,
                 std::string("Dropping unclaimed reply to ") + describe(oldest->command).name +
                     " (seq " + std::to_string(oldest->command_sequence) + ")");
        pending_.erase(oldest);
    }
}

CommandResponse CommandCoordinator::wait(const CommandTicket &ticket,
                                         std::chrono::milliseconds timeout,
                                         const PumpFn &pump) {
    if (find(ticket) == pending_.end()) {
        throw std::invalid_argument("No pending command with sequence " +
                                    std::to_string(ticket.command_sequence));
    }

    const char *name = describe(ticket.command).name;
    const uint64_t epoch = reset_epoch_;
    const uint64_t start = clock_.now_us();
    const int64_t budget_us = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();

    while (true) {
        if (reset_epoch_ != epoch) {
            throw std::runtime_error(std::string(name) + " cancelled by hub reset");
        }

        auto it = find(ticket);
        if (it == pending_.end()) {
            throw std::runtime_error(std::string(name) + " is no longer pending");
        }
        if (it->status != CommandStatus::Pending) {
            PendingCommand done = std::move(*it);
            pending_.erase(it);
            if (done.status == CommandStatus::Rejected) {
                throw CommandRejectedError(std::string(name) + " rejected with status " +
                                               std::to_string(done.response->status()),
                                           done.command, done.response->status());
            }
            return *done.response;
        }

        if (clock_.diff(clock_.now_us(), start) >= budget_us) {
            PendingCommand snapshot = *it;
            pending_.erase(it);
            log_.add(data::EventType::Warning, std::string(name) + " timed out after " +
                                                   std::to_string(timeout.count()) + " ms");
            throw CommandTimeoutError(std::string(name) + " timed out", std::move(snapshot));
        }

        pump();
    }
}

const PendingCommand *CommandCoordinator::pending(const CommandTicket &ticket) const {
    auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingCommand &p) {
        return p.command == ticket.command && p.command_sequence == ticket.command_sequence;
    });
    if (it != pending_.end()) {
        return &*it;
    }
    return nullptr;
}

void CommandCoordinator::reset() {
    if (!pending_.empty()) {
        log_.add(data::EventType::Warning,
                 "Hub reset dropped " + std::to_string(pending_.size()) + " pending commands");
    }
    pending_.clear();
    ++reset_epoch_;
}

std::vector<PendingCommand>::iterator CommandCoordinator::find(const CommandTicket &ticket) {
    return std::find_if(pending_.begin(), pending_.end(), [&](const PendingCommand &p) {
        return p.command == ticket.command && p.command_sequence == ticket.command_sequence;
    });
}

} // namespace hubtrace::protocol
