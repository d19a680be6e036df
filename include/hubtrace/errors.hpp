#pragma once

#include <stdexcept>
#include <string>

namespace hubtrace {

/// Bus-level I/O failure. The byte stream is no longer trustworthy; the caller
/// must reset the hub before decoding anything else.
class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum class ProtocolErrorKind {
    MalformedHeader,
    UnknownReportType,
    TruncatedPayload,
};

const char *protocol_error_kind_label(ProtocolErrorKind kind);

/// Malformed bytes on an otherwise healthy transport.
class ProtocolError : public std::runtime_error {
  public:
    ProtocolError(ProtocolErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ProtocolErrorKind kind() const { return kind_; }

  private:
    ProtocolErrorKind kind_;
};

} // namespace hubtrace
