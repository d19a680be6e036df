#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace hubtrace::io {

/// Byte transport to the sensor hub.
/// Implementations must be byte-exact: no reordering, no silent truncation.
class Transport {
  public:
    virtual ~Transport() = default;

    /// One bus transaction returning at most max_bytes.
    /// Empty optional means the hub has nothing to send.
    /// Throws TransportError on bus failure.
    virtual std::optional<std::vector<uint8_t>> read(size_t max_bytes) = 0;

    /// Returns false if the bus rejected the write.
    [[nodiscard]] virtual bool write(std::span<const uint8_t> bytes) = 0;
};

} // namespace hubtrace::io
