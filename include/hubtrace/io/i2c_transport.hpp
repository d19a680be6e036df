#pragma once

#include "hubtrace/io/transport.hpp"

#include <string>

namespace hubtrace::io {

/// SHTP over Linux i2c-dev.
/// Every read starts with a 4-byte header transaction; a zero length means the
/// hub has nothing queued. Otherwise the packet is read again from its header in
/// one transaction of at most max_bytes.
class I2cTransport final : public Transport {
  public:
    static constexpr uint8_t kDefaultAddress = 0x4A;

    explicit I2cTransport(const std::string &bus_path, uint8_t address = kDefaultAddress);
    ~I2cTransport() override;

    I2cTransport(const I2cTransport &) = delete;
    I2cTransport &operator=(const I2cTransport &) = delete;

    std::optional<std::vector<uint8_t>> read(size_t max_bytes) override;
    [[nodiscard]] bool write(std::span<const uint8_t> bytes) override;

    [[nodiscard]] const std::string &bus_path() const { return bus_path_; }
    [[nodiscard]] uint8_t address() const { return address_; }

  private:
    void read_exact(uint8_t *buffer, size_t len);

    std::string bus_path_;
    uint8_t address_;
    int fd_ = -1;
};

} // namespace hubtrace::io
