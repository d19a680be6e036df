#include "hubtrace/io/i2c_transport.hpp"
#include "hubtrace/errors.hpp"

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

namespace hubtrace::io {

namespace {

constexpr size_t kHeaderBytes = 4;

std::string errno_text() { return std::strerror(errno); }

} // namespace

I2cTransport::I2cTransport(const std::string &bus_path, uint8_t address)
    : bus_path_(bus_path), address_(address) {
    fd_ = ::open(bus_path_.c_str(), O_RDWR);
    if (fd_ < 0) {
        throw TransportError("Cannot open " + bus_path_ + ": " + errno_text());
    }
    if (::ioctl(fd_, I2C_SLAVE, static_cast<unsigned long>(address_)) < 0) {
        const std::string reason = errno_text();
        ::close(fd_);
        fd_ = -1;
        throw TransportError("Cannot select I2C address on " + bus_path_ + ": " + reason);
    }
}

I2cTransport::~I2cTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::optional<std::vector<uint8_t>> I2cTransport::read(size_t max_bytes) {
    std::array<uint8_t, kHeaderBytes> header{};
    read_exact(header.data(), header.size());

    const size_t length = static_cast<size_t>(header[0] | ((header[1] & 0x7F) << 8));
    if (length == 0) {
        return std::nullopt;
    }

    // Too-short lengths still get a full header so the framer can reject them
    const size_t count = std::max(kHeaderBytes, std::min(length, max_bytes));
    std::vector<uint8_t> chunk(count);
    read_exact(chunk.data(), chunk.size());
    return chunk;
}

bool I2cTransport::write(std::span<const uint8_t> bytes) {
    const ssize_t written = ::write(fd_, bytes.data(), bytes.size());
    return written == static_cast<ssize_t>(bytes.size());
}

void I2cTransport::read_exact(uint8_t *buffer, size_t len) {
    const ssize_t got = ::read(fd_, buffer, len);
    if (got < 0) {
        throw TransportError("I2C read on " + bus_path_ + " failed: " + errno_text());
    }
    if (static_cast<size_t>(got) != len) {
        throw TransportError("I2C read on " + bus_path_ + " returned " + std::to_string(got) +
                             " of " + std::to_string(len) + " bytes");
    }
}

} // namespace hubtrace::io
