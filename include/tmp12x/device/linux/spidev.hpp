#pragma once

#include <tmp12x/detail/result.hpp>

#include <cstdint>
#include <string>
#include <system_error>

namespace tmp12x::dev::linux_host {

/// Transport on top of the Linux spidev interface. The kernel drives
/// chip-select for the duration of each transfer.
struct spidev {
    using error_type = std::error_code;

    struct config {
        std::string path = "/dev/spidev0.0";
        std::uint32_t speed_hz = 1'000'000;
        std::uint8_t mode = 0; // CPOL=0, CPHA=0
        std::uint8_t bits_per_word = 8;
    };

    explicit spidev(config cfg);
    ~spidev();

    spidev(spidev &&other) noexcept;
    spidev &operator=(spidev &&other) noexcept;
    spidev(spidev const &) = delete;
    spidev &operator=(spidev const &) = delete;

    /// Opens the device node and applies mode, word size and clock.
    result<void, error_type> init();

    result<void, error_type> read(unsigned char *data, unsigned length);

    bool is_open() const noexcept {
        return fd_ >= 0;
    }

    config const &configuration() const noexcept {
        return cfg_;
    }

private:
    void close() noexcept;

    config cfg_;
    int fd_ = -1;
};

}
