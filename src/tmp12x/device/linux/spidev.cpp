#include <tmp12x/device/linux/spidev.hpp>

#include <linux/spi/spidev.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tmp12x::dev::linux_host {

namespace {

std::error_code last_error() {
    return {errno, std::system_category()};
}

}

spidev::spidev(config cfg) : cfg_(std::move(cfg)) {}

spidev::~spidev() {
    close();
}

spidev::spidev(spidev &&other) noexcept
    : cfg_(std::move(other.cfg_)), fd_(std::exchange(other.fd_, -1)) {}

spidev &spidev::operator=(spidev &&other) noexcept {
    if (this != &other) {
        close();
        cfg_ = std::move(other.cfg_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void spidev::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

result<void, spidev::error_type> spidev::init() {
    close();

    int fd = ::open(cfg_.path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return make_error(last_error());
    }

    std::uint8_t mode = cfg_.mode;
    std::uint8_t bits = cfg_.bits_per_word;
    std::uint32_t speed = cfg_.speed_hz;
    if (::ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
        ::ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
        ::ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        auto ec = last_error();
        ::close(fd);
        return make_error(ec);
    }

    fd_ = fd;
    return {};
}

result<void, spidev::error_type> spidev::read(unsigned char *data, unsigned length) {
    if (fd_ < 0) {
        return make_error(std::make_error_code(std::errc::bad_file_descriptor));
    }
    if (length == 0) {
        return {};
    }

    spi_ioc_transfer transfer;
    std::memset(&transfer, 0, sizeof(transfer));
    transfer.rx_buf = reinterpret_cast<std::uintptr_t>(data);
    transfer.len = length;
    transfer.speed_hz = cfg_.speed_hz;
    transfer.bits_per_word = cfg_.bits_per_word;

    // the ioctl returns the number of bytes transferred
    int ret = ::ioctl(fd_, SPI_IOC_MESSAGE(1), &transfer);
    if (ret < 0) {
        return make_error(last_error());
    }
    if (static_cast<unsigned>(ret) != length) {
        return make_error(std::make_error_code(std::errc::io_error));
    }
    return {};
}

}
