#pragma once

#include <tmp12x/detail/autoselect.hpp>
#include <tmp12x/detail/result.hpp>

namespace tmp12x {

/// Transport built from two static layers.
///
/// ChipSelect must support:
/// - init()
/// - select()
/// - deselect()
///
/// Bus must support:
/// - using error_type = ...;
/// - result<void, error_type> init();
/// - result<void, error_type> receive(unsigned char *data, unsigned length);
///
/// The chip is selected for exactly one receive, also when it fails.
template<typename ChipSelect, typename Bus>
struct spi_transport : Bus {
    using error_type = typename Bus::error_type;

    static result<void, error_type> init() {
        ChipSelect::init();
        return Bus::init();
    }

    static result<void, error_type> read(unsigned char *data, unsigned length) {
        autoselect<ChipSelect> as;
        return Bus::receive(data, length);
    }
};

}
