#pragma once

#include <tmp12x/detail/result.hpp>

#include <optional>

namespace tmp12x {

enum class error_kind : unsigned char {
    transport_failure,
    no_probe,            // raw word 0x0000, excitation disabled by the device
    device_error,        // 255°C fault code, damaged probe or weak signal
    invalid_measurement  // CFM bit low, sample not settled yet
};

const char *error_name(error_kind kind) noexcept;

/// Classified read failure. `transport` holds the transport's error
/// verbatim and is engaged only for error_kind::transport_failure.
template<typename TransportError>
struct decode_error {
    error_kind kind;
    std::optional<TransportError> transport{};

    static constexpr decode_error from_transport(TransportError const &e) {
        return {error_kind::transport_failure, e};
    }

    constexpr bool is_transport_failure() const noexcept {
        return kind == error_kind::transport_failure;
    }
};

template<typename T, typename TransportError>
using read_result = result<T, decode_error<TransportError>>;

}
