#pragma once

#include <tmp12x/decode.hpp>
#include <tmp12x/detail/result.hpp>
#include <tmp12x/error.hpp>
#include <tmp12x/log.hpp>
#include <tmp12x/profile.hpp>
#include <tmp12x/reading.hpp>

#include <utility>

namespace tmp12x {

/// Transport must provide:
/// - using error_type = ...;
/// - result<void, error_type> init();
/// - result<void, error_type> read(unsigned char *data, unsigned length);
///   a single exclusive transaction, bytes stored MSB first
///
/// The driver owns its transport and keeps no other state. It is not
/// safe to call from more than one thread without external locking.
template<typename Transport, typename Profile = default_profile, typename Log = null_log>
struct driver {
    using profile = Profile;
    using transport_error = typename Transport::error_type;
    using error_type = decode_error<transport_error>;

    explicit driver(Transport transport) : transport_(std::move(transport)) {}

    driver(driver &&) = default;
    driver &operator=(driver &&) = default;
    driver(driver const &) = delete;
    driver &operator=(driver const &) = delete;

    /// Runs Transport::init() before handing out a driver.
    static result<driver, error_type> create(Transport transport) {
        if (auto r = transport.init(); not r) {
            Log::warn("transport initialization failed");
            return make_error(error_type::from_transport(r.error()));
        }
        Log::debug("driver ready");
        return driver{std::move(transport)};
    }

    /// Temperature in °C. With the extended profile the word is checked
    /// exactly like get_extended_reading() and the LED current is dropped.
    result<reading, error_type> get_reading() {
        auto raw = read_word();
        if (not raw) {
            return make_error(raw.error());
        }

        if constexpr (Profile::has_diagnostics) {
            auto decoded = classify(raw.value());
            if (not decoded) {
                return make_error(decoded.error());
            }
            return reading{decoded->temperature};
        } else {
            return decode_standard(raw.value());
        }
    }

    result<extended_reading, error_type> get_extended_reading() {
        static_assert(Profile::has_diagnostics,
                      "get_extended_reading() requires a profile with diagnostic bits");
        auto raw = read_word();
        if (not raw) {
            return make_error(raw.error());
        }
        return classify(raw.value());
    }

    Transport &transport() noexcept {
        return transport_;
    }

private:
    result<raw_word, error_type> read_word() {
        unsigned char data[2] = {0, 0};
        if (auto r = transport_.read(data, sizeof(data)); not r) {
            Log::warn("spi transaction failed");
            return make_error(error_type::from_transport(r.error()));
        }
        return to_raw_word(data);
    }

    static result<extended_reading, error_type> classify(raw_word raw) {
        auto decoded = decode_extended(raw);
        if (not decoded) {
            // no probe and an unsettled sample are normal operating states
            if (decoded.error() == error_kind::device_error) {
                Log::warn(error_name(decoded.error()));
            } else {
                Log::debug(error_name(decoded.error()));
            }
            return make_error(error_type{decoded.error()});
        }
        return decoded.value();
    }

    Transport transport_;
};

}
