#pragma once

#include <tmp12x/detail/result.hpp>
#include <tmp12x/error.hpp>
#include <tmp12x/reading.hpp>

#include <cstdint>

namespace tmp12x {

using raw_word = std::uint16_t;

struct word_layout {
    static constexpr unsigned field_shift = 3;

    static constexpr raw_word cfm_mask = 0x0004;
    static constexpr raw_word led_current_mask = 0x0003;

    // reserved words the FTX 101 sends instead of a measurement
    static constexpr raw_word no_probe_word = 0x0000;
    static constexpr raw_word device_error_word = 0x7FF8; // reads as 255°C

    static constexpr double resolution = 0.0625; // °C per LSB
};

constexpr raw_word to_raw_word(unsigned char const (&data)[2]) noexcept {
    return static_cast<raw_word>(data[0] << 8 | data[1]);
}

/// Sign-extended 13 bit temperature field in 1/16 °C.
constexpr std::int16_t temperature_field(raw_word raw) noexcept {
    // bit 15 is the sign bit of the field, an arithmetic shift
    // drops the status bits and sign-extends in one go
    return static_cast<std::int16_t>(static_cast<std::int16_t>(raw) >> word_layout::field_shift);
}

constexpr double decode_temperature(raw_word raw) noexcept {
    return temperature_field(raw) * word_layout::resolution;
}

constexpr led_current_level classify_led_current(unsigned code) noexcept {
    switch (code) {
        case 0b00:
            return led_current_level::under_500;
        case 0b01:
            return led_current_level::range_500_to_1000;
        case 0b10:
            return led_current_level::range_1000_to_2000;
        case 0b11:
            return led_current_level::over_2000;
        default:
            return led_current_level::unknown;
    }
}

constexpr bool is_no_probe(raw_word raw) noexcept {
    return raw == word_layout::no_probe_word;
}

/// Matches the fault code on the temperature field alone, the status bits
/// do not matter.
constexpr bool is_device_error(raw_word raw) noexcept {
    return temperature_field(raw) == temperature_field(word_layout::device_error_word);
}

constexpr bool is_confirmed(raw_word raw) noexcept {
    return raw & word_layout::cfm_mask;
}

/// TMP121/TMP123 decode. Bits D2..D0 are ignored.
constexpr reading decode_standard(raw_word raw) noexcept {
    return {decode_temperature(raw)};
}

/// FTX 101 decode. Sentinel words win over the CFM bit.
constexpr result<extended_reading, error_kind> decode_extended(raw_word raw) noexcept {
    if (is_no_probe(raw)) {
        return make_error(error_kind::no_probe);
    }
    if (is_device_error(raw)) {
        return make_error(error_kind::device_error);
    }
    if (not is_confirmed(raw)) {
        return make_error(error_kind::invalid_measurement);
    }
    return extended_reading{decode_temperature(raw),
                            classify_led_current(raw & word_layout::led_current_mask)};
}

}
