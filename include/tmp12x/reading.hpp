#pragma once

namespace tmp12x {

/// LED drive current band reported by the FTX 101 in bits D1 and D0.
enum class led_current_level : unsigned char {
    under_500,
    range_500_to_1000,
    range_1000_to_2000,
    over_2000,
    unknown
};

const char *led_current_name(led_current_level level) noexcept;

struct reading {
    double temperature; // °C

    friend constexpr bool operator==(reading const &, reading const &) = default;
};

struct extended_reading {
    double temperature; // °C
    led_current_level led_current;

    friend constexpr bool operator==(extended_reading const &, extended_reading const &) = default;
};

}
