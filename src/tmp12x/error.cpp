#include <tmp12x/error.hpp>
#include <tmp12x/reading.hpp>

namespace tmp12x {

const char *error_name(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::transport_failure:
        return "transport failure";
    case error_kind::no_probe:
        return "no probe";
    case error_kind::device_error:
        return "device error";
    case error_kind::invalid_measurement:
        return "invalid measurement";
    }
    return "unknown error";
}

const char *led_current_name(led_current_level level) noexcept {
    switch (level) {
    case led_current_level::under_500:
        return "< 500";
    case led_current_level::range_500_to_1000:
        return "500..1000";
    case led_current_level::range_1000_to_2000:
        return "1000..2000";
    case led_current_level::over_2000:
        return ">= 2000";
    case led_current_level::unknown:
        break;
    }
    return "unknown";
}

}
