#include <tmp12x/device/linux/spidev.hpp>
#include <tmp12x/log.hpp>
#include <tmp12x/profile.hpp>
#include <tmp12x/driver.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

using spidev = tmp12x::dev::linux_host::spidev;
using sensor_t = tmp12x::driver<spidev, tmp12x::default_profile, tmp12x::stdio_log>;

namespace {

// FTX 101 needs some time after power up until the CFM bit goes high
constexpr auto retry_delay = std::chrono::milliseconds(250);
constexpr auto sample_period = std::chrono::seconds(1);

void print_error(sensor_t::error_type const &err) {
    if (err.is_transport_failure()) {
        std::fprintf(stderr, "read failed: %s\n", err.transport->message().c_str());
    } else {
        std::fprintf(stderr, "read failed: %s\n", tmp12x::error_name(err.kind));
    }
}

template<typename Sensor>
void sample(Sensor &sensor) {
    if constexpr (Sensor::profile::has_diagnostics) {
        auto r = sensor.get_extended_reading();
        if (r) {
            std::printf("%.4f °C, LED current %s\n", r->temperature,
                        tmp12x::led_current_name(r->led_current));
            return;
        }
        print_error(r.error());
        if (r.error().kind == tmp12x::error_kind::invalid_measurement) {
            std::this_thread::sleep_for(retry_delay);
        }
    } else {
        auto r = sensor.get_reading();
        if (r) {
            std::printf("%.4f °C\n", r->temperature);
            return;
        }
        print_error(r.error());
    }
}

}

int main(int argc, char *argv[]) {
    spidev::config cfg;
    if (argc > 1) {
        cfg.path = argv[1];
    }
    if (argc > 2) {
        cfg.speed_hz = static_cast<std::uint32_t>(std::strtoul(argv[2], nullptr, 10));
    }
    int samples = argc > 3 ? std::atoi(argv[3]) : 10;

    auto sensor = sensor_t::create(spidev{cfg});
    if (not sensor) {
        std::fprintf(stderr, "cannot open %s: %s\n", cfg.path.c_str(),
                     sensor.error().transport->message().c_str());
        return EXIT_FAILURE;
    }

    for (int i = 0; i < samples; i++) {
        sample(sensor.value());
        std::this_thread::sleep_for(sample_period);
    }
    return EXIT_SUCCESS;
}
