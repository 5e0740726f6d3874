#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <logging.hh>

namespace PanelDriver {

// Everything tunable, read from the environment like the rest of our services.
struct PanelConfig {
    uint16_t vendor_id = 0x06a3;
    uint16_t product_id = 0xa2ae;
    std::chrono::milliseconds io_timeout{5000};
    std::chrono::milliseconds access_retry_delay{1000};
    bool use_hotplug = true;
    int libusb_debug = 0;
    LogLevel log_level = LogLevel::info;

    // unset variables keep their defaults; malformed ones throw std::invalid_argument
    static PanelConfig from_environment();
};

}
