#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <PanelConfig.hh>

namespace PanelDriver {

namespace {

// Get an unsigned number (decimal or 0x hex) from an environment variable
template<typename T>
bool number_env(const char* envar_name, T& out) {
    const char* raw = std::getenv(envar_name);
    if (raw == nullptr || *raw == '\0') {
        return false;
    }

    size_t used = 0;
    unsigned long long value;
    try {
        value = std::stoull(raw, &used, 0);
    }
    catch (const std::logic_error&) {
        throw std::invalid_argument{std::string{envar_name} + " is not a number: " + raw};
    }
    if (used != std::char_traits<char>::length(raw)
        || value > std::numeric_limits<T>::max()) {
        throw std::invalid_argument{std::string{envar_name} + " is out of range: " + raw};
    }
    out = static_cast<T>(value);
    return true;
}

bool millis_env(const char* envar_name, std::chrono::milliseconds& out) {
    uint32_t ms;
    if (!number_env(envar_name, ms)) return false;
    out = std::chrono::milliseconds{ms};
    return true;
}

}

PanelConfig PanelConfig::from_environment() {
    PanelConfig cfg;
    number_env("PANEL_USB_VID", cfg.vendor_id);
    number_env("PANEL_USB_PID", cfg.product_id);
    millis_env("PANEL_IO_TIMEOUT_MS", cfg.io_timeout);
    millis_env("PANEL_ACCESS_RETRY_MS", cfg.access_retry_delay);

    uint8_t hotplug;
    if (number_env("PANEL_HOTPLUG", hotplug)) {
        cfg.use_hotplug = hotplug != 0;
    }

    uint8_t debug;
    if (number_env("PANEL_LIBUSB_DEBUG", debug)) {
        cfg.libusb_debug = debug;
    }

    if (const char* level = std::getenv("PANEL_LOG_LEVEL"); level && *level) {
        cfg.log_level = log_level_from_string(level);
    }
    return cfg;
}

}
