#pragma once

#include <chrono>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <libusb-1.0/libusb.h>

#include "logging.hh"

namespace LibUsbCpp {

class UsbException : public std::runtime_error {
public:
    explicit UsbException(const std::string& what, int libusb_code = 0) :
        std::runtime_error(what),
        code_(libusb_code)
    { }

    // libusb_error value, or 0 when the failure didn't come from libusb
    int code() const { return code_; }
private:
    int code_;
};

// RAII wrapper classes around libusb pointers

struct Context {
    libusb_context *handle = nullptr;

    explicit Context(int libusb_log_level = LIBUSB_LOG_LEVEL_WARNING);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
};

struct DeviceList {
    ssize_t num_devices = 0;
    libusb_device** devices = nullptr;

    DeviceList(std::shared_ptr<Context> ctx);
    ~DeviceList();

    DeviceList(const DeviceList&) = delete;
    DeviceList& operator=(const DeviceList&) = delete;
private:
    std::shared_ptr<Context> ctx;
};

// Holds a reference on a libusb_device so it can outlive the list it came from.
struct Device {
    libusb_device *device = nullptr;

    Device(libusb_device *device, std::shared_ptr<Context> ctx);
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    libusb_device_descriptor descriptor() const;
    uint8_t bus_number() const;
    uint8_t address() const;
    std::shared_ptr<Context> context() const { return ctx; }
private:
    std::shared_ptr<Context> ctx;
};

struct ConfigDescriptor {
    libusb_config_descriptor *config = nullptr;

    // active configuration of the device
    explicit ConfigDescriptor(libusb_device *device);
    ~ConfigDescriptor();

    ConfigDescriptor(const ConfigDescriptor&) = delete;
    ConfigDescriptor& operator=(const ConfigDescriptor&) = delete;
};

struct DeviceHandle {
    libusb_device_handle *handle = nullptr;

    DeviceHandle(libusb_device *device, std::shared_ptr<Context> ctx);
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    bool claim_interface(int interface);

    // Best effort: a failure here is logged and otherwise ignored.
    void detach_kernel_driver(int interface);

    // First language the device lists in string descriptor zero.
    uint16_t first_language(std::chrono::milliseconds timeout);
    // libusb waits up to one second for this one
    std::string read_string_descriptor(uint8_t index, uint16_t language);

private:
    std::vector<int> claimed_interfaces;
    std::shared_ptr<Context> ctx;
};

// Raw STRING descriptor to ASCII; anything outside ASCII becomes '?'.
std::string ascii_from_string_descriptor(std::span<const unsigned char> desc);

} // namespace LibUsbCpp
