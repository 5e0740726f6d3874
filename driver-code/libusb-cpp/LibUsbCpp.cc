#include <array>
#include <sstream>

#include "LibUsbCpp.hh"

namespace LibUsbCpp {

Context::Context(int libusb_log_level) {
    log_debug("Constructing LibUsb::Context");
    int ret = libusb_init(&handle);
    if (ret < 0) {
        std::stringstream error_message;
        error_message << "Failed to initialize USB context: " << libusb_strerror(ret);
        throw UsbException(error_message.str(), ret);
    }

    ret = libusb_set_option(handle, LIBUSB_OPTION_LOG_LEVEL, libusb_log_level);
    if (ret < 0) {
        std::stringstream ss;
        ss << "Error setting log level: " << libusb_strerror(ret);
        libusb_exit(handle);
        throw UsbException(ss.str(), ret);
    }
}
Context::~Context() {
    log_debug("Destructing LibUsb::Context");
    if (handle) {
        libusb_exit(handle);
    }
}

DeviceList::DeviceList(std::shared_ptr<Context> ctx_)
    : ctx(ctx_) {
    num_devices = libusb_get_device_list(ctx->handle, &devices);
    if (num_devices < 0) {
        std::stringstream ss;
        ss << "Error getting device list: " << libusb_strerror(num_devices);
        throw UsbException(ss.str(), static_cast<int>(num_devices));
    }
}
DeviceList::~DeviceList() {
    if (devices) {
        libusb_free_device_list(devices, 1);
    }
}

Device::Device(libusb_device *device_, std::shared_ptr<Context> ctx_)
  : device(libusb_ref_device(device_))
  , ctx(ctx_)
{ }

Device::~Device() {
    if (device) {
        libusb_unref_device(device);
    }
}

libusb_device_descriptor Device::descriptor() const {
    libusb_device_descriptor desc;
    int ret = libusb_get_device_descriptor(device, &desc);
    if (ret < 0) {
        std::stringstream ss;
        ss << "Error getting device descriptor: " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
    return desc;
}

uint8_t Device::bus_number() const {
    return libusb_get_bus_number(device);
}

uint8_t Device::address() const {
    return libusb_get_device_address(device);
}

ConfigDescriptor::ConfigDescriptor(libusb_device *device) {
    int ret = libusb_get_active_config_descriptor(device, &config);
    if (ret < 0) {
        std::stringstream ss;
        ss << "Error getting active config descriptor: " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
}

ConfigDescriptor::~ConfigDescriptor() {
    if (config) {
        libusb_free_config_descriptor(config);
    }
}

DeviceHandle::DeviceHandle(libusb_device *device, std::shared_ptr<Context> ctx_)
  : ctx(ctx_) {
    log_debug("Constructing LibUsb::DeviceHandle");
    int ret = libusb_open(device, &handle);
    if (ret < 0) {
        std::stringstream ss;
        ss << "Failed to open device: " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
}

DeviceHandle::~DeviceHandle() {
    log_debug("Destructing LibUsb::DeviceHandle");
    if (handle) {
        for (auto interface : claimed_interfaces) {
            libusb_release_interface(handle, interface);
        }
        libusb_close(handle);
    }
}

bool DeviceHandle::claim_interface(int interface) {
    int ret = libusb_claim_interface(handle, interface);
    if (ret == LIBUSB_ERROR_BUSY) {
        log_debug("device busy; it's claimed elsewhere");
        return false;
    }
    else if (ret < 0) {
        std::stringstream ss;
        ss << "couldn't claim interface " << interface << ": " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
    claimed_interfaces.push_back(interface);
    return true;
}

void DeviceHandle::detach_kernel_driver(int interface) {
    int ret = libusb_kernel_driver_active(handle, interface);
    if (ret != 1) {
        // no driver bound, or the platform can't tell us
        return;
    }
    ret = libusb_detach_kernel_driver(handle, interface);
    if (ret < 0) {
        std::stringstream ss;
        ss << "couldn't detach kernel driver from interface "
           << interface << ": " << libusb_strerror(ret);
        log_debug(ss.str());
    }
}

uint16_t DeviceHandle::first_language(std::chrono::milliseconds timeout) {
    // descriptor zero holds the supported LANGIDs
    std::array<unsigned char, 255> buf{};
    int ret = libusb_control_transfer(
        handle,
        LIBUSB_ENDPOINT_IN,
        LIBUSB_REQUEST_GET_DESCRIPTOR,
        static_cast<uint16_t>(LIBUSB_DT_STRING << 8),
        0,
        buf.data(),
        static_cast<uint16_t>(buf.size()),
        static_cast<unsigned int>(timeout.count()));
    if (ret < 0) {
        std::stringstream ss;
        ss << "couldn't read supported languages: " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
    if (ret < 4 || buf[1] != LIBUSB_DT_STRING) {
        throw UsbException{"device reports no string descriptor languages"};
    }
    return static_cast<uint16_t>(buf[2] | (buf[3] << 8));
}

std::string DeviceHandle::read_string_descriptor(uint8_t index, uint16_t language) {
    if (index == 0) {
        throw UsbException{"device has no such string descriptor"};
    }

    std::array<unsigned char, 255> buf{};
    int ret = libusb_get_string_descriptor(
        handle, index, language, buf.data(), static_cast<int>(buf.size()));
    if (ret < 0) {
        std::stringstream ss;
        ss << "couldn't read string descriptor " << +index << ": " << libusb_strerror(ret);
        throw UsbException(ss.str(), ret);
    }
    return ascii_from_string_descriptor(std::span<const unsigned char>{buf.data(), static_cast<size_t>(ret)});
}

std::string ascii_from_string_descriptor(std::span<const unsigned char> desc) {
    if (desc.size() < 2 || desc[1] != LIBUSB_DT_STRING || desc[0] > desc.size() || desc[0] < 2) {
        throw UsbException{"malformed string descriptor"};
    }

    // UTF-16LE payload; serial numbers are plain ASCII in practice
    std::string out;
    for (size_t i = 2; i + 1 < desc[0]; i += 2) {
        uint16_t unit = static_cast<uint16_t>(desc[i] | (desc[i + 1] << 8));
        out.push_back(unit < 0x80 ? static_cast<char>(unit) : '?');
    }
    return out;
}

} // namespace LibUsbCpp
