#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include <libusb-1.0/libusb.h>

#include <DeviceRegistry.hh>
#include <LibUsbCpp.hh>
#include <PanelConfig.hh>
#include <SessionOpener.hh>

namespace PanelDriver {

// Feeds a DeviceRegistry with panels as they are found.
class DeviceMonitor {
public:
    virtual ~DeviceMonitor() = default;

    // attach every matching device not already known
    virtual void scan() = 0;
};

class UsbDeviceMonitor : public DeviceMonitor {
public:
    UsbDeviceMonitor(const PanelConfig& config, DeviceRegistry& registry);
    ~UsbDeviceMonitor();

    UsbDeviceMonitor(const UsbDeviceMonitor&) = delete;
    UsbDeviceMonitor& operator=(const UsbDeviceMonitor&) = delete;

    // no-op while hotplug enumeration is registered
    void scan() override;

private:
    PanelConfig config;
    DeviceRegistry& registry;
    std::shared_ptr<LibUsbCpp::Context> usb_ctx;

    libusb_hotplug_callback_handle hotplug_handle = 0;
    bool hotplug_registered = false;
    std::atomic<bool> running{false};
    std::thread event_thread;

    bool matches(const libusb_device_descriptor& desc) const;
    std::shared_ptr<SessionOpener> opener_for(libusb_device* dev);
    void arrived(libusb_device* dev);
    void left(libusb_device* dev);
    void handle_events();

    static int LIBUSB_CALL hotplug_callback(
        libusb_context* ctx,
        libusb_device* dev,
        libusb_hotplug_event event,
        void* user_data);
};

}
