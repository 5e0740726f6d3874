#include <sstream>

#include <SessionOpener.hh>
#include <UsbDeviceMonitor.hh>
#include <logging.hh>

namespace PanelDriver {

UsbDeviceMonitor::UsbDeviceMonitor(const PanelConfig& config_, DeviceRegistry& registry_) :
    config{config_},
    registry{registry_},
    usb_ctx{std::make_shared<LibUsbCpp::Context>(
        config_.libusb_debug ? LIBUSB_LOG_LEVEL_DEBUG : LIBUSB_LOG_LEVEL_WARNING)}
{
    if (!config.use_hotplug || !libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        log_info("hotplug unavailable; panels are found by scanning only");
        return;
    }

    // ENUMERATE makes libusb report devices that are already plugged in
    int ret = libusb_hotplug_register_callback(
        usb_ctx->handle,
        static_cast<libusb_hotplug_event>(
            LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
        LIBUSB_HOTPLUG_ENUMERATE,
        config.vendor_id,
        config.product_id,
        LIBUSB_HOTPLUG_MATCH_ANY,
        &UsbDeviceMonitor::hotplug_callback,
        this,
        &hotplug_handle);
    if (ret != LIBUSB_SUCCESS) {
        std::stringstream ss;
        ss << "couldn't register hotplug callback: " << libusb_strerror(ret);
        log_warning(ss.str());
        return;
    }
    hotplug_registered = true;

    running = true;
    event_thread = std::thread{[this] { handle_events(); }};
}

UsbDeviceMonitor::~UsbDeviceMonitor() {
    running = false;
    if (hotplug_registered) {
        // also wakes the event thread
        libusb_hotplug_deregister_callback(usb_ctx->handle, hotplug_handle);
    }
    if (event_thread.joinable()) {
        event_thread.join();
    }
}

void UsbDeviceMonitor::scan() {
    if (hotplug_registered) {
        // registered with ENUMERATE, so present devices were already reported
        log_debug("hotplug enumeration active; skipping scan");
        return;
    }

    LibUsbCpp::DeviceList device_list{usb_ctx};

    for (ssize_t i = 0; i < device_list.num_devices; ++i) {
        libusb_device* dev = device_list.devices[i];
        libusb_device_descriptor desc;

        int ret = libusb_get_device_descriptor(dev, &desc);
        if (ret < 0) {
            std::stringstream ss;
            ss << "Error getting device descriptor: " << libusb_strerror(ret);
            throw LibUsbCpp::UsbException(ss.str(), ret);
        }

        if (!matches(desc)) continue;
        auto address = make_address(libusb_get_bus_number(dev), libusb_get_device_address(dev));
        if (registry.contains(address)) continue;
        registry.attach_if_absent(address, opener_for(dev));
    }
}

bool UsbDeviceMonitor::matches(const libusb_device_descriptor& desc) const {
    return desc.idVendor == config.vendor_id && desc.idProduct == config.product_id;
}

std::shared_ptr<SessionOpener> UsbDeviceMonitor::opener_for(libusb_device* dev) {
    auto device = std::make_shared<LibUsbCpp::Device>(dev, usb_ctx);
    return std::make_shared<UsbSessionOpener>(device, config.io_timeout);
}

void UsbDeviceMonitor::arrived(libusb_device* dev) {
    auto address = make_address(libusb_get_bus_number(dev), libusb_get_device_address(dev));
    registry.attach(address, opener_for(dev));
}

void UsbDeviceMonitor::left(libusb_device* dev) {
    registry.detach(make_address(libusb_get_bus_number(dev), libusb_get_device_address(dev)));
}

void UsbDeviceMonitor::handle_events() {
    while (running) {
        timeval tv{0, 200000};
        int ret = libusb_handle_events_timeout_completed(usb_ctx->handle, &tv, nullptr);
        if (ret < 0 && ret != LIBUSB_ERROR_INTERRUPTED) {
            log_error(std::string{"libusb event handling failed: "} + libusb_strerror(ret));
        }
    }
}

int LIBUSB_CALL UsbDeviceMonitor::hotplug_callback(
    libusb_context*,
    libusb_device* dev,
    libusb_hotplug_event event,
    void* user_data)
{
    auto* self = static_cast<UsbDeviceMonitor*>(user_data);
    // exceptions must not unwind through libusb
    try {
        if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
            self->arrived(dev);
        }
        else if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT) {
            self->left(dev);
        }
    }
    catch (const std::exception& e) {
        log_error(std::string{"panel hotplug handling failed: "} + e.what());
    }
    // keep the callback registered
    return 0;
}

}
