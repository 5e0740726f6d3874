#include <optional>
#include <sstream>

#include <SessionOpener.hh>
#include <logging.hh>

namespace PanelDriver {

namespace {

const libusb_interface_descriptor* find_interface(
	const libusb_config_descriptor* config, uint8_t class_code, const char* what)
{
	const libusb_interface_descriptor* found = nullptr;
	int matches = 0;
	for (int i = 0; i < config->bNumInterfaces; ++i) {
		const auto& intf = config->interface[i];
		if (intf.num_altsetting < 1) continue;
		// only the default alternate setting matters
		const auto* alt = &intf.altsetting[0];
		if (alt->bInterfaceClass == class_code) {
			found = alt;
			++matches;
		}
	}
	if (matches != 1) {
		std::stringstream ss;
		ss << "expected exactly one " << what << " interface, found " << matches;
		throw InitializationError{ss.str()};
	}
	return found;
}

struct InterfaceEndpoints {
	std::optional<uint8_t> in;
	bool in_is_interrupt = false;
	std::optional<uint8_t> out;
};

InterfaceEndpoints collect_endpoints(const libusb_interface_descriptor* intf, const char* what)
{
	InterfaceEndpoints eps;
	for (int i = 0; i < intf->bNumEndpoints; ++i) {
		const auto& ep = intf->endpoint[i];
		bool is_in = (ep.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN;
		auto& slot = is_in ? eps.in : eps.out;
		if (slot) {
			std::stringstream ss;
			ss << "found multiple " << (is_in ? "IN" : "OUT")
			   << " endpoints on the " << what << " interface";
			throw InitializationError{ss.str()};
		}
		slot = ep.bEndpointAddress;
		if (is_in) {
			eps.in_is_interrupt =
				(ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) == LIBUSB_TRANSFER_TYPE_INTERRUPT;
		}
	}
	return eps;
}

}

UsbSessionOpener::UsbSessionOpener(
	std::shared_ptr<LibUsbCpp::Device> device_,
	std::chrono::milliseconds io_timeout) :
		device(std::move(device_)),
		timeout(io_timeout)
{ }

std::unique_ptr<Session> UsbSessionOpener::open()
{
	auto handle = std::make_unique<LibUsbCpp::DeviceHandle>(device->device, device->context());
	auto desc = device->descriptor();

	LibUsbCpp::ConfigDescriptor config{device->device};
	const auto* hid_intf = find_interface(config.config, LIBUSB_CLASS_HID, "HID");
	const auto* vendor_intf = find_interface(config.config, LIBUSB_CLASS_VENDOR_SPEC, "vendor");

	for (const auto* intf : {hid_intf, vendor_intf}) {
		handle->detach_kernel_driver(intf->bInterfaceNumber);
		if (!handle->claim_interface(intf->bInterfaceNumber)) {
			throw InitializationError{
				"interface " + std::to_string(intf->bInterfaceNumber) + " is claimed elsewhere"};
		}
	}

	auto hid_eps = collect_endpoints(hid_intf, "HID");
	auto vendor_eps = collect_endpoints(vendor_intf, "vendor");
	if (!hid_eps.in) {
		throw InitializationError{"could not find HID endpoint"};
	}
	if (!vendor_eps.in) {
		throw InitializationError{"could not find vendor IN endpoint"};
	}
	if (!vendor_eps.out) {
		throw InitializationError{"could not find vendor OUT endpoint"};
	}

	auto lang = handle->first_language(LANGUAGE_TIMEOUT);
	auto serial = handle->read_string_descriptor(desc.iSerialNumber, lang);

	EndpointAddresses endpoints{
		.hid_in = *hid_eps.in,
		.hid_in_is_interrupt = hid_eps.in_is_interrupt,
		.bulk_in = *vendor_eps.in,
		.bulk_out = *vendor_eps.out,
	};

	std::stringstream ss;
	ss << "panel initialized (serial number: " << serial
	   << ", type: " << PANEL_DEVICE_TYPE.to_string() << ")";
	log_info(ss.str());

	auto transport = std::make_unique<LibUsbTransport>(std::move(handle), endpoints);
	return std::make_unique<Session>(std::move(transport), serial, PANEL_DEVICE_TYPE, timeout);
}

}
