#include <sstream>

#include <Transport.hh>

namespace PanelDriver {

LibUsbTransport::LibUsbTransport(
	std::unique_ptr<LibUsbCpp::DeviceHandle> handle,
	EndpointAddresses endpoints_) :
		device_handle(std::move(handle)),
		endpoints(endpoints_)
{ }

size_t LibUsbTransport::read_report(std::span<uint8_t> buf, std::chrono::milliseconds timeout)
{
	int transferred{0};
	int rc;
	if (endpoints.hid_in_is_interrupt) {
		rc = libusb_interrupt_transfer(
			device_handle->handle,
			endpoints.hid_in,
			buf.data(),
			static_cast<int>(buf.size()),
			&transferred,
			static_cast<unsigned int>(timeout.count())
		);
	}
	else {
		rc = libusb_bulk_transfer(
			device_handle->handle,
			endpoints.hid_in,
			buf.data(),
			static_cast<int>(buf.size()),
			&transferred,
			static_cast<unsigned int>(timeout.count())
		);
	}

	if (rc != 0) {
		throw TransportError::from_libusb(rc, "error reading panel report");
	}
	return static_cast<size_t>(transferred);
}

size_t LibUsbTransport::read_bulk(std::span<uint8_t> buf, std::chrono::milliseconds timeout)
{
	int transferred{0};
	int rc = libusb_bulk_transfer(
		device_handle->handle,
		endpoints.bulk_in,
		buf.data(),
		static_cast<int>(buf.size()),
		&transferred,
		static_cast<unsigned int>(timeout.count())
	);
	if (rc != 0) {
		throw TransportError::from_libusb(rc, "error reading from panel");
	}
	return static_cast<size_t>(transferred);
}

size_t LibUsbTransport::write_bulk(std::span<const uint8_t> buf, std::chrono::milliseconds timeout)
{
	int transferred{0};
	// libusb wants a mutable pointer even for OUT transfers; it doesn't write to it
	int rc = libusb_bulk_transfer(
		device_handle->handle,
		endpoints.bulk_out,
		const_cast<uint8_t*>(buf.data()),
		static_cast<int>(buf.size()),
		&transferred,
		static_cast<unsigned int>(timeout.count())
	);
	if (rc != 0) {
		throw TransportError::from_libusb(rc, "error writing to panel");
	}
	return static_cast<size_t>(transferred);
}

}
