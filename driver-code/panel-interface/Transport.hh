#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>

#include <LibUsbCpp.hh>
#include <common.hh>

namespace PanelDriver
{

/*
 * The three transfers the panel protocol needs. No framing, no retries.
 * Each call blocks up to `timeout` and throws TransportError on failure.
 */
class Transport
{
	public:
		virtual ~Transport() = default;

		// button report from the HID interface
		virtual size_t read_report(std::span<uint8_t> buf, std::chrono::milliseconds timeout) = 0;
		// vendor interface, IN endpoint
		virtual size_t read_bulk(std::span<uint8_t> buf, std::chrono::milliseconds timeout) = 0;
		// vendor interface, OUT endpoint
		virtual size_t write_bulk(std::span<const uint8_t> buf, std::chrono::milliseconds timeout) = 0;
};

struct EndpointAddresses
{
	uint8_t hid_in;
	bool hid_in_is_interrupt;
	uint8_t bulk_in;
	uint8_t bulk_out;
};

class LibUsbTransport : public Transport
{
	public:
		LibUsbTransport(std::unique_ptr<LibUsbCpp::DeviceHandle> handle, EndpointAddresses endpoints);

		size_t read_report(std::span<uint8_t> buf, std::chrono::milliseconds timeout) override;
		size_t read_bulk(std::span<uint8_t> buf, std::chrono::milliseconds timeout) override;
		size_t write_bulk(std::span<const uint8_t> buf, std::chrono::milliseconds timeout) override;

	private:
		std::unique_ptr<LibUsbCpp::DeviceHandle> device_handle;
		EndpointAddresses endpoints;
};

}
