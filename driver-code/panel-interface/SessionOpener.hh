#pragma once

#include <chrono>
#include <memory>

#include <LibUsbCpp.hh>
#include <Session.hh>

namespace PanelDriver
{

// Establishes a fresh Session for one physical device.
class SessionOpener
{
	public:
		virtual ~SessionOpener() = default;
		virtual std::unique_ptr<Session> open() = 0;
};

class UsbSessionOpener : public SessionOpener
{
	public:
		UsbSessionOpener(std::shared_ptr<LibUsbCpp::Device> device, std::chrono::milliseconds io_timeout);

		// Opens and claims the HID and vendor interfaces, finds their
		// endpoints and reads the serial number. Topology surprises throw
		// InitializationError; libusb failures throw UsbException.
		std::unique_ptr<Session> open() override;

	private:
		std::shared_ptr<LibUsbCpp::Device> device;
		std::chrono::milliseconds timeout;

		// the serial number read that follows uses libusb's fixed one second
		static constexpr std::chrono::milliseconds LANGUAGE_TIMEOUT{5000};
};

}
