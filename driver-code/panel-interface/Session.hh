#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <Transport.hh>
#include <common.hh>
#include <packets/ControlPacket.hh>

namespace PanelDriver
{

/*
 * One live, claimed connection to one panel.
 *
 * The protocol is half-duplex with no request ids, so `transact` holds
 * a lock across the write and the matching read. Nothing else keeps a
 * response attached to the request that caused it.
 */
class Session
{
	public:
		// a payload this large means we've lost sync with the device
		static constexpr size_t MAX_PAYLOAD_SZ = 512 * 1024;
		static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

		struct Response
		{
			Packets::ControlPacket packet;
			std::optional<std::vector<uint8_t>> payload;
		};

		Session(
			std::unique_ptr<Transport> transport,
			std::string serial_number,
			DeviceTypeId type_id,
			std::chrono::milliseconds io_timeout = DEFAULT_TIMEOUT);

		Session(const Session&) = delete;
		Session& operator=(const Session&) = delete;

		Response transact(const Packets::ControlPacket& request, std::span<const uint8_t> payload = {});

		// HID reads don't touch the vendor interface, so they skip the lock
		size_t read_report(std::span<uint8_t> buf);

		const std::string& serial_number() const { return serial; }
		const DeviceTypeId& type_id() const { return device_type; }
		std::chrono::milliseconds io_timeout() const { return timeout; }

	private:
		// these should always be used as a pair. so they're private
		void send(const Packets::ControlPacket& p, std::span<const uint8_t> payload);
		Response receive();

		std::unique_ptr<Transport> transport;
		const std::string serial;
		const DeviceTypeId device_type;
		const std::chrono::milliseconds timeout;

		std::mutex transaction_mutex;
};

}
