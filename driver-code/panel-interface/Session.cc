#include <sstream>
#include <stdexcept>

#include <Session.hh>
#include <logging.hh>

namespace PanelDriver {

Session::Session(
	std::unique_ptr<Transport> transport_,
	std::string serial_number,
	DeviceTypeId type_id,
	std::chrono::milliseconds io_timeout) :
		transport(std::move(transport_)),
		serial(std::move(serial_number)),
		device_type(type_id),
		timeout(io_timeout)
{
	if (!transport) {
		throw std::invalid_argument{"session needs a transport"};
	}
}

Session::Response Session::transact(
	const Packets::ControlPacket& request,
	std::span<const uint8_t> payload)
{
	std::lock_guard<std::mutex> lock(transaction_mutex);
	send(request, payload);
	return receive();
}

size_t Session::read_report(std::span<uint8_t> buf)
{
	return transport->read_report(buf, timeout);
}

void Session::send(const Packets::ControlPacket& p, std::span<const uint8_t> payload)
{
	if (payload.size() != p.data_size()) {
		std::stringstream ss;
		ss << "payload is " << payload.size()
		   << " bytes but packet declares " << p.data_size();
		throw std::invalid_argument{ss.str()};
	}

	log_debug("panel " + serial + " <- " + p.to_string());
	const auto wire = p.encode();
	size_t written = transport->write_bulk(wire, timeout);
	if (written != wire.size()) {
		std::stringstream ss;
		ss << "short write of control packet to " << serial
		   << ": " << written << " of " << wire.size();
		throw TransportError{TransportError::Kind::other, LIBUSB_ERROR_IO, ss.str()};
	}

	if (payload.empty()) {
		return;
	}

	log_debug("panel " + serial + " <- " + std::to_string(payload.size()) + " payload bytes");
	written = transport->write_bulk(payload, timeout);
	if (written != payload.size()) {
		std::stringstream ss;
		ss << "short write of payload to " << serial
		   << ": " << written << " of " << payload.size();
		throw TransportError{TransportError::Kind::other, LIBUSB_ERROR_IO, ss.str()};
	}
}

Session::Response Session::receive()
{
	Packets::ControlPacket::wire_t wire{};
	size_t got = transport->read_bulk(wire, timeout);
	if (got != wire.size()) {
		std::stringstream ss;
		ss << "short control packet from " << serial
		   << ": " << got << " of " << wire.size() << " bytes";
		throw ProtocolViolation{ss.str()};
	}

	auto packet = Packets::ControlPacket::decode(wire);
	log_debug("panel " + serial + " -> " + packet.to_string());

	const size_t data_size = packet.data_size();
	if (data_size == 0) {
		return Response{packet, std::nullopt};
	}
	if (data_size >= MAX_PAYLOAD_SZ) {
		std::stringstream ss;
		ss << "panel " << serial << " announced a " << data_size
		   << " byte payload; stream is out of sync";
		throw ProtocolViolation{ss.str()};
	}

	std::vector<uint8_t> data(data_size);
	got = transport->read_bulk(data, timeout);
	if (got != data_size) {
		std::stringstream ss;
		ss << "short payload from " << serial
		   << ": " << got << " of " << data_size << " bytes";
		throw ProtocolViolation{ss.str()};
	}
	return Response{packet, std::move(data)};
}

}
