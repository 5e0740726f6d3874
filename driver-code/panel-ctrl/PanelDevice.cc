#include <iterator>
#include <sstream>
#include <vector>

#include <PanelDevice.hh>
#include <logging.hh>

namespace PanelDriver
{

namespace pk = Packets;

const char* lifecycle_state_name(LifecycleState s) {
    switch (s) {
        case LifecycleState::connecting: return "connecting";
        case LifecycleState::probing_mode: return "probing_mode";
        case LifecycleState::active: return "active";
        case LifecycleState::invalidated: return "invalidated";
        case LifecycleState::factory_mode: return "factory_mode";
        case LifecycleState::failed: return "failed";
    }
    return "?";
}

const char* outcome_name(RequestStatus::Outcome o) {
    using oc = RequestStatus::Outcome;
    switch (o) {
        case oc::ok: return "ok";
        case oc::rejected: return "rejected";
        case oc::not_ready: return "not_ready";
        case oc::transport_failed: return "transport_failed";
        case oc::protocol_violation: return "protocol_violation";
        case oc::io_failed: return "io_failed";
    }
    return "?";
}

PanelDevice::PanelDevice(std::string name) :
    device_name{std::move(name)},
    slot{},
    state{LifecycleState::connecting}
{ }

PanelDevice::~PanelDevice() {
    log_debug("disposing panel " + device_name);
}

bool PanelDevice::ready() const {
    return slot.occupied();
}

std::optional<std::string> PanelDevice::serial_number() const {
    auto s = slot.get();
    if (!s) return std::nullopt;
    return s->serial_number();
}

std::optional<DeviceTypeId> PanelDevice::device_type_identifier() const {
    auto s = slot.get();
    if (!s) return std::nullopt;
    return s->type_id();
}

RequestStatus PanelDevice::set_image_data(uint8_t page, const ImageBuffer& image) {
    return perform(
        pk::Operation::SetImage,
        pk::Requests::set_image(page, image.size()),
        image);
}

RequestStatus PanelDevice::set_led(uint8_t page, uint8_t index, bool value) {
    return perform(pk::Operation::SetLed, pk::Requests::set_led(page, index, value));
}

RequestStatus PanelDevice::clear_image(uint8_t page) {
    return perform(pk::Operation::ClearImage, pk::Requests::clear_image(page));
}

RequestStatus PanelDevice::save_file(uint8_t page, uint8_t file_id, std::istream& source) {
    // seekable sources are sized first so an oversized file is never buffered
    auto start = source.tellg();
    if (start != std::streampos(-1)) {
        source.seekg(0, std::ios::end);
        auto end = source.tellg();
        source.seekg(start);
        if (end != std::streampos(-1)
            && static_cast<uint64_t>(end - start) > MAX_FILE_SZ) {
            log_error("panel " + device_name + ": file for save_file is larger than the protocol allows");
            return {RequestStatus::Outcome::io_failed};
        }
    }

    std::vector<uint8_t> buffer{
        std::istreambuf_iterator<char>(source),
        std::istreambuf_iterator<char>()};
    if (source.bad()) {
        log_error("panel " + device_name + ": cannot read file data for save_file");
        return {RequestStatus::Outcome::io_failed};
    }
    if (buffer.size() > MAX_FILE_SZ) {
        log_error("panel " + device_name + ": file for save_file is larger than the protocol allows");
        return {RequestStatus::Outcome::io_failed};
    }

    return perform(
        pk::Operation::SaveFile,
        pk::Requests::save_file(page, file_id, buffer.size()),
        buffer);
}

RequestStatus PanelDevice::display_file(uint8_t page, uint8_t index, uint8_t file_id) {
    return perform(pk::Operation::DisplayFile, pk::Requests::display_file(page, index, file_id));
}

RequestStatus PanelDevice::delete_file(uint8_t page, uint8_t file_id) {
    return perform(pk::Operation::DeleteFile, pk::Requests::delete_file(page, file_id));
}

RequestStatus PanelDevice::perform(
    pk::Operation op,
    const pk::ControlPacket& packet,
    std::span<const uint8_t> payload)
{
    using oc = RequestStatus::Outcome;

    auto session = slot.get();
    if (!session) {
        log_error(
            std::string{"panel "} + device_name + ": " + pk::operation_name(op)
            + " called but the device is gone or not initialized yet");
        return {oc::not_ready};
    }

    try {
        auto response = session->transact(packet, payload);
        auto words = response.packet.status();
        RequestStatus ret{
            response.packet.has_error() ? oc::rejected : oc::ok,
            words.header_error,
            words.header_info,
            words.request_error,
            words.request_info,
        };
        if (!ret.ok()) {
            std::stringstream ss;
            ss << "panel " << device_name << " rejected " << pk::operation_name(op)
               << " (header_error=" << ret.header_error
               << ", request_error=" << ret.request_error << ")";
            log_warning(ss.str());
        }
        return ret;
    }
    catch (const TransportError& e) {
        log_error("panel " + device_name + ": " + pk::operation_name(op) + ": " + e.what());
        return {oc::transport_failed};
    }
    catch (const ProtocolViolation& e) {
        log_error("panel " + device_name + ": " + pk::operation_name(op) + ": " + e.what());
        return {oc::protocol_violation};
    }
}

void PanelDevice::set_readiness_listener(ReadinessListener l) {
    std::lock_guard<std::mutex> lock(listener_mtx);
    readiness_listener = std::move(l);
}

void PanelDevice::set_button_listener(ButtonListener l) {
    std::lock_guard<std::mutex> lock(listener_mtx);
    button_listener = std::move(l);
}

bool PanelDevice::install_session(std::shared_ptr<Session> s) {
    std::lock_guard<std::mutex> lock(transition_mtx);
    if (!slot.install(std::move(s))) {
        log_warning("panel " + device_name + " is retired or already has a session");
        return false;
    }
    state.store(LifecycleState::active);
    notify_readiness(true);
    return true;
}

void PanelDevice::invalidate_session() {
    std::lock_guard<std::mutex> lock(transition_mtx);
    auto old = slot.clear();
    state.store(LifecycleState::invalidated);
    if (old) {
        notify_readiness(false);
    }
}

void PanelDevice::retire() {
    std::lock_guard<std::mutex> lock(transition_mtx);
    auto old = slot.close();
    if (old) {
        state.store(LifecycleState::invalidated);
        notify_readiness(false);
    }
}

void PanelDevice::publish_buttons(pk::ButtonState buttons) {
    log_debug("panel " + device_name + " buttons: " + buttons.to_string());
    ButtonListener l;
    {
        std::lock_guard<std::mutex> lock(listener_mtx);
        l = button_listener;
    }
    if (l) l(buttons);
}

void PanelDevice::notify_readiness(bool ready) {
    ReadinessListener l;
    {
        std::lock_guard<std::mutex> lock(listener_mtx);
        l = readiness_listener;
    }
    if (l) l(ready);
}

} // namespace PanelDriver
