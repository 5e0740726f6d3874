#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <istream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>

#include <Session.hh>
#include <SessionSlot.hh>
#include <common.hh>
#include <packets/Buttons.hh>
#include <packets/Requests.hh>

namespace PanelDriver
{

// 320 x 240, 24 bits per pixel
constexpr size_t IMAGE_SZ = 0x38400;
using ImageBuffer = std::array<uint8_t, IMAGE_SZ>;

// data_size is a 32-bit field
constexpr uint64_t MAX_FILE_SZ = std::numeric_limits<uint32_t>::max();

enum class LifecycleState {
    connecting,
    probing_mode,
    active,
    invalidated,
    factory_mode,
    failed,
};

const char* lifecycle_state_name(LifecycleState s);

// Outcome of one public operation, with the device's error words when it answered.
struct RequestStatus {
    enum class Outcome {
        ok,
        rejected,            // device answered with an error
        not_ready,           // no session in the slot
        transport_failed,
        protocol_violation,
        io_failed,           // couldn't read the caller's data
    };

    Outcome outcome;
    uint32_t header_error = 0;
    uint32_t header_info = 0;
    uint32_t request_error = 0;
    uint32_t request_info = 0;

    bool ok() const { return outcome == Outcome::ok; }
    explicit operator bool() const { return ok(); }
};

const char* outcome_name(RequestStatus::Outcome o);

/*
 * The long-lived, addressable panel. Outlives any single Session: the
 * lifecycle thread installs one when the panel comes up and clears it when
 * the panel goes away. Public operations fail fast while the slot is empty.
 */
class PanelDevice {
public:
    using ReadinessListener = std::function<void(bool ready)>;
    using ButtonListener = std::function<void(Packets::ButtonState)>;

    PanelDevice(std::string name);
    ~PanelDevice();

    PanelDevice(const PanelDevice&) = delete;
    PanelDevice& operator=(const PanelDevice&) = delete;

    const std::string& name() const { return device_name; }

    bool ready() const;
    std::optional<std::string> serial_number() const;
    std::optional<DeviceTypeId> device_type_identifier() const;

    RequestStatus set_image_data(uint8_t page, const ImageBuffer& image);
    RequestStatus set_led(uint8_t page, uint8_t index, bool value);
    RequestStatus clear_image(uint8_t page);
    RequestStatus save_file(uint8_t page, uint8_t file_id, std::istream& source);
    RequestStatus display_file(uint8_t page, uint8_t index, uint8_t file_id);
    RequestStatus delete_file(uint8_t page, uint8_t file_id);

    LifecycleState lifecycle_state() const { return state.load(); }

    void set_readiness_listener(ReadinessListener l);
    void set_button_listener(ButtonListener l);

    // Owner is done with this device: drop the session and never take another.
    void retire();

    // -- used by the lifecycle thread
    bool install_session(std::shared_ptr<Session> s);
    void invalidate_session();
    std::shared_ptr<Session> current_session() const { return slot.get(); }
    void lifecycle_state(LifecycleState s) { state.store(s); }
    void publish_buttons(Packets::ButtonState buttons);

private:
    const std::string device_name;

    // held across a slot change and its readiness notification, so
    // listeners see transitions in the order they happened
    std::mutex transition_mtx;
    SessionSlot slot;
    std::atomic<LifecycleState> state;

    std::mutex listener_mtx;
    ReadinessListener readiness_listener;
    ButtonListener button_listener;

    RequestStatus perform(
        Packets::Operation op,
        const Packets::ControlPacket& packet,
        std::span<const uint8_t> payload = {});

    void notify_readiness(bool ready);
};

} // namespace PanelDriver
