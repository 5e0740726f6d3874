#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <PanelDevice.hh>
#include <PanelLifecycle.hh>
#include <SessionOpener.hh>
#include <dispatch_queue.hh>
#include <packets/Buttons.hh>

namespace PanelDriver {

// Stable per-connection handle: bus number in the high byte, device address in the low.
using DeviceAddress = uint16_t;

constexpr DeviceAddress make_address(uint8_t bus, uint8_t address)
{ return static_cast<DeviceAddress>((bus << 8) | address); }

constexpr uint8_t bus_of(DeviceAddress a) { return static_cast<uint8_t>(a >> 8); }
constexpr uint8_t port_address_of(DeviceAddress a) { return static_cast<uint8_t>(a & 0xff); }

// 0 and 0xffff never name a device
constexpr bool valid_address(DeviceAddress a) { return a != 0 && a != 0xffff; }

std::string address_string(DeviceAddress a);

/*
 * Maps addresses to PanelDevices and runs one lifecycle thread per device.
 *
 * Readiness changes and button reports are queued and handed to
 * subscribers on a single dispatcher thread, never on a lifecycle thread.
 */
class DeviceRegistry {
public:
    using DeviceChangeCallback = std::function<void(DeviceAddress, bool arrived)>;
    using ButtonCallback = std::function<void(DeviceAddress, Packets::ButtonState)>;

    explicit DeviceRegistry(PanelLifecycle::Options opts);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Replaces whatever was at `address`. Starts its lifecycle thread.
    std::shared_ptr<PanelDevice> attach(DeviceAddress address, std::shared_ptr<SessionOpener> opener);
    // Leaves a device already at `address` alone and returns nullptr.
    std::shared_ptr<PanelDevice> attach_if_absent(DeviceAddress address, std::shared_ptr<SessionOpener> opener);
    void detach(DeviceAddress address);

    std::shared_ptr<PanelDevice> find(DeviceAddress address) const;
    bool contains(DeviceAddress address) const;
    std::vector<DeviceAddress> addresses() const;

    void add_device_change_callback(DeviceChangeCallback cb);
    void add_button_callback(ButtonCallback cb);

    // Drops every device and waits for all threads. Safe to call twice.
    void shutdown();

private:
    struct DeviceChange {
        DeviceAddress address;
        bool arrived;
    };
    struct ButtonChange {
        DeviceAddress address;
        Packets::ButtonState buttons;
    };
    using Event = std::variant<DeviceChange, ButtonChange>;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    PanelLifecycle::Options lifecycle_opts;

    mutable std::mutex mtx;
    std::map<DeviceAddress, std::shared_ptr<PanelDevice>> devices;
    std::vector<Worker> workers;
    bool stopped = false;

    std::mutex callback_mtx;
    std::vector<DeviceChangeCallback> change_callbacks;
    std::vector<ButtonCallback> button_callbacks;

    DispatchQueue<Event> events;
    std::thread dispatcher;

    std::shared_ptr<PanelDevice> attach_impl(
        DeviceAddress address, std::shared_ptr<SessionOpener> opener, bool replace);

    void dispatch_loop();
    void deliver(const DeviceChange& e);
    void deliver(const ButtonChange& e);

    // silence a device we no longer track; its lifecycle winds down
    static void release(const std::shared_ptr<PanelDevice>& dev);
    void reap_finished_workers();
};

}
