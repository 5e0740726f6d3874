#include <cstdio>
#include <pthread.h>
#include <sstream>
#include <typeinfo>

#include <DeviceRegistry.hh>
#include <logging.hh>

namespace PanelDriver {

std::string address_string(DeviceAddress a) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%03u-%03u", bus_of(a), port_address_of(a));
    return buf;
}

DeviceRegistry::DeviceRegistry(PanelLifecycle::Options opts) :
    lifecycle_opts{opts},
    devices{},
    workers{},
    events{},
    dispatcher{[this] { dispatch_loop(); }}
{ }

DeviceRegistry::~DeviceRegistry() {
    shutdown();
}

std::shared_ptr<PanelDevice> DeviceRegistry::attach(
    DeviceAddress address,
    std::shared_ptr<SessionOpener> opener)
{
    return attach_impl(address, std::move(opener), true);
}

std::shared_ptr<PanelDevice> DeviceRegistry::attach_if_absent(
    DeviceAddress address,
    std::shared_ptr<SessionOpener> opener)
{
    return attach_impl(address, std::move(opener), false);
}

std::shared_ptr<PanelDevice> DeviceRegistry::attach_impl(
    DeviceAddress address,
    std::shared_ptr<SessionOpener> opener,
    bool replace)
{
    if (!valid_address(address)) {
        throw std::invalid_argument{"invalid device address " + std::to_string(address)};
    }

    auto dev = std::make_shared<PanelDevice>(address_string(address));
    dev->set_readiness_listener([this, address](bool ready) {
        events.push(DeviceChange{address, ready});
    });
    dev->set_button_listener([this, address](Packets::ButtonState b) {
        events.push(ButtonChange{address, b});
    });

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopped) {
            throw std::logic_error{"device registry has been shut down"};
        }
        reap_finished_workers();

        auto it = devices.find(address);
        if (it != devices.end()) {
            if (!replace) {
                log_debug("panel at " + address_string(address) + " already attached");
                return nullptr;
            }
            // its "gone" must be queued before the new device can report "ready"
            auto replaced = std::move(it->second);
            log_info("replacing panel at " + address_string(address));
            replaced->retire();
            release(replaced);
        }
        devices[address] = dev;

        auto done = std::make_shared<std::atomic<bool>>(false);
        PanelLifecycle lifecycle{dev, std::move(opener), lifecycle_opts};
        std::thread t{[lifecycle, done]() mutable {
            lifecycle.run();
            done->store(true);
        }};
        // thread names are capped at 15 characters
        pthread_setname_np(t.native_handle(), ("panel " + address_string(address)).c_str());
        workers.push_back(Worker{std::move(t), done});
    }

    log_info("panel attached at " + address_string(address));
    return dev;
}

void DeviceRegistry::detach(DeviceAddress address) {
    std::shared_ptr<PanelDevice> dev;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = devices.find(address);
        if (it == devices.end()) {
            return;
        }
        dev = std::move(it->second);
        devices.erase(it);
    }

    // retire before dropping listeners: whichever of us and the lifecycle
    // clears the slot first sends the one "gone" notification
    dev->retire();
    release(dev);
    log_info("panel detached from " + address_string(address));
}

std::shared_ptr<PanelDevice> DeviceRegistry::find(DeviceAddress address) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = devices.find(address);
    if (it == devices.end()) {
        return nullptr;
    }
    return it->second;
}

bool DeviceRegistry::contains(DeviceAddress address) const {
    std::lock_guard<std::mutex> lock(mtx);
    return devices.contains(address);
}

std::vector<DeviceAddress> DeviceRegistry::addresses() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<DeviceAddress> out;
    out.reserve(devices.size());
    for (const auto& [addr, dev] : devices) {
        out.push_back(addr);
    }
    return out;
}

void DeviceRegistry::add_device_change_callback(DeviceChangeCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mtx);
    change_callbacks.push_back(std::move(cb));
}

void DeviceRegistry::add_button_callback(ButtonCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mtx);
    button_callbacks.push_back(std::move(cb));
}

void DeviceRegistry::shutdown() {
    std::map<DeviceAddress, std::shared_ptr<PanelDevice>> dropped;
    std::vector<Worker> to_join;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopped) {
            return;
        }
        stopped = true;
        dropped.swap(devices);
        to_join.swap(workers);
    }

    for (auto& [addr, dev] : dropped) {
        release(dev);
    }
    dropped.clear();

    // each lifecycle notices within one I/O timeout
    for (auto& w : to_join) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }

    events.close();
    if (dispatcher.joinable()) {
        dispatcher.join();
    }
    log_debug("device registry shut down");
}

void DeviceRegistry::release(const std::shared_ptr<PanelDevice>& dev) {
    dev->set_readiness_listener(nullptr);
    dev->set_button_listener(nullptr);
    // the lifecycle exits once its session is no longer in the slot
    dev->retire();
}

void DeviceRegistry::reap_finished_workers() {
    auto it = workers.begin();
    while (it != workers.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        }
        else {
            ++it;
        }
    }
}

void DeviceRegistry::dispatch_loop() {
    while (auto event = events.pop()) {
        try {
            std::visit([this](const auto& e) { deliver(e); }, *event);
        }
        catch (const std::exception& e) {
            std::stringstream ss;
            ss << "panel event callback failed: " << e.what() << std::endl
               << "type: " << typeid(e).name();
            log_error(ss.str());
        }
    }
}

void DeviceRegistry::deliver(const DeviceChange& e) {
    log_info(
        "panel " + address_string(e.address)
        + (e.arrived ? " ready" : " gone"));

    std::vector<DeviceChangeCallback> cbs;
    {
        std::lock_guard<std::mutex> lock(callback_mtx);
        cbs = change_callbacks;
    }
    for (const auto& cb : cbs) {
        cb(e.address, e.arrived);
    }
}

void DeviceRegistry::deliver(const ButtonChange& e) {
    std::vector<ButtonCallback> cbs;
    {
        std::lock_guard<std::mutex> lock(callback_mtx);
        cbs = button_callbacks;
    }
    for (const auto& cb : cbs) {
        cb(e.address, e.buttons);
    }
}

}
