#include <stdexcept>

#include <PanelContext.hh>
#include <logging.hh>

namespace PanelDriver {

PanelContext::PanelContext(PanelConfig config) :
    PanelContext(config, [](const PanelConfig& c, DeviceRegistry& r) {
        return std::make_unique<UsbDeviceMonitor>(c, r);
    })
{ }

PanelContext::PanelContext(PanelConfig config, MonitorFactory monitor_factory) :
    cfg{config},
    make_monitor{std::move(monitor_factory)}
{ }

PanelContext::~PanelContext() {
    deinitialize();
}

void PanelContext::initialize() {
    std::lock_guard<std::mutex> lock(mtx);
    if (reg) {
        log_debug("panel context already initialized");
        return;
    }

    set_log_threshold(cfg.log_level);

    auto new_reg = std::make_unique<DeviceRegistry>(
        PanelLifecycle::Options{.access_retry_delay = cfg.access_retry_delay});
    auto new_monitor = make_monitor(cfg, *new_reg);
    new_monitor->scan();

    reg = std::move(new_reg);
    monitor = std::move(new_monitor);
    log_info("panel context initialized");
}

void PanelContext::deinitialize() {
    std::unique_ptr<DeviceRegistry> old_reg;
    std::unique_ptr<DeviceMonitor> old_monitor;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!reg) {
            return;
        }
        old_reg = std::move(reg);
        old_monitor = std::move(monitor);
    }

    // monitor first so nothing attaches while the registry winds down
    old_monitor.reset();
    old_reg->shutdown();
    old_reg.reset();
    log_info("panel context deinitialized");
}

bool PanelContext::initialized() const {
    std::lock_guard<std::mutex> lock(mtx);
    return reg != nullptr;
}

DeviceRegistry& PanelContext::registry() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!reg) {
        throw std::logic_error{"panel context used before initialize()"};
    }
    return *reg;
}

std::shared_ptr<PanelDevice> PanelContext::find_ready(DeviceAddress address) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (!reg || !valid_address(address)) {
        return nullptr;
    }
    auto dev = reg->find(address);
    if (!dev || !dev->ready()) {
        return nullptr;
    }
    return dev;
}

}
