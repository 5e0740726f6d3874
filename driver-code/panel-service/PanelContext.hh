#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include <DeviceRegistry.hh>
#include <PanelConfig.hh>
#include <UsbDeviceMonitor.hh>

namespace PanelDriver {

/*
 * Everything the driver keeps between calls. Construct one, initialize it
 * before use, pass it to whoever needs devices. initialize() and
 * deinitialize() are both idempotent; deinitialize() drops every session.
 */
class PanelContext {
public:
    using MonitorFactory =
        std::function<std::unique_ptr<DeviceMonitor>(const PanelConfig&, DeviceRegistry&)>;

    explicit PanelContext(PanelConfig config);
    PanelContext(PanelConfig config, MonitorFactory monitor_factory);
    ~PanelContext();

    PanelContext(const PanelContext&) = delete;
    PanelContext& operator=(const PanelContext&) = delete;

    void initialize();
    void deinitialize();
    bool initialized() const;

    // throws std::logic_error before initialize()
    DeviceRegistry& registry();

    // a device that exists and is ready, or nullptr
    std::shared_ptr<PanelDevice> find_ready(DeviceAddress address) const;

    const PanelConfig& config() const { return cfg; }

private:
    PanelConfig cfg;
    MonitorFactory make_monitor;

    mutable std::mutex mtx;
    std::unique_ptr<DeviceRegistry> reg;
    std::unique_ptr<DeviceMonitor> monitor;
};

}
