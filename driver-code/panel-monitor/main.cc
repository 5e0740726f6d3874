#include <iostream>
#include <stdexcept>
#include <sstream>
#include <string>

#include <pthread.h>

#include <logging.hh>
#include <main.hh>

int main(int argc, char* argv[]) {
    bool clear_on_arrival = false;
    if (argc == 2 && std::string{argv[1]} == "--clear") {
        clear_on_arrival = true;
    }
    else if (argc != 1) {
        usage(argv[0]);
        return -1;
    }

    // before any threads exist, so they all inherit the mask
    auto stop_signals = block_stop_signals();

    PanelDriver::PanelContext ctx{PanelDriver::PanelConfig::from_environment()};
    ctx.initialize();
    subscribe(ctx, clear_on_arrival);

    int sig = 0;
    sigwait(&stop_signals, &sig);
    log_info("panel-monitor stopping on signal " + std::to_string(sig));

    ctx.deinitialize();
    return 0;
}

sigset_t block_stop_signals() {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    int ret = pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    if (ret != 0) {
        throw std::runtime_error{"cant block signals: " + std::to_string(ret)};
    }
    return sigs;
}

void subscribe(PanelDriver::PanelContext& ctx, bool clear_on_arrival) {
    using namespace PanelDriver;
    auto& registry = ctx.registry();

    registry.add_device_change_callback([&ctx, clear_on_arrival](DeviceAddress addr, bool arrived) {
        if (!arrived) {
            log_info("panel-monitor: " + address_string(addr) + " left");
            return;
        }
        announce(ctx, addr, clear_on_arrival);
    });

    registry.add_button_callback([](DeviceAddress addr, Packets::ButtonState buttons) {
        log_info("panel-monitor: " + address_string(addr) + " buttons " + buttons.to_string());
    });

    // panels that came up during the initial scan, before we were listening
    for (auto addr : registry.addresses()) {
        announce(ctx, addr, clear_on_arrival);
    }
}

void announce(PanelDriver::PanelContext& ctx, PanelDriver::DeviceAddress addr, bool clear_on_arrival) {
    using namespace PanelDriver;

    auto dev = ctx.find_ready(addr);
    if (!dev) {
        // not up yet, or gone again
        return;
    }

    std::stringstream ss;
    ss << "panel-monitor: " << address_string(addr)
       << " serial=" << dev->serial_number().value_or("?")
       << " type=" << dev->device_type_identifier().value_or(PANEL_DEVICE_TYPE).to_string();
    log_info(ss.str());

    if (clear_on_arrival) {
        auto status = dev->clear_image(0);
        if (!status) {
            log_warning(
                "panel-monitor: clearing page 0 of " + address_string(addr)
                + " failed: " + outcome_name(status.outcome));
        }
    }
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--clear]\n"
              << "Configured through PANEL_* environment variables.\n";
}
