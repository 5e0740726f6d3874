#include <array>
#include <sstream>
#include <thread>
#include <typeinfo>

#include <PanelLifecycle.hh>
#include <logging.hh>
#include <packets/Buttons.hh>
#include <packets/Requests.hh>

namespace PanelDriver
{

PanelLifecycle::PanelLifecycle(
    std::weak_ptr<PanelDevice> device_,
    std::shared_ptr<SessionOpener> opener_,
    Options opts_) :
        device{std::move(device_)},
        opener{std::move(opener_)},
        opts{opts_}
{ }

void PanelLifecycle::run() {
    try {
        bring_up();
    }
    catch (const std::exception& e) {
        // fatal for this connection only
        std::stringstream ss;
        ss << "panel lifecycle ended: " << e.what() << std::endl
           << "type: " << typeid(e).name();
        log_error(ss.str());
        invalidate();
        set_state(LifecycleState::failed);
    }
}

void PanelLifecycle::bring_up() {
    if (!set_state(LifecycleState::connecting)) return;
    auto session = connect();

    if (!set_state(LifecycleState::probing_mode)) return;
    if (in_factory_mode(*session)) {
        log_warning(
            "panel " + session->serial_number()
            + " is in factory mode; skipping it");
        set_state(LifecycleState::factory_mode);
        return;
    }

    std::shared_ptr<Session> shared{std::move(session)};
    {
        auto dev = device.lock();
        if (!dev) return;
        if (!dev->install_session(shared)) {
            set_state(LifecycleState::failed);
            return;
        }
    }

    report_loop(shared);
}

std::unique_ptr<Session> PanelLifecycle::connect() {
    try {
        return opener->open();
    }
    catch (const LibUsbCpp::UsbException& e) {
        if (!is_access_denied(e)) throw;

        // udev sometimes hasn't applied permissions yet when we get here
        log_warning(std::string{"access denied opening panel, retrying once: "} + e.what());
        std::this_thread::sleep_for(opts.access_retry_delay);
        return opener->open();
    }
}

bool PanelLifecycle::in_factory_mode(Session& session) {
    auto response = session.transact(Packets::Requests::factory_mode_probe());
    // the probe is expected to be refused in normal operation
    return !response.packet.has_error();
}

void PanelLifecycle::report_loop(const std::shared_ptr<Session>& session) {
    using Packets::ButtonState;

    std::array<uint8_t, ButtonState::REPORT_SZ> report{};
    ButtonState previous{};

    while (true) {
        {
            auto dev = device.lock();
            if (!dev) {
                log_debug("panel " + session->serial_number() + " disposed; lifecycle exiting");
                return;
            }
            if (dev->current_session() != session) {
                // somebody else cleared us out
                return;
            }
        }

        size_t got;
        try {
            got = session->read_report(report);
        }
        catch (const TransportError& e) {
            if (e.is_timeout()) {
                continue;
            }
            if (e.is_no_device()) {
                log_info("panel " + session->serial_number() + " disconnected, invalidating it");
            }
            else {
                log_error(
                    "could not read from panel " + session->serial_number()
                    + " (" + e.what() + "), invalidating it");
            }
            invalidate();
            return;
        }

        if (got != report.size()) {
            log_debug("panel " + session->serial_number()
                      + " sent a " + std::to_string(got) + " byte report; ignoring");
            continue;
        }

        auto buttons = ButtonState::decode(report);
        if (buttons == previous) {
            continue;
        }
        previous = buttons;

        auto dev = device.lock();
        if (!dev) return;
        dev->publish_buttons(buttons);
    }
}

void PanelLifecycle::invalidate() {
    auto dev = device.lock();
    if (dev && dev->ready()) {
        dev->invalidate_session();
    }
}

bool PanelLifecycle::set_state(LifecycleState s) {
    auto dev = device.lock();
    if (!dev) return false;
    dev->lifecycle_state(s);
    return true;
}

} // namespace PanelDriver
