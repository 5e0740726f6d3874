#pragma once

#include <chrono>
#include <memory>

#include <PanelDevice.hh>
#include <Session.hh>
#include <SessionOpener.hh>

namespace PanelDriver
{

/*
 * Body of the per-device worker thread.
 *
 * connecting -> probing_mode -> active (report loop) -> invalidated
 *
 * Holds only a weak reference to the device: once the registry lets go
 * of it, the loop notices on its next pass and returns. A run that fails
 * to bring the panel up never installs anything and the device stays
 * not ready for this connection.
 */
class PanelLifecycle {
public:
    struct Options {
        std::chrono::milliseconds access_retry_delay{1000};
    };

    PanelLifecycle(
        std::weak_ptr<PanelDevice> device,
        std::shared_ptr<SessionOpener> opener,
        Options opts);

    // never throws; everything that goes wrong ends this run and is logged
    void run();

private:
    std::weak_ptr<PanelDevice> device;
    std::shared_ptr<SessionOpener> opener;
    Options opts;

    void bring_up();
    std::unique_ptr<Session> connect();
    bool in_factory_mode(Session& session);
    void report_loop(const std::shared_ptr<Session>& session);
    void invalidate();

    // false once the device has been disposed
    bool set_state(LifecycleState s);
};

} // namespace PanelDriver
