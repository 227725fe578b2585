#pragma once

#include <functional>
#include "adapter_context.h"
#include "event_queue.h"
#include "events.h"
#include "fifo_bridge.h"
#include "hid_peripheral.h"
#include "pairing_agent.h"
#include "readiness_flag.h"
#include "settings.h"

// ─── Bridge Daemon ──────────────────────────────────────────────────────────
// Wires the peripheral, pairing agent, readiness flag and FIFO bridge
// together and routes each dispatched event to its owner.

namespace bridge_daemon {

class Daemon {
public:
    /// Called with an exit code when the daemon cannot continue.
    using ExitHandler = std::function<void(int code)>;

    Daemon(const Settings& settings,
           adapter_context::AdapterContext& adapter,
           event_queue::EventQueue& queue);

    void set_exit_handler(ExitHandler handler);

    /// Bring everything up. Returns false if startup failed outright.
    bool start();

    /// Route one event.
    void handle(events::Event& evt);

    /// Withdraw the flag and unregister from BlueZ.
    void shutdown();

    /// One [STATUS] line.
    void log_status() const;

    hid_peripheral::HidPeripheral& peripheral() { return peripheral_; }
    pairing_agent::PairingAgent&   agent() { return agent_; }
    fifo_bridge::FifoBridge&       bridge() { return bridge_; }
    readiness_flag::ReadinessFlag& flag() { return flag_; }

private:
    struct Router;

    const Settings&                  settings_;
    adapter_context::AdapterContext& adapter_;
    event_queue::EventQueue&         queue_;

    readiness_flag::ReadinessFlag  flag_;
    hid_peripheral::HidPeripheral  peripheral_;
    pairing_agent::PairingAgent    agent_;
    fifo_bridge::FifoBridge        bridge_;

    ExitHandler exit_;
    bool        shut_down_ = false;
};

} // namespace bridge_daemon
