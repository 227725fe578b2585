#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "gatt.h"

// ─── Adapter Context ────────────────────────────────────────────────────────
// The single local Bluetooth adapter as seen by the core modules. The BlueZ
// implementation talks D-Bus; tests use a recording fake. Asynchronous
// operations report through a Completion on the dispatcher thread.

namespace adapter_context {

/// Platform error: D-Bus error name plus message.
struct AdapterError {
    std::string name;
    std::string message;

    /// Transient BlueZ/D-Bus failures worth retrying.
    bool retryable() const;
};

/// nullptr on success.
using Completion = std::function<void(const AdapterError* error)>;

struct Advertisement {
    std::string              local_name;
    uint16_t                 appearance;
    std::vector<std::string> service_uuids;
};

class AdapterContext {
public:
    virtual ~AdapterContext() = default;

    /// Power on, make pairable and discoverable without timeout, set alias.
    virtual bool power_on(const std::string& alias) = 0;

    /// Switch the controller to LE-only (BR/EDR off).
    virtual bool set_le_only() = 0;

    virtual void register_application(gatt::Application& app, Completion done) = 0;
    virtual void start_advertising(const Advertisement& adv, Completion done) = 0;
    virtual void stop_advertising(Completion done) = 0;

    /// Push a characteristic value to subscribed centrals.
    virtual bool notify(gatt::Characteristic& chr, const gatt::Bytes& value) = 0;

    virtual void register_agent(const std::string& capability, Completion done) = 0;

    /// Set Device1.Trusted for a peer.
    virtual void set_trusted(const std::string& peer, bool trusted, Completion done) = 0;

    /// Unregister everything exported to the platform.
    virtual void shutdown() = 0;
};

} // namespace adapter_context
