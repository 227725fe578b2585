#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

// ─── Dispatcher Events ──────────────────────────────────────────────────────
// Every platform callback and timer becomes one of these and is handled on
// the dispatcher thread. A peer is identified by its BlueZ device object
// path (e.g. /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF).

namespace events {

/// Answer to a pending pairing request: true = accept.
using Responder = std::function<void(bool accept)>;

using TimePoint = std::chrono::steady_clock::time_point;

struct Connected {
    std::string peer;
    std::string address;
    bool        bonded;
};

struct Disconnected {
    std::string peer;
};

struct BondingChanged {
    std::string peer;
    bool        bonded;
};

struct ConfirmationRequested {
    std::string peer;
    uint32_t    passkey;
    Responder   respond;
    TimePoint   received;
};

/// RequestAuthorization (service_uuid empty) or AuthorizeService.
struct AuthorizationRequested {
    std::string peer;
    std::string service_uuid;
    Responder   respond;
    TimePoint   received;
};

struct PairingCancelled {};

/// Oldest pending pairing request reached its answer deadline.
struct AgentDeadline {};

struct AgentReleased {};

/// StartNotify / StopNotify on a GATT characteristic.
struct CccdChanged {
    std::string characteristic;
    bool        enabled;
};

/// BlueZ released our advertisement.
struct AdvertisingReleased {};

struct PipeReadable {};

struct ThrottleElapsed {};

enum class RetryTarget : uint8_t {
    REGISTRATION,
    ADVERTISING,
    PIPE
};

struct RetryTimer {
    RetryTarget target;
};

struct StatusTick {};

using Event = std::variant<
    Connected,
    Disconnected,
    BondingChanged,
    ConfirmationRequested,
    AuthorizationRequested,
    PairingCancelled,
    AgentDeadline,
    AgentReleased,
    CccdChanged,
    AdvertisingReleased,
    PipeReadable,
    ThrottleElapsed,
    RetryTimer,
    StatusTick>;

/// Short event name for logs.
const char* name(const Event& evt);

} // namespace events
