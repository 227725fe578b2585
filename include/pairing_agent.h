#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include "adapter_context.h"
#include "event_queue.h"
#include "events.h"
#include "settings.h"

// ─── Pairing Agent ──────────────────────────────────────────────────────────
// "Just Works" agent with NoInputNoOutput capability. Every confirmation
// and authorization request is accepted and the peer is marked trusted so
// later reconnects need no prompt.
//
// A request stays pending until BlueZ acknowledges the Trusted write, or
// until its deadline, whichever comes first. Answers go out in arrival
// order.

namespace pairing_agent {

using Clock = std::chrono::steady_clock;

enum class RequestKind : uint8_t {
    CONFIRMATION,
    AUTHORIZATION,
    SERVICE_AUTHORIZATION
};

const char* kind_name(RequestKind kind);

struct PendingPairingRequest {
    uint64_t          id;
    std::string       peer;
    RequestKind       kind;
    std::string       service_uuid;
    Clock::time_point received;
    Clock::time_point deadline;
    Clock::time_point force_at;     // deadline less PAIRING_ANSWER_MARGIN_MS
    events::Responder respond;
    bool              trust_done;
};

struct Stats {
    uint32_t accepted       = 0;
    uint32_t late           = 0;   // answered after the deadline
    uint32_t forced         = 0;   // answered at the deadline before trust completed
    uint32_t trust_failures = 0;
    uint32_t cancelled      = 0;
};

/// True for the HID service UUID (full 128-bit or short form).
bool is_hid_uuid(const std::string& uuid);

class PairingAgent {
public:
    PairingAgent(adapter_context::AdapterContext& adapter,
                 event_queue::EventQueue& queue,
                 const Settings& settings);

    /// Register with BlueZ and request to be the default agent.
    void start();

    void on_confirmation_request(const events::ConfirmationRequested& evt);
    void on_authorization_request(const events::AuthorizationRequested& evt);

    /// Answer every request whose forced-answer time has passed.
    void on_deadline(Clock::time_point now);

    /// BlueZ cancelled the outstanding request.
    void on_cancel();

    /// BlueZ dropped the agent; register again.
    void on_released();

    /// Forget requests tied to a peer that went away.
    void on_request_disconnect_cleanup(const std::string& peer);

    size_t pending_count() const { return pending_.size(); }
    const Stats& stats() const { return stats_; }
    bool registered() const { return registered_; }

private:
    void enqueue(const std::string& peer, RequestKind kind, const std::string& uuid,
                 Clock::time_point received, const events::Responder& respond);
    void on_trust_result(uint64_t id, const adapter_context::AdapterError* error);
    void resolve_ready();
    void answer(PendingPairingRequest& req, Clock::time_point now);

    adapter_context::AdapterContext&  adapter_;
    event_queue::EventQueue&          queue_;
    const Settings&                   settings_;
    std::deque<PendingPairingRequest> pending_;
    uint64_t next_id_    = 1;
    Stats    stats_;
    bool     registered_ = false;
};

} // namespace pairing_agent
