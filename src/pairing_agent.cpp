#include "pairing_agent.h"
#include "config.h"
#include "gatt.h"
#include "hid_service.h"
#include "logging.h"

#include <algorithm>
#include <cctype>

namespace pairing_agent {

const char* kind_name(RequestKind kind) {
    switch (kind) {
    case RequestKind::CONFIRMATION:          return "RequestConfirmation";
    case RequestKind::AUTHORIZATION:         return "RequestAuthorization";
    case RequestKind::SERVICE_AUTHORIZATION: return "AuthorizeService";
    }
    return "?";
}

bool is_hid_uuid(const std::string& uuid) {
    std::string lower;
    for (char c : uuid) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == gatt::uuid16(hid_service::UUID_HID_SERVICE) || lower == "1812" || lower == "0x1812";
}

PairingAgent::PairingAgent(adapter_context::AdapterContext& adapter,
                           event_queue::EventQueue& queue,
                           const Settings& settings)
    : adapter_(adapter), queue_(queue), settings_(settings) {}

void PairingAgent::start() {
    adapter_.register_agent(AGENT_CAPABILITY, [this](const adapter_context::AdapterError* error) {
        if (error) {
            registered_ = false;
            logging::error("[AGENT] Agent registration failed: %s: %s",
                           error->name.c_str(), error->message.c_str());
            return;
        }
        registered_ = true;
        logging::info("[AGENT] Registered as default agent (%s)", AGENT_CAPABILITY);
    });
}

// ─── Requests ───────────────────────────────────────────────────────────────

void PairingAgent::on_confirmation_request(const events::ConfirmationRequested& evt) {
    logging::info("[AGENT] RequestConfirmation %s passkey %06u", evt.peer.c_str(), evt.passkey);
    enqueue(evt.peer, RequestKind::CONFIRMATION, "", evt.received, evt.respond);
}

void PairingAgent::on_authorization_request(const events::AuthorizationRequested& evt) {
    if (evt.service_uuid.empty()) {
        logging::info("[AGENT] RequestAuthorization %s", evt.peer.c_str());
        enqueue(evt.peer, RequestKind::AUTHORIZATION, "", evt.received, evt.respond);
        return;
    }
    logging::info("[AGENT] AuthorizeService %s %s%s", evt.peer.c_str(), evt.service_uuid.c_str(),
                  is_hid_uuid(evt.service_uuid) ? " (HID)" : "");
    enqueue(evt.peer, RequestKind::SERVICE_AUTHORIZATION, evt.service_uuid, evt.received, evt.respond);
}

void PairingAgent::enqueue(const std::string& peer, RequestKind kind, const std::string& uuid,
                           Clock::time_point received, const events::Responder& respond) {
    auto deadline = received + std::chrono::milliseconds(settings_.pairing_deadline_ms);
    auto force_at = deadline - std::chrono::milliseconds(
                        std::min(PAIRING_ANSWER_MARGIN_MS, settings_.pairing_deadline_ms));
    uint64_t id = next_id_++;
    pending_.push_back({id, peer, kind, uuid, received, deadline, force_at, respond, false});

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(force_at - Clock::now()).count();
    queue_.post_after(remaining > 0 ? static_cast<uint32_t>(remaining) : 0, events::AgentDeadline{});

    adapter_.set_trusted(peer, true, [this, id](const adapter_context::AdapterError* error) {
        on_trust_result(id, error);
    });
}

void PairingAgent::on_trust_result(uint64_t id, const adapter_context::AdapterError* error) {
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [id](const PendingPairingRequest& r) { return r.id == id; });
    if (it == pending_.end()) return;  // already answered or dropped

    if (error) {
        ++stats_.trust_failures;
        logging::warn("[AGENT] Could not mark %s trusted: %s", it->peer.c_str(), error->message.c_str());
    }
    it->trust_done = true;
    resolve_ready();
}

void PairingAgent::resolve_ready() {
    while (!pending_.empty() && pending_.front().trust_done) {
        PendingPairingRequest req = std::move(pending_.front());
        pending_.pop_front();
        answer(req, Clock::now());
    }
}

void PairingAgent::on_deadline(Clock::time_point now) {
    while (!pending_.empty() && pending_.front().force_at <= now) {
        PendingPairingRequest req = std::move(pending_.front());
        pending_.pop_front();
        if (!req.trust_done) {
            ++stats_.forced;
            logging::warn("[AGENT] %s for %s: trust not confirmed by deadline, accepting",
                          kind_name(req.kind), req.peer.c_str());
        }
        answer(req, now);
    }
    resolve_ready();
}

// Policy is always accept.
void PairingAgent::answer(PendingPairingRequest& req, Clock::time_point now) {
    if (req.respond) req.respond(true);
    ++stats_.accepted;

    if (now > req.deadline) {
        ++stats_.late;
        auto late_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - req.deadline).count();
        logging::warn("[AGENT] %s for %s answered %lldms past deadline",
                      kind_name(req.kind), req.peer.c_str(), static_cast<long long>(late_ms));
    } else {
        logging::debug("[AGENT] %s for %s accepted", kind_name(req.kind), req.peer.c_str());
    }
}

// ─── Cancellation / lifecycle ───────────────────────────────────────────────

void PairingAgent::on_cancel() {
    logging::info("[AGENT] Pairing cancelled by host (%zu pending)", pending_.size());
    stats_.cancelled += static_cast<uint32_t>(pending_.size());
    pending_.clear();
}

void PairingAgent::on_released() {
    logging::warn("[AGENT] Agent released by BlueZ, registering again");
    registered_ = false;
    start();
}

void PairingAgent::on_request_disconnect_cleanup(const std::string& peer) {
    auto before = pending_.size();
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const PendingPairingRequest& r) { return r.peer == peer; }),
                   pending_.end());
    if (pending_.size() != before) {
        logging::info("[AGENT] Dropped %zu pending request(s) for %s", before - pending_.size(), peer.c_str());
    }
    resolve_ready();
}

} // namespace pairing_agent
