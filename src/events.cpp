#include "events.h"

namespace events {

namespace {

struct Namer {
    const char* operator()(const Connected&) const              { return "Connected"; }
    const char* operator()(const Disconnected&) const           { return "Disconnected"; }
    const char* operator()(const BondingChanged&) const         { return "BondingChanged"; }
    const char* operator()(const ConfirmationRequested&) const  { return "ConfirmationRequested"; }
    const char* operator()(const AuthorizationRequested&) const { return "AuthorizationRequested"; }
    const char* operator()(const PairingCancelled&) const       { return "PairingCancelled"; }
    const char* operator()(const AgentDeadline&) const          { return "AgentDeadline"; }
    const char* operator()(const AgentReleased&) const          { return "AgentReleased"; }
    const char* operator()(const CccdChanged&) const            { return "CccdChanged"; }
    const char* operator()(const AdvertisingReleased&) const    { return "AdvertisingReleased"; }
    const char* operator()(const PipeReadable&) const           { return "PipeReadable"; }
    const char* operator()(const ThrottleElapsed&) const        { return "ThrottleElapsed"; }
    const char* operator()(const RetryTimer&) const             { return "RetryTimer"; }
    const char* operator()(const StatusTick&) const             { return "StatusTick"; }
};

} // namespace

const char* name(const Event& evt) {
    return std::visit(Namer{}, evt);
}

} // namespace events
