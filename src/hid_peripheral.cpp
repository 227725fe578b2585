#include "hid_peripheral.h"
#include "config.h"
#include "logging.h"

#include <algorithm>

namespace hid_peripheral {

const char* state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::IDLE:         return "IDLE";
    case ConnectionState::CONNECTED:    return "CONNECTED";
    case ConnectionState::SUBSCRIBED:   return "SUBSCRIBED";
    case ConnectionState::DISCONNECTED: return "DISCONNECTED";
    }
    return "?";
}

static uint32_t next_backoff(uint32_t current) {
    return std::min(current * 2, BLE_RETRY_MAX_MS);
}

HidPeripheral::HidPeripheral(adapter_context::AdapterContext& adapter,
                             event_queue::EventQueue& queue,
                             const Settings& settings)
    : adapter_(adapter), queue_(queue), settings_(settings) {
    hid_service::build(settings_, app_, handles_);
    app_.assign_paths(GATT_APP_ROOT);

    adv_.local_name    = settings_.device_name;
    adv_.appearance    = APPEARANCE_KEYBOARD;
    adv_.service_uuids = { gatt::uuid16(hid_service::UUID_HID_SERVICE) };
}

void HidPeripheral::set_subscription_listener(SubscriptionListener listener) {
    listener_ = std::move(listener);
}

void HidPeripheral::set_fatal_handler(FatalHandler handler) {
    fatal_ = std::move(handler);
}

// ─── Startup / registration ─────────────────────────────────────────────────

void HidPeripheral::start() {
    if (settings_.le_only && !adapter_.set_le_only()) {
        logging::warn("[BLE] Could not switch controller to LE-only; continuing in current mode");
    }
    if (!adapter_.power_on(settings_.device_name)) {
        logging::warn("[BLE] Adapter setup incomplete; registration will retry");
    }

    reg_attempts_ = 0;
    reg_delay_ms_ = BLE_RETRY_INITIAL_MS;
    register_application();
}

void HidPeripheral::register_application() {
    ++reg_attempts_;
    logging::debug("[BLE] RegisterApplication attempt %d", reg_attempts_);
    adapter_.register_application(app_, [this](const adapter_context::AdapterError* error) {
        on_registration_result(error);
    });
}

void HidPeripheral::on_registration_result(const adapter_context::AdapterError* error) {
    if (!error) {
        registered_ = true;
        logging::info("[BLE] GATT application registered (%d attempt%s)",
                      reg_attempts_, reg_attempts_ == 1 ? "" : "s");
        adv_delay_ms_ = BLE_RETRY_INITIAL_MS;
        start_advertising();
        return;
    }

    if (!error->retryable()) {
        fail("RegisterApplication non-retryable error: " + error->name + ": " + error->message);
        return;
    }
    if (reg_attempts_ >= BLE_REGISTER_MAX_ATTEMPTS) {
        fail("RegisterApplication exceeded retry budget (" +
             std::to_string(BLE_REGISTER_MAX_ATTEMPTS) + "): " + error->name);
        return;
    }

    logging::warn("[BLE] RegisterApplication retry %d/%d in %ums after %s: %s",
                  reg_attempts_, BLE_REGISTER_MAX_ATTEMPTS, reg_delay_ms_,
                  error->name.c_str(), error->message.c_str());
    queue_.post_after(reg_delay_ms_, events::RetryTimer{events::RetryTarget::REGISTRATION});
    reg_delay_ms_ = next_backoff(reg_delay_ms_);
}

void HidPeripheral::fail(const std::string& reason) {
    logging::error("[BLE] Registration failed: %s", reason.c_str());
    if (fatal_) fatal_(reason);
}

// ─── Advertising ────────────────────────────────────────────────────────────

void HidPeripheral::start_advertising() {
    adv_timer_ = event_queue::NO_TIMER;
    adv_state_ = AdvertisingState::STARTING;
    adapter_.start_advertising(adv_, [this](const adapter_context::AdapterError* error) {
        on_advertising_result(error);
    });
}

void HidPeripheral::on_advertising_result(const adapter_context::AdapterError* error) {
    if (!error || error->name == "org.bluez.Error.AlreadyExists") {
        adv_state_    = AdvertisingState::ACTIVE;
        adv_delay_ms_ = BLE_RETRY_INITIAL_MS;
        logging::info("[BLE] Advertising as \"%s\"", adv_.local_name.c_str());
        return;
    }

    // Advertising never gives up: the host can only find us while it runs.
    adv_state_ = AdvertisingState::STOPPED;
    logging::warn("[BLE] RegisterAdvertisement failed (%s: %s), retry in %ums",
                  error->name.c_str(), error->message.c_str(), adv_delay_ms_);
    schedule_advertising(adv_delay_ms_);
    adv_delay_ms_ = next_backoff(adv_delay_ms_);
}

void HidPeripheral::schedule_advertising(uint32_t delay_ms) {
    if (adv_timer_ != event_queue::NO_TIMER) {
        queue_.cancel(adv_timer_);
    }
    adv_timer_ = queue_.post_after(delay_ms, events::RetryTimer{events::RetryTarget::ADVERTISING});
}

void HidPeripheral::rearm_advertising() {
    if (!registered_) return;

    switch (adv_state_) {
    case AdvertisingState::ACTIVE:
        adv_state_ = AdvertisingState::STOPPING;
        adapter_.stop_advertising([this](const adapter_context::AdapterError* error) {
            if (error) {
                logging::debug("[BLE] UnregisterAdvertisement: %s", error->name.c_str());
            }
            adv_state_ = AdvertisingState::STOPPED;
            schedule_advertising(ADV_REARM_DELAY_MS);
        });
        break;
    case AdvertisingState::STOPPED:
        if (adv_timer_ == event_queue::NO_TIMER) schedule_advertising(ADV_REARM_DELAY_MS);
        break;
    case AdvertisingState::STARTING:
    case AdvertisingState::STOPPING:
        break;
    }
}

void HidPeripheral::on_advertising_released() {
    logging::info("[BLE] Advertisement released by BlueZ");
    adv_state_ = AdvertisingState::STOPPED;
    if (registered_) schedule_advertising(ADV_REARM_DELAY_MS);
}

void HidPeripheral::on_retry(events::RetryTarget target) {
    switch (target) {
    case events::RetryTarget::REGISTRATION:
        if (!registered_) register_application();
        break;
    case events::RetryTarget::ADVERTISING:
        adv_timer_ = event_queue::NO_TIMER;
        if (registered_ && adv_state_ == AdvertisingState::STOPPED) start_advertising();
        break;
    case events::RetryTarget::PIPE:
        break;
    }
}

// ─── Connections ────────────────────────────────────────────────────────────

void HidPeripheral::on_connected(const events::Connected& evt) {
    bool bonded = evt.bonded || is_known_bonded(evt.peer);
    if (bonded) known_bonded_.insert(evt.peer);

    auto it = connections_.find(evt.peer);
    if (it != connections_.end()) {
        it->second.bonded = bonded;
        logging::debug("[BLE] Duplicate connect for %s ignored", evt.address.c_str());
        return;
    }

    Connection conn{evt.peer, evt.address, bonded, false, ConnectionState::CONNECTED};
    if (input_notifying()) {
        // StartNotify arrived before the Connected property change.
        conn.notifications_enabled = true;
        conn.state = ConnectionState::SUBSCRIBED;
    }
    connections_.emplace(evt.peer, conn);

    logging::info("[BLE] Connected to %s (%s)", evt.address.c_str(),
                  bonded ? "bonded, no pairing needed" : "new peer");
    update_subscription();
}

void HidPeripheral::on_disconnected(const events::Disconnected& evt) {
    auto it = connections_.find(evt.peer);
    if (it == connections_.end()) {
        logging::debug("[BLE] Disconnect for unknown peer %s", evt.peer.c_str());
        return;
    }

    Connection& conn = it->second;
    conn.state = ConnectionState::DISCONNECTED;
    conn.notifications_enabled = false;
    logging::info("[BLE] Disconnected from %s", conn.address.c_str());
    connections_.erase(it);

    // Characteristic notify state follows StartNotify/StopNotify only. BlueZ
    // keeps the CCCD of a bonded peer across the disconnect.
    update_subscription();
    rearm_advertising();
}

void HidPeripheral::on_bonding_changed(const events::BondingChanged& evt) {
    if (evt.bonded) {
        known_bonded_.insert(evt.peer);
    } else {
        known_bonded_.erase(evt.peer);
    }

    auto it = connections_.find(evt.peer);
    if (it != connections_.end()) it->second.bonded = evt.bonded;
    logging::info("[BLE] %s %s", evt.peer.c_str(), evt.bonded ? "bonded" : "bond removed");
}

void HidPeripheral::on_cccd_changed(const events::CccdChanged& evt) {
    gatt::Characteristic* chr = app_.find(evt.characteristic);
    gatt::Notifiable* n = chr ? chr->notifiable() : nullptr;
    if (!n) {
        logging::warn("[BLE] Notify change on unknown characteristic %s", evt.characteristic.c_str());
        return;
    }

    n->set_notifying(evt.enabled);
    if (chr == handles_.input || chr == handles_.boot_input) {
        logging::info("[BLE] %s notify %s",
                      chr == handles_.input ? "Input report" : "Boot input",
                      evt.enabled ? "enabled" : "disabled");
        refresh_subscriptions();
    } else {
        logging::debug("[BLE] %s notify %s", chr->uuid().c_str(), evt.enabled ? "on" : "off");
    }
}

bool HidPeripheral::input_notifying() const {
    return handles_.input->notifying() || handles_.boot_input->notifying();
}

// BlueZ aggregates CCCD state per characteristic, so a subscription applies
// to every live link.
void HidPeripheral::refresh_subscriptions() {
    bool on = input_notifying();
    for (auto& entry : connections_) {
        Connection& conn = entry.second;
        conn.notifications_enabled = on;
        conn.state = on ? ConnectionState::SUBSCRIBED : ConnectionState::CONNECTED;
    }
    update_subscription();
}

void HidPeripheral::update_subscription() {
    bool now = subscribed();
    if (now == last_subscribed_) return;

    last_subscribed_ = now;
    logging::info("[BLE] Host %s", now ? "subscribed to keyboard input" : "no longer subscribed");
    if (listener_) listener_(now);
}

ConnectionState HidPeripheral::state_of(const std::string& peer) const {
    auto it = connections_.find(peer);
    return it == connections_.end() ? ConnectionState::IDLE : it->second.state;
}

// ─── Reports ────────────────────────────────────────────────────────────────

bool HidPeripheral::subscribed() const {
    for (const auto& entry : connections_) {
        if (entry.second.state == ConnectionState::SUBSCRIBED) return true;
    }
    return false;
}

bool HidPeripheral::send_report(const report_encoder::ReportFrame& frame) {
    if (!subscribed()) return false;

    hid_service::InputReportCharacteristic* primary = handles_.input;
    hid_service::InputReportCharacteristic* fallback = handles_.boot_input;
    if (handles_.protocol_mode->boot_mode()) std::swap(primary, fallback);

    hid_service::InputReportCharacteristic* target =
        primary->notifying() ? primary : (fallback->notifying() ? fallback : nullptr);
    if (!target) return false;

    gatt::Bytes bytes = frame.to_vector();
    if (!adapter_.notify(*target, bytes)) {
        ++notify_failures_;
        return false;
    }
    target->set_value(bytes);
    ++frames_sent_;

#if KBD_BRIDGE_DEBUG_VERBOSE
    logging::debug("[BLE] Report %02X %02X %02X %02X %02X %02X %02X %02X",
                   bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7]);
#endif
    return true;
}

} // namespace hid_peripheral
