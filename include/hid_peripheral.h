#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include "adapter_context.h"
#include "event_queue.h"
#include "events.h"
#include "gatt.h"
#include "hid_service.h"
#include "report_encoder.h"
#include "settings.h"

// ─── BLE HID Peripheral ─────────────────────────────────────────────────────
// Owns the exported GATT application and the advertisement, tracks each
// link from connect to disconnect, and delivers keyboard reports to the
// subscribed host.
//
//   IDLE -> CONNECTED -> (StartNotify) -> SUBSCRIBED -> DISCONNECTED -> IDLE
//
// Reports are only sent while a link is SUBSCRIBED.

namespace hid_peripheral {

enum class ConnectionState : uint8_t {
    IDLE,
    CONNECTED,
    SUBSCRIBED,
    DISCONNECTED
};

const char* state_name(ConnectionState state);

struct Connection {
    std::string     peer;
    std::string     address;
    bool            bonded;
    bool            notifications_enabled;
    ConnectionState state;
};

enum class AdvertisingState : uint8_t {
    STOPPED,
    STARTING,
    ACTIVE,
    STOPPING
};

/// Where the FIFO bridge sends frames.
class ReportSink {
public:
    virtual ~ReportSink() = default;

    /// True while a host is subscribed to keyboard input.
    virtual bool subscribed() const = 0;

    /// Notify one frame. Returns false if it was not delivered.
    virtual bool send_report(const report_encoder::ReportFrame& frame) = 0;
};

class HidPeripheral : public ReportSink {
public:
    using SubscriptionListener = std::function<void(bool subscribed)>;
    using FatalHandler         = std::function<void(const std::string& reason)>;

    HidPeripheral(adapter_context::AdapterContext& adapter,
                  event_queue::EventQueue& queue,
                  const Settings& settings);

    void set_subscription_listener(SubscriptionListener listener);
    void set_fatal_handler(FatalHandler handler);

    /// Configure the adapter, then register the GATT application and
    /// advertisement (with retry).
    void start();

    // ─── Dispatched events ──────────────────────────────────────────────
    void on_connected(const events::Connected& evt);
    void on_disconnected(const events::Disconnected& evt);
    void on_bonding_changed(const events::BondingChanged& evt);
    void on_cccd_changed(const events::CccdChanged& evt);
    void on_advertising_released();
    void on_retry(events::RetryTarget target);

    // ─── ReportSink ─────────────────────────────────────────────────────
    bool subscribed() const override;
    bool send_report(const report_encoder::ReportFrame& frame) override;

    // ─── Status ─────────────────────────────────────────────────────────
    const std::map<std::string, Connection>& connections() const { return connections_; }
    ConnectionState state_of(const std::string& peer) const;
    bool is_known_bonded(const std::string& peer) const { return known_bonded_.count(peer) > 0; }
    bool registered() const { return registered_; }
    AdvertisingState advertising_state() const { return adv_state_; }
    int registration_attempts() const { return reg_attempts_; }
    uint32_t frames_sent() const { return frames_sent_; }
    uint32_t notify_failures() const { return notify_failures_; }

    gatt::Application& application() { return app_; }
    const hid_service::HidHandles& handles() const { return handles_; }

private:
    void register_application();
    void on_registration_result(const adapter_context::AdapterError* error);
    void start_advertising();
    void on_advertising_result(const adapter_context::AdapterError* error);
    void rearm_advertising();
    void schedule_advertising(uint32_t delay_ms);
    void fail(const std::string& reason);

    bool input_notifying() const;
    void refresh_subscriptions();
    void update_subscription();

    adapter_context::AdapterContext& adapter_;
    event_queue::EventQueue&         queue_;
    const Settings&                  settings_;

    gatt::Application             app_;
    hid_service::HidHandles       handles_;
    adapter_context::Advertisement adv_;

    std::map<std::string, Connection> connections_;
    std::set<std::string>             known_bonded_;

    SubscriptionListener listener_;
    FatalHandler         fatal_;
    bool                 last_subscribed_ = false;

    bool     registered_     = false;
    int      reg_attempts_   = 0;
    uint32_t reg_delay_ms_   = 0;

    AdvertisingState         adv_state_    = AdvertisingState::STOPPED;
    uint32_t                 adv_delay_ms_ = 0;
    event_queue::TimerId     adv_timer_    = event_queue::NO_TIMER;

    uint32_t frames_sent_     = 0;
    uint32_t notify_failures_ = 0;
};

} // namespace hid_peripheral
