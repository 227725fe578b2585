#include "bridge_daemon.h"
#include "config.h"
#include "logging.h"

namespace bridge_daemon {

struct Daemon::Router {
    Daemon& d;

    void operator()(const events::Connected& e) { d.peripheral_.on_connected(e); }
    void operator()(const events::Disconnected& e) {
        d.peripheral_.on_disconnected(e);
        d.agent_.on_request_disconnect_cleanup(e.peer);
    }
    void operator()(const events::BondingChanged& e) { d.peripheral_.on_bonding_changed(e); }
    void operator()(const events::ConfirmationRequested& e) { d.agent_.on_confirmation_request(e); }
    void operator()(const events::AuthorizationRequested& e) { d.agent_.on_authorization_request(e); }
    void operator()(const events::PairingCancelled&) { d.agent_.on_cancel(); }
    void operator()(const events::AgentDeadline&) { d.agent_.on_deadline(pairing_agent::Clock::now()); }
    void operator()(const events::AgentReleased&) { d.agent_.on_released(); }
    void operator()(const events::CccdChanged& e) { d.peripheral_.on_cccd_changed(e); }
    void operator()(const events::AdvertisingReleased&) { d.peripheral_.on_advertising_released(); }
    void operator()(const events::PipeReadable&) { d.bridge_.on_readable(); }
    void operator()(const events::ThrottleElapsed&) { d.bridge_.on_throttle_elapsed(); }
    void operator()(const events::RetryTimer& e) {
        if (e.target == events::RetryTarget::PIPE) {
            d.bridge_.on_retry();
        } else {
            d.peripheral_.on_retry(e.target);
        }
    }
    void operator()(const events::StatusTick&) {
        d.log_status();
        d.queue_.post_after(STATUS_INTERVAL_MS, events::StatusTick{});
    }
};

Daemon::Daemon(const Settings& settings,
               adapter_context::AdapterContext& adapter,
               event_queue::EventQueue& queue)
    : settings_(settings),
      adapter_(adapter),
      queue_(queue),
      flag_(settings.ready_flag_path),
      peripheral_(adapter, queue, settings),
      agent_(adapter, queue, settings),
      bridge_(settings, peripheral_, queue, flag_) {
    peripheral_.set_subscription_listener([this](bool on) { bridge_.set_subscribed(on); });
    peripheral_.set_fatal_handler([this](const std::string&) {
        if (exit_) exit_(1);
    });
}

void Daemon::set_exit_handler(ExitHandler handler) {
    exit_ = std::move(handler);
}

bool Daemon::start() {
    logging::info("[INIT] %s on %s, layout %s, %ums/frame",
                  settings_.device_name.c_str(), settings_.adapter.c_str(),
                  keycode_table::layout_name(settings_.layout), settings_.frame_interval_ms);

    if (!flag_.clear_stale()) {
        logging::error("[INIT] Stale readiness flag %s would mislead producers",
                       flag_.path().c_str());
        return false;
    }

    logging::info("[INIT] Opening FIFO...");
    if (!bridge_.open()) {
        logging::warn("[INIT] FIFO not available yet, retrying in background");
    }

    logging::info("[INIT] Registering pairing agent...");
    agent_.start();

    logging::info("[INIT] Starting BLE peripheral...");
    peripheral_.start();

    queue_.post_after(STATUS_INTERVAL_MS, events::StatusTick{});
    return true;
}

void Daemon::handle(events::Event& evt) {
    logging::debug("[LOOP] %s", events::name(evt));
    std::visit(Router{*this}, evt);
}

void Daemon::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    logging::info("[INIT] Shutting down");
    bridge_.close();
    if (!flag_.withdraw()) {
        logging::warn("[INIT] Readiness flag %s left behind", flag_.path().c_str());
    }
    adapter_.shutdown();
}

void Daemon::log_status() const {
    const fifo_bridge::Stats& s = bridge_.stats();
    logging::info("[STATUS] links=%zu subscribed=%s adv=%d queued=%zu sent=%llu frames=%llu dropped=%llu reopens=%u",
                  peripheral_.connections().size(),
                  peripheral_.subscribed() ? "yes" : "no",
                  static_cast<int>(peripheral_.advertising_state()),
                  bridge_.pending_chars(),
                  static_cast<unsigned long long>(s.chars_sent),
                  static_cast<unsigned long long>(s.frames_sent),
                  static_cast<unsigned long long>(s.chars_dropped),
                  s.reopens);
}

} // namespace bridge_daemon
