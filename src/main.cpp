#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>
#include <sdbus-c++/sdbus-c++.h>
#include "config.h"
#include "bluez_adapter.h"
#include "bridge_daemon.h"
#include "dispatcher.h"
#include "event_queue.h"
#include "logging.h"
#include "settings.h"

// ─── Signal Source ──────────────────────────────────────────────────────────

/// SIGINT/SIGTERM delivered through a signalfd so the dispatcher sees them
/// as ordinary readiness.
class SignalSource : public dispatcher::PollSource {
public:
    explicit SignalSource(dispatcher::Dispatcher& loop) : loop_(loop) {}

    ~SignalSource() override {
        if (fd_ >= 0) close(fd_);
    }

    bool open() {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        if (sigprocmask(SIG_BLOCK, &mask, nullptr) != 0) return false;
        fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
        return fd_ >= 0;
    }

    void prepare(pollfd& pfd, int& /*timeout_ms*/) override {
        pfd.fd = fd_;
        pfd.events = POLLIN;
    }

    void dispatch(short revents) override {
        if (!(revents & POLLIN)) return;
        signalfd_siginfo info;
        if (read(fd_, &info, sizeof(info)) != static_cast<ssize_t>(sizeof(info))) return;
        logging::info("[INIT] %s received, shutting down", strsignal(static_cast<int>(info.ssi_signo)));
        loop_.stop(0);
    }

private:
    dispatcher::Dispatcher& loop_;
    int fd_ = -1;
};

// ─── Entry point ────────────────────────────────────────────────────────────

int main(int argc, char** argv) {
    Settings settings = settings::defaults();
    std::string error;

    if (!settings::apply_environment(settings, error) ||
        !settings::parse_args(argc, argv, settings, error)) {
        fprintf(stderr, "%s: %s\n%s", argv[0], error.c_str(), settings::usage(argv[0]).c_str());
        return 2;
    }
    if (settings.show_help) {
        fputs(settings::usage(argv[0]).c_str(), stdout);
        return 0;
    }
    logging::set_verbose(settings.verbose);

    logging::info("[INIT] BLE keyboard bridge \"%s\" on %s, layout %s",
                  settings.device_name.c_str(), settings.adapter.c_str(),
                  keycode_table::layout_name(settings.layout));

    std::unique_ptr<sdbus::IConnection> connection;
    try {
        connection = sdbus::createSystemBusConnection();
    } catch (const sdbus::Error& e) {
        logging::error("[INIT] System bus: %s", e.getMessage().c_str());
        return 1;
    }

    event_queue::EventQueue queue;
    bluez_adapter::BluezAdapter adapter(*connection, queue, settings);
    if (!adapter.init(error)) {
        logging::error("[INIT] %s", error.c_str());
        return 1;
    }

    bridge_daemon::Daemon bridge(settings, adapter, queue);
    dispatcher::Dispatcher loop(queue, [&bridge](events::Event& evt) { bridge.handle(evt); });

    SignalSource signals(loop);
    if (!signals.open()) {
        logging::error("[INIT] signalfd: %s", strerror(errno));
        return 1;
    }

    loop.add_source(&adapter);
    loop.add_source(&bridge.bridge());
    loop.add_source(&signals);
    bridge.set_exit_handler([&loop](int code) { loop.stop(code); });

    if (!bridge.start()) {
        bridge.shutdown();
        return 1;
    }

    int code = loop.run();
    bridge.shutdown();
    logging::info("[INIT] Exit %d", code);
    return code;
}
