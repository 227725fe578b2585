#pragma once

#include <deque>
#include <string>
#include <utility>
#include <vector>
#include "adapter_context.h"
#include "gatt.h"

// Recording AdapterContext for tests. Completions run synchronously with
// the next queued error (or success when the queue is empty). Trust
// completions can be held back to model a slow BlueZ reply.
class FakeAdapter : public adapter_context::AdapterContext {
public:
    using Error = adapter_context::AdapterError;

    struct NotifyCall {
        std::string path;
        gatt::Bytes value;
    };

    bool power_ok   = true;
    bool le_only_ok = true;
    bool notify_ok  = true;
    bool defer_trust = false;

    std::deque<Error> register_errors;
    std::deque<Error> advertise_errors;
    std::deque<Error> agent_errors;
    std::deque<Error> trust_errors;

    int power_calls    = 0;
    int le_only_calls  = 0;
    int register_calls = 0;
    int advertise_calls = 0;
    int stop_calls     = 0;
    int agent_calls    = 0;
    int shutdown_calls = 0;

    std::string                                  last_capability;
    std::string                                  last_alias;
    std::vector<std::pair<std::string, bool>>    trusted;
    std::vector<NotifyCall>                      notifications;
    std::vector<adapter_context::Completion>     held_trust;

    bool power_on(const std::string& alias) override {
        ++power_calls;
        last_alias = alias;
        return power_ok;
    }

    bool set_le_only() override {
        ++le_only_calls;
        return le_only_ok;
    }

    void register_application(gatt::Application&, adapter_context::Completion done) override {
        ++register_calls;
        complete(register_errors, done);
    }

    void start_advertising(const adapter_context::Advertisement&, adapter_context::Completion done) override {
        ++advertise_calls;
        complete(advertise_errors, done);
    }

    void stop_advertising(adapter_context::Completion done) override {
        ++stop_calls;
        done(nullptr);
    }

    bool notify(gatt::Characteristic& chr, const gatt::Bytes& value) override {
        if (!notify_ok) return false;
        notifications.push_back({chr.path(), value});
        return true;
    }

    void register_agent(const std::string& capability, adapter_context::Completion done) override {
        ++agent_calls;
        last_capability = capability;
        complete(agent_errors, done);
    }

    void set_trusted(const std::string& peer, bool on, adapter_context::Completion done) override {
        trusted.emplace_back(peer, on);
        if (defer_trust) {
            held_trust.push_back(done);
            return;
        }
        complete(trust_errors, done);
    }

    void shutdown() override { ++shutdown_calls; }

    /// Deliver a held trust completion.
    void release_trust(size_t i, const Error* error = nullptr) {
        held_trust.at(i)(error);
    }

private:
    static void complete(std::deque<Error>& errors, const adapter_context::Completion& done) {
        if (errors.empty()) {
            done(nullptr);
            return;
        }
        Error err = errors.front();
        errors.pop_front();
        done(&err);
    }
};
