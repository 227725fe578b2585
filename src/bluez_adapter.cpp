#include "bluez_adapter.h"
#include "config.h"
#include "logging.h"
#include "mgmt_control.h"

#include <algorithm>
#include <ctime>
#include <limits>

namespace bluez_adapter {

// ─── Helpers ────────────────────────────────────────────────────────────────

std::string address_from_path(const std::string& path) {
    size_t pos = path.rfind("/dev_");
    if (pos == std::string::npos) return "";

    std::string addr = path.substr(pos + 5);
    if (addr.size() != 17) return "";
    for (char& c : addr) {
        if (c == '_') c = ':';
    }
    return addr;
}

bool slice_from_offset(const gatt::Bytes& value, uint16_t offset, gatt::Bytes& out) {
    if (offset > value.size()) return false;
    out.assign(value.begin() + offset, value.end());
    return true;
}

std::string select_adapter(const ManagedObjects& objects, const std::string& preferred) {
    std::string suffix = "/" + preferred;
    std::string first;
    for (const auto& obj : objects) {
        if (!obj.second.count(ADAPTER_IFACE)) continue;
        const std::string& path = obj.first;
        if (path.size() >= suffix.size() &&
            path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return path;
        }
        if (first.empty()) first = path;
    }
    return first;
}

static adapter_context::AdapterError to_adapter_error(const sdbus::Error& e) {
    return {e.getName(), e.getMessage()};
}

static gatt::Bytes read_with_options(const gatt::Bytes& value, const PropertyMap& options) {
    uint16_t offset = 0;
    auto it = options.find("offset");
    if (it != options.end()) offset = it->second.get<uint16_t>();

    gatt::Bytes out;
    if (!slice_from_offset(value, offset, out)) {
        throw sdbus::Error("org.bluez.Error.InvalidOffset", "Offset past end of value");
    }
    return out;
}

static bool prop_bool(const PropertyMap& props, const char* name, bool& out) {
    auto it = props.find(name);
    if (it == props.end() || !it->second.containsValueOfType<bool>()) return false;
    out = it->second.get<bool>();
    return true;
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

BluezAdapter::BluezAdapter(sdbus::IConnection& connection,
                           event_queue::EventQueue& queue,
                           const Settings& settings)
    : connection_(connection), queue_(queue), settings_(settings) {}

BluezAdapter::~BluezAdapter() {
    shutdown();
}

bool BluezAdapter::init(std::string& error) {
    ManagedObjects objects;
    try {
        auto root = sdbus::createProxy(connection_, BLUEZ_SERVICE, "/");
        root->callMethod("GetManagedObjects").onInterface(OBJECT_MANAGER_IFACE).storeResultsTo(objects);
    } catch (const sdbus::Error& e) {
        error = "BlueZ not reachable: " + e.getMessage();
        return false;
    }

    adapter_path_ = select_adapter(objects, settings_.adapter);
    if (adapter_path_.empty()) {
        error = "No Bluetooth adapter found in BlueZ";
        return false;
    }
    logging::info("[BLE] Using adapter %s", adapter_path_.c_str());

    try {
        adapter_proxy_ = sdbus::createProxy(connection_, BLUEZ_SERVICE, adapter_path_);
        agent_manager_ = sdbus::createProxy(connection_, BLUEZ_SERVICE, "/org/bluez");

        properties_slot_ = connection_.addMatch(
            "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',"
            "member='PropertiesChanged',arg0='org.bluez.Device1'",
            [this](sdbus::Message& msg) { on_device_properties(msg); });
        removed_slot_ = connection_.addMatch(
            "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',"
            "member='InterfacesRemoved'",
            [this](sdbus::Message& msg) { on_interfaces_removed(msg); });
    } catch (const sdbus::Error& e) {
        error = "D-Bus setup failed: " + e.getMessage();
        return false;
    }

    // Links that came up before we started.
    std::string prefix = adapter_path_ + "/dev_";
    for (const auto& obj : objects) {
        const std::string& path = obj.first;
        auto dev = obj.second.find(DEVICE_IFACE);
        if (dev == obj.second.end() || path.compare(0, prefix.size(), prefix) != 0) continue;
        report_device(path, dev->second, true);
    }
    return true;
}

void BluezAdapter::shutdown() {
    auto quiet = [](const char* what, const sdbus::Error& e) {
        logging::debug("[BLE] %s: %s", what, e.getMessage().c_str());
    };

    if (adv_registered_ && adapter_proxy_) {
        try {
            adapter_proxy_->callMethod("UnregisterAdvertisement").onInterface(ADV_MANAGER_IFACE)
                .withArguments(sdbus::ObjectPath(ADVERTISEMENT_PATH));
        } catch (const sdbus::Error& e) {
            quiet("UnregisterAdvertisement", e);
        }
        adv_registered_ = false;
    }
    if (app_registered_ && adapter_proxy_) {
        try {
            adapter_proxy_->callMethod("UnregisterApplication").onInterface(GATT_MANAGER_IFACE)
                .withArguments(sdbus::ObjectPath(GATT_APP_ROOT));
        } catch (const sdbus::Error& e) {
            quiet("UnregisterApplication", e);
        }
        app_registered_ = false;
    }
    if (agent_registered_ && agent_manager_) {
        try {
            agent_manager_->callMethod("UnregisterAgent").onInterface(AGENT_MANAGER_IFACE)
                .withArguments(sdbus::ObjectPath(AGENT_PATH));
        } catch (const sdbus::Error& e) {
            quiet("UnregisterAgent", e);
        }
        agent_registered_ = false;
    }

    properties_slot_.reset();
    removed_slot_.reset();
    chr_objects_.clear();
    gatt_objects_.clear();
    app_root_.reset();
    adv_object_.reset();
    agent_object_.reset();
    device_proxies_.clear();
    app_ = nullptr;
}

// ─── Adapter setup ──────────────────────────────────────────────────────────

bool BluezAdapter::power_on(const std::string& alias) {
    if (!adapter_proxy_) return false;
    try {
        adapter_proxy_->setProperty("Powered").onInterface(ADAPTER_IFACE).toValue(true);
        adapter_proxy_->setProperty("Pairable").onInterface(ADAPTER_IFACE).toValue(true);
        adapter_proxy_->setProperty("Discoverable").onInterface(ADAPTER_IFACE).toValue(true);
        adapter_proxy_->setProperty("PairableTimeout").onInterface(ADAPTER_IFACE).toValue(uint32_t{0});
        adapter_proxy_->setProperty("DiscoverableTimeout").onInterface(ADAPTER_IFACE).toValue(uint32_t{0});
        if (!alias.empty()) {
            adapter_proxy_->setProperty("Alias").onInterface(ADAPTER_IFACE).toValue(alias);
        }
    } catch (const sdbus::Error& e) {
        logging::warn("[BLE] Adapter setup: %s: %s", e.getName().c_str(), e.getMessage().c_str());
        return false;
    }
    logging::info("[BLE] Adapter powered, pairable and discoverable as \"%s\"", alias.c_str());
    return true;
}

bool BluezAdapter::set_le_only() {
    std::string name = adapter_path_.substr(adapter_path_.rfind('/') + 1);
    uint16_t index = 0;
    if (!mgmt_control::parse_index(name, index)) {
        logging::warn("[BLE] Cannot derive controller index from %s", adapter_path_.c_str());
        return false;
    }

    std::string error;
    if (!mgmt_control::set_le_only(index, error)) {
        logging::warn("[BLE] LE-only setup failed: %s", error.c_str());
        return false;
    }
    return true;
}

// ─── GATT application ───────────────────────────────────────────────────────

InterfaceMap BluezAdapter::service_properties(const gatt::Service& svc) const {
    PropertyMap props;
    props.emplace("UUID", sdbus::Variant(svc.uuid()));
    props.emplace("Primary", sdbus::Variant(svc.primary()));
    props.emplace("Includes", sdbus::Variant(std::vector<sdbus::ObjectPath>{}));
    return {{GATT_SERVICE_IFACE, props}};
}

InterfaceMap BluezAdapter::characteristic_properties(const gatt::Service& svc,
                                                     gatt::Characteristic& chr) const {
    std::vector<sdbus::ObjectPath> descs;
    if (gatt::Describable* d = chr.describable()) {
        for (const auto& desc : d->descriptors()) descs.emplace_back(desc.path);
    }

    PropertyMap props;
    props.emplace("UUID", sdbus::Variant(chr.uuid()));
    props.emplace("Service", sdbus::Variant(sdbus::ObjectPath(svc.path())));
    props.emplace("Flags", sdbus::Variant(chr.flags()));
    props.emplace("Descriptors", sdbus::Variant(descs));
    if (gatt::Readable* r = chr.readable()) {
        props.emplace("Value", sdbus::Variant(r->read_value()));
    }
    return {{GATT_CHRC_IFACE, props}};
}

InterfaceMap BluezAdapter::descriptor_properties(const gatt::Characteristic& chr,
                                                 const gatt::Descriptor& desc) const {
    PropertyMap props;
    props.emplace("UUID", sdbus::Variant(desc.uuid));
    props.emplace("Characteristic", sdbus::Variant(sdbus::ObjectPath(chr.path())));
    props.emplace("Flags", sdbus::Variant(desc.flags));
    props.emplace("Value", sdbus::Variant(desc.value));
    return {{GATT_DESC_IFACE, props}};
}

void BluezAdapter::export_application(gatt::Application& app) {
    app_ = &app;

    app_root_ = sdbus::createObject(connection_, app.root());
    app_root_->registerMethod("GetManagedObjects")
        .onInterface(OBJECT_MANAGER_IFACE)
        .withOutputParamNames("objects")
        .implementedAs([this]() {
            ManagedObjects managed;
            if (!app_) return managed;
            for (const auto& svc : app_->services()) {
                managed.emplace(sdbus::ObjectPath(svc->path()), service_properties(*svc));
                for (const auto& chr : svc->characteristics()) {
                    managed.emplace(sdbus::ObjectPath(chr->path()), characteristic_properties(*svc, *chr));
                    if (gatt::Describable* d = chr->describable()) {
                        for (const auto& desc : d->descriptors()) {
                            managed.emplace(sdbus::ObjectPath(desc.path), descriptor_properties(*chr, desc));
                        }
                    }
                }
            }
            return managed;
        });
    app_root_->finishRegistration();

    for (const auto& svc_ptr : app.services()) {
        gatt::Service& svc = *svc_ptr;
        auto obj = sdbus::createObject(connection_, svc.path());
        obj->registerProperty("UUID").onInterface(GATT_SERVICE_IFACE)
            .withGetter([&svc]() { return svc.uuid(); });
        obj->registerProperty("Primary").onInterface(GATT_SERVICE_IFACE)
            .withGetter([&svc]() { return svc.primary(); });
        obj->registerProperty("Includes").onInterface(GATT_SERVICE_IFACE)
            .withGetter([]() { return std::vector<sdbus::ObjectPath>{}; });
        obj->finishRegistration();
        gatt_objects_.push_back(std::move(obj));

        for (const auto& chr : svc.characteristics()) {
            export_characteristic(svc, *chr);
        }
    }
}

void BluezAdapter::export_characteristic(gatt::Service& svc, gatt::Characteristic& chr) {
    gatt::Characteristic* c = &chr;
    auto obj = sdbus::createObject(connection_, chr.path());

    obj->registerMethod("ReadValue")
        .onInterface(GATT_CHRC_IFACE)
        .withInputParamNames("options")
        .withOutputParamNames("value")
        .implementedAs([c](const PropertyMap& options) {
            gatt::Readable* r = c->readable();
            if (!r) throw sdbus::Error("org.bluez.Error.NotPermitted", "Read not permitted");
            return read_with_options(r->read_value(), options);
        });

    obj->registerMethod("WriteValue")
        .onInterface(GATT_CHRC_IFACE)
        .withInputParamNames("value", "options")
        .implementedAs([c](const std::vector<uint8_t>& value, const PropertyMap& /*options*/) {
            gatt::Writable* w = c->writable();
            if (!w) throw sdbus::Error("org.bluez.Error.NotPermitted", "Write not permitted");
            if (!w->write_value(value)) {
                throw sdbus::Error("org.freedesktop.DBus.Error.InvalidArgs", "Invalid value");
            }
        });

    obj->registerMethod("StartNotify")
        .onInterface(GATT_CHRC_IFACE)
        .implementedAs([this, c]() {
            if (!c->notifiable()) throw sdbus::Error("org.bluez.Error.NotSupported", "Notify not supported");
            queue_.post(events::CccdChanged{c->path(), true});
        });

    obj->registerMethod("StopNotify")
        .onInterface(GATT_CHRC_IFACE)
        .implementedAs([this, c]() {
            if (!c->notifiable()) throw sdbus::Error("org.bluez.Error.NotSupported", "Notify not supported");
            queue_.post(events::CccdChanged{c->path(), false});
        });

    obj->registerProperty("UUID").onInterface(GATT_CHRC_IFACE)
        .withGetter([c]() { return c->uuid(); });
    obj->registerProperty("Service").onInterface(GATT_CHRC_IFACE)
        .withGetter([&svc]() { return sdbus::ObjectPath(svc.path()); });
    obj->registerProperty("Flags").onInterface(GATT_CHRC_IFACE)
        .withGetter([c]() { return c->flags(); });
    obj->registerProperty("Descriptors").onInterface(GATT_CHRC_IFACE)
        .withGetter([c]() {
            std::vector<sdbus::ObjectPath> paths;
            if (gatt::Describable* d = c->describable()) {
                for (const auto& desc : d->descriptors()) paths.emplace_back(desc.path);
            }
            return paths;
        });
    obj->finishRegistration();

    chr_objects_[chr.path()] = obj.get();
    gatt_objects_.push_back(std::move(obj));

    if (gatt::Describable* d = chr.describable()) {
        for (auto& desc : d->descriptors()) export_descriptor(chr, desc);
    }
}

void BluezAdapter::export_descriptor(gatt::Characteristic& chr, gatt::Descriptor& desc) {
    const gatt::Descriptor* d = &desc;
    const gatt::Characteristic* c = &chr;
    auto obj = sdbus::createObject(connection_, desc.path);

    obj->registerMethod("ReadValue")
        .onInterface(GATT_DESC_IFACE)
        .withInputParamNames("options")
        .withOutputParamNames("value")
        .implementedAs([d](const PropertyMap& options) { return read_with_options(d->value, options); });

    obj->registerProperty("UUID").onInterface(GATT_DESC_IFACE)
        .withGetter([d]() { return d->uuid; });
    obj->registerProperty("Characteristic").onInterface(GATT_DESC_IFACE)
        .withGetter([c]() { return sdbus::ObjectPath(c->path()); });
    obj->registerProperty("Flags").onInterface(GATT_DESC_IFACE)
        .withGetter([d]() { return d->flags; });
    obj->finishRegistration();
    gatt_objects_.push_back(std::move(obj));
}

void BluezAdapter::register_application(gatt::Application& app, adapter_context::Completion done) {
    try {
        if (!app_root_) export_application(app);

        adapter_proxy_->callMethodAsync("RegisterApplication")
            .onInterface(GATT_MANAGER_IFACE)
            .withArguments(sdbus::ObjectPath(app.root()), PropertyMap{})
            .uponReplyInvoke([this, done](const sdbus::Error* error) {
                if (error) {
                    adapter_context::AdapterError err = to_adapter_error(*error);
                    done(&err);
                    return;
                }
                app_registered_ = true;
                done(nullptr);
            });
    } catch (const sdbus::Error& e) {
        adapter_context::AdapterError err = to_adapter_error(e);
        done(&err);
    }
}

bool BluezAdapter::notify(gatt::Characteristic& chr, const gatt::Bytes& value) {
    auto it = chr_objects_.find(chr.path());
    if (it == chr_objects_.end()) return false;

    try {
        auto signal = it->second->createSignal(PROPERTIES_IFACE, "PropertiesChanged");
        PropertyMap changed;
        changed.emplace("Value", sdbus::Variant(value));
        signal << std::string(GATT_CHRC_IFACE) << changed << std::vector<std::string>{};
        it->second->emitSignal(signal);
    } catch (const sdbus::Error& e) {
        logging::warn("[BLE] Notify on %s failed: %s", chr.path().c_str(), e.getMessage().c_str());
        return false;
    }
    return true;
}

// ─── Advertising ────────────────────────────────────────────────────────────

void BluezAdapter::export_advertisement(const adapter_context::Advertisement& adv) {
    adv_ = adv;
    adv_object_ = sdbus::createObject(connection_, ADVERTISEMENT_PATH);

    adv_object_->registerMethod("Release")
        .onInterface(ADV_IFACE)
        .implementedAs([this]() {
            adv_registered_ = false;
            queue_.post(events::AdvertisingReleased{});
        });

    adv_object_->registerProperty("Type").onInterface(ADV_IFACE)
        .withGetter([]() { return std::string("peripheral"); });
    adv_object_->registerProperty("ServiceUUIDs").onInterface(ADV_IFACE)
        .withGetter([this]() { return adv_.service_uuids; });
    adv_object_->registerProperty("LocalName").onInterface(ADV_IFACE)
        .withGetter([this]() { return adv_.local_name; });
    adv_object_->registerProperty("Appearance").onInterface(ADV_IFACE)
        .withGetter([this]() { return adv_.appearance; });
    adv_object_->registerProperty("Discoverable").onInterface(ADV_IFACE)
        .withGetter([]() { return true; });
    adv_object_->finishRegistration();
}

void BluezAdapter::start_advertising(const adapter_context::Advertisement& adv,
                                     adapter_context::Completion done) {
    try {
        if (!adv_object_) export_advertisement(adv);

        adapter_proxy_->callMethodAsync("RegisterAdvertisement")
            .onInterface(ADV_MANAGER_IFACE)
            .withArguments(sdbus::ObjectPath(ADVERTISEMENT_PATH), PropertyMap{})
            .uponReplyInvoke([this, done](const sdbus::Error* error) {
                if (error) {
                    adapter_context::AdapterError err = to_adapter_error(*error);
                    done(&err);
                    return;
                }
                adv_registered_ = true;
                done(nullptr);
            });
    } catch (const sdbus::Error& e) {
        adapter_context::AdapterError err = to_adapter_error(e);
        done(&err);
    }
}

void BluezAdapter::stop_advertising(adapter_context::Completion done) {
    try {
        adapter_proxy_->callMethodAsync("UnregisterAdvertisement")
            .onInterface(ADV_MANAGER_IFACE)
            .withArguments(sdbus::ObjectPath(ADVERTISEMENT_PATH))
            .uponReplyInvoke([this, done](const sdbus::Error* error) {
                adv_registered_ = false;
                if (error) {
                    adapter_context::AdapterError err = to_adapter_error(*error);
                    done(&err);
                    return;
                }
                done(nullptr);
            });
    } catch (const sdbus::Error& e) {
        adapter_context::AdapterError err = to_adapter_error(e);
        done(&err);
    }
}

// ─── Agent ──────────────────────────────────────────────────────────────────

// BlueZ waits for the reply; the agent answers once the request has been
// dispatched and the peer is trusted.
static events::Responder make_responder(sdbus::Result<>&& result) {
    auto shared = std::make_shared<sdbus::Result<>>(std::move(result));
    return [shared](bool accept) {
        try {
            if (accept) {
                shared->returnResults();
            } else {
                shared->returnError(sdbus::Error("org.bluez.Error.Rejected", "Rejected"));
            }
        } catch (const sdbus::Error& e) {
            logging::warn("[AGENT] Reply failed: %s", e.getMessage().c_str());
        }
    };
}

void BluezAdapter::export_agent() {
    agent_object_ = sdbus::createObject(connection_, AGENT_PATH);

    agent_object_->registerMethod("Release")
        .onInterface(AGENT_IFACE)
        .implementedAs([this]() {
            agent_registered_ = false;
            queue_.post(events::AgentReleased{});
        });

    agent_object_->registerMethod("RequestPinCode")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device")
        .withOutputParamNames("pincode")
        .implementedAs([](const sdbus::ObjectPath& device) {
            logging::info("[AGENT] RequestPinCode %s", device.c_str());
            return std::string("0000");
        });

    agent_object_->registerMethod("DisplayPinCode")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device", "pincode")
        .implementedAs([](const sdbus::ObjectPath& device, const std::string& pincode) {
            logging::info("[AGENT] DisplayPinCode %s %s", device.c_str(), pincode.c_str());
        });

    agent_object_->registerMethod("RequestPasskey")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device")
        .withOutputParamNames("passkey")
        .implementedAs([](const sdbus::ObjectPath& device) {
            logging::info("[AGENT] RequestPasskey %s", device.c_str());
            return AGENT_FIXED_PASSKEY;
        });

    agent_object_->registerMethod("DisplayPasskey")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device", "passkey", "entered")
        .implementedAs([](const sdbus::ObjectPath& device, uint32_t passkey, uint16_t entered) {
            logging::info("[AGENT] DisplayPasskey %s %06u (%u entered)", device.c_str(), passkey, entered);
        });

    agent_object_->registerMethod("RequestConfirmation")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device", "passkey")
        .implementedAs([this](sdbus::Result<>&& result, sdbus::ObjectPath device, uint32_t passkey) {
            queue_.post(events::ConfirmationRequested{
                device, passkey, make_responder(std::move(result)), events::TimePoint::clock::now()});
        });

    agent_object_->registerMethod("RequestAuthorization")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device")
        .implementedAs([this](sdbus::Result<>&& result, sdbus::ObjectPath device) {
            queue_.post(events::AuthorizationRequested{
                device, "", make_responder(std::move(result)), events::TimePoint::clock::now()});
        });

    agent_object_->registerMethod("AuthorizeService")
        .onInterface(AGENT_IFACE)
        .withInputParamNames("device", "uuid")
        .implementedAs([this](sdbus::Result<>&& result, sdbus::ObjectPath device, std::string uuid) {
            queue_.post(events::AuthorizationRequested{
                device, uuid, make_responder(std::move(result)), events::TimePoint::clock::now()});
        });

    agent_object_->registerMethod("Cancel")
        .onInterface(AGENT_IFACE)
        .implementedAs([this]() { queue_.post(events::PairingCancelled{}); });

    agent_object_->finishRegistration();
}

void BluezAdapter::register_agent(const std::string& capability, adapter_context::Completion done) {
    auto fail = [done](const sdbus::Error& e) {
        adapter_context::AdapterError err = to_adapter_error(e);
        done(&err);
    };
    auto request_default = [this, done, fail]() {
        try {
            agent_manager_->callMethodAsync("RequestDefaultAgent")
                .onInterface(AGENT_MANAGER_IFACE)
                .withArguments(sdbus::ObjectPath(AGENT_PATH))
                .uponReplyInvoke([this, done, fail](const sdbus::Error* error) {
                    if (error) {
                        fail(*error);
                        return;
                    }
                    agent_registered_ = true;
                    done(nullptr);
                });
        } catch (const sdbus::Error& e) {
            fail(e);
        }
    };
    auto register_agent = [this, capability, fail, request_default]() {
        try {
            agent_manager_->callMethodAsync("RegisterAgent")
                .onInterface(AGENT_MANAGER_IFACE)
                .withArguments(sdbus::ObjectPath(AGENT_PATH), capability)
                .uponReplyInvoke([fail, request_default](const sdbus::Error* error) {
                    if (error && error->getName() != "org.bluez.Error.AlreadyExists") {
                        fail(*error);
                        return;
                    }
                    request_default();
                });
        } catch (const sdbus::Error& e) {
            fail(e);
        }
    };

    try {
        if (!agent_object_) export_agent();

        // Clear a registration left from an earlier Release; errors expected.
        agent_manager_->callMethodAsync("UnregisterAgent")
            .onInterface(AGENT_MANAGER_IFACE)
            .withArguments(sdbus::ObjectPath(AGENT_PATH))
            .uponReplyInvoke([register_agent](const sdbus::Error*) { register_agent(); });
    } catch (const sdbus::Error& e) {
        fail(e);
    }
}

// ─── Devices ────────────────────────────────────────────────────────────────

sdbus::IProxy& BluezAdapter::device_proxy(const std::string& path) {
    auto it = device_proxies_.find(path);
    if (it == device_proxies_.end()) {
        it = device_proxies_.emplace(path, sdbus::createProxy(connection_, BLUEZ_SERVICE, path)).first;
    }
    return *it->second;
}

void BluezAdapter::set_trusted(const std::string& peer, bool trusted, adapter_context::Completion done) {
    try {
        device_proxy(peer).callMethodAsync("Set")
            .onInterface(PROPERTIES_IFACE)
            .withArguments(std::string(DEVICE_IFACE), std::string("Trusted"), sdbus::Variant(trusted))
            .uponReplyInvoke([done](const sdbus::Error* error) {
                if (error) {
                    adapter_context::AdapterError err = to_adapter_error(*error);
                    done(&err);
                    return;
                }
                done(nullptr);
            });
    } catch (const sdbus::Error& e) {
        adapter_context::AdapterError err = to_adapter_error(e);
        done(&err);
    }
}

void BluezAdapter::report_device(const std::string& path, const PropertyMap& props, bool initial) {
    bool paired = false;
    bool bonded = false;
    bool has_paired = prop_bool(props, "Paired", paired);
    bool has_bonded = prop_bool(props, "Bonded", bonded);
    if (has_paired || has_bonded) {
        bool now_bonded = has_bonded ? (bonded || paired) : paired;
        bool was_bonded = bonded_.count(path) > 0;
        if (now_bonded != was_bonded) {
            if (now_bonded) bonded_.insert(path); else bonded_.erase(path);
            queue_.post(events::BondingChanged{path, now_bonded});
        }
    }

    bool connected = false;
    if (prop_bool(props, "Connected", connected)) {
        bool was_connected = connected_.count(path) > 0;
        if (connected && !was_connected) {
            connected_.insert(path);
            std::string address = address_from_path(path);
            auto it = props.find("Address");
            if (it != props.end() && it->second.containsValueOfType<std::string>()) {
                address = it->second.get<std::string>();
            }
            if (initial) logging::info("[BLE] %s already connected", address.c_str());
            queue_.post(events::Connected{path, address, bonded_.count(path) > 0});
        } else if (!connected && was_connected) {
            connected_.erase(path);
            device_proxies_.erase(path);
            queue_.post(events::Disconnected{path});
        }
    }
}

void BluezAdapter::on_device_properties(sdbus::Message& msg) {
    std::string path = msg.getPath() ? msg.getPath() : "";
    if (path.compare(0, adapter_path_.size() + 1, adapter_path_ + "/") != 0) return;

    std::string iface;
    PropertyMap changed;
    std::vector<std::string> invalidated;
    try {
        msg >> iface >> changed >> invalidated;
    } catch (const sdbus::Error& e) {
        logging::warn("[BLE] Malformed PropertiesChanged on %s: %s", path.c_str(), e.getMessage().c_str());
        return;
    }
    if (iface != DEVICE_IFACE) return;
    report_device(path, changed, false);
}

void BluezAdapter::on_interfaces_removed(sdbus::Message& msg) {
    sdbus::ObjectPath path;
    std::vector<std::string> ifaces;
    try {
        msg >> path >> ifaces;
    } catch (const sdbus::Error& e) {
        logging::warn("[BLE] Malformed InterfacesRemoved: %s", e.getMessage().c_str());
        return;
    }

    bool device_removed = false;
    for (const auto& i : ifaces) {
        if (i == DEVICE_IFACE) device_removed = true;
    }
    if (!device_removed) return;

    // Removing a device drops both the link and the bond.
    PropertyMap gone;
    gone.emplace("Connected", sdbus::Variant(false));
    gone.emplace("Paired", sdbus::Variant(false));
    gone.emplace("Bonded", sdbus::Variant(false));
    report_device(path, gone, false);
}

// ─── Poll loop integration ──────────────────────────────────────────────────

void BluezAdapter::prepare(pollfd& pfd, int& timeout_ms) {
    sdbus::IConnection::PollData data;
    try {
        data = connection_.getEventLoopPollData();
    } catch (const sdbus::Error& e) {
        logging::error("[BLE] D-Bus poll data: %s", e.getMessage().c_str());
        return;
    }
    pfd.fd = data.fd;
    pfd.events = data.events;

    // timeout_usec is absolute CLOCK_MONOTONIC time, max = no timeout.
    if (data.timeout_usec == std::numeric_limits<uint64_t>::max()) return;

    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    uint64_t now_usec = static_cast<uint64_t>(ts.tv_sec) * 1000000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000ULL;
    int wait_ms = data.timeout_usec <= now_usec
                      ? 0
                      : static_cast<int>(std::min<uint64_t>((data.timeout_usec - now_usec + 999) / 1000, 60000));
    if (timeout_ms < 0 || wait_ms < timeout_ms) timeout_ms = wait_ms;
}

void BluezAdapter::dispatch(short /*revents*/) {
    try {
        while (connection_.processPendingRequest()) {
        }
    } catch (const sdbus::Error& e) {
        logging::error("[BLE] D-Bus processing: %s", e.getMessage().c_str());
    }
}

} // namespace bluez_adapter
