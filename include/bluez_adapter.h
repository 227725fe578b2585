#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <sdbus-c++/sdbus-c++.h>
#include "adapter_context.h"
#include "dispatcher.h"
#include "event_queue.h"
#include "gatt.h"
#include "settings.h"

// ─── BlueZ Adapter ──────────────────────────────────────────────────────────
// AdapterContext over BlueZ's D-Bus API. Exports the GATT application,
// advertisement and agent objects, turns BlueZ callbacks and device
// property changes into dispatcher events, and services the bus
// connection from the dispatcher's poll loop.

namespace bluez_adapter {

constexpr const char* BLUEZ_SERVICE          = "org.bluez";
constexpr const char* ADAPTER_IFACE          = "org.bluez.Adapter1";
constexpr const char* DEVICE_IFACE           = "org.bluez.Device1";
constexpr const char* GATT_MANAGER_IFACE     = "org.bluez.GattManager1";
constexpr const char* GATT_SERVICE_IFACE     = "org.bluez.GattService1";
constexpr const char* GATT_CHRC_IFACE        = "org.bluez.GattCharacteristic1";
constexpr const char* GATT_DESC_IFACE        = "org.bluez.GattDescriptor1";
constexpr const char* ADV_MANAGER_IFACE      = "org.bluez.LEAdvertisingManager1";
constexpr const char* ADV_IFACE              = "org.bluez.LEAdvertisement1";
constexpr const char* AGENT_MANAGER_IFACE    = "org.bluez.AgentManager1";
constexpr const char* AGENT_IFACE            = "org.bluez.Agent1";
constexpr const char* OBJECT_MANAGER_IFACE   = "org.freedesktop.DBus.ObjectManager";
constexpr const char* PROPERTIES_IFACE       = "org.freedesktop.DBus.Properties";

using PropertyMap  = std::map<std::string, sdbus::Variant>;
using InterfaceMap = std::map<std::string, PropertyMap>;
using ManagedObjects = std::map<sdbus::ObjectPath, InterfaceMap>;

/// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF" ("" if
/// the path is not a device path).
std::string address_from_path(const std::string& path);

/// Value bytes from `offset` on; false if offset is past the end.
bool slice_from_offset(const gatt::Bytes& value, uint16_t offset, gatt::Bytes& out);

/// Choose the adapter object: the one ending in /<preferred>, else the
/// first adapter. Returns "" if none.
std::string select_adapter(const ManagedObjects& objects, const std::string& preferred);

class BluezAdapter : public adapter_context::AdapterContext, public dispatcher::PollSource {
public:
    BluezAdapter(sdbus::IConnection& connection,
                 event_queue::EventQueue& queue,
                 const Settings& settings);
    ~BluezAdapter() override;

    BluezAdapter(const BluezAdapter&) = delete;
    BluezAdapter& operator=(const BluezAdapter&) = delete;

    /// Find the adapter, watch device signals and report devices that are
    /// already connected or bonded. Returns false with error set if BlueZ
    /// is unreachable or has no adapter.
    bool init(std::string& error);

    const std::string& adapter_path() const { return adapter_path_; }

    // ─── AdapterContext ─────────────────────────────────────────────────
    bool power_on(const std::string& alias) override;
    bool set_le_only() override;
    void register_application(gatt::Application& app, adapter_context::Completion done) override;
    void start_advertising(const adapter_context::Advertisement& adv,
                           adapter_context::Completion done) override;
    void stop_advertising(adapter_context::Completion done) override;
    bool notify(gatt::Characteristic& chr, const gatt::Bytes& value) override;
    void register_agent(const std::string& capability, adapter_context::Completion done) override;
    void set_trusted(const std::string& peer, bool trusted, adapter_context::Completion done) override;
    void shutdown() override;

    // ─── PollSource ─────────────────────────────────────────────────────
    void prepare(pollfd& pfd, int& timeout_ms) override;
    void dispatch(short revents) override;

private:
    void export_application(gatt::Application& app);
    void export_characteristic(gatt::Service& svc, gatt::Characteristic& chr);
    void export_descriptor(gatt::Characteristic& chr, gatt::Descriptor& desc);
    void export_advertisement(const adapter_context::Advertisement& adv);
    void export_agent();

    InterfaceMap service_properties(const gatt::Service& svc) const;
    InterfaceMap characteristic_properties(const gatt::Service& svc, gatt::Characteristic& chr) const;
    InterfaceMap descriptor_properties(const gatt::Characteristic& chr, const gatt::Descriptor& desc) const;

    void on_device_properties(sdbus::Message& msg);
    void on_interfaces_removed(sdbus::Message& msg);
    void report_device(const std::string& path, const PropertyMap& props, bool initial);

    sdbus::IProxy& device_proxy(const std::string& path);

    sdbus::IConnection&      connection_;
    event_queue::EventQueue& queue_;
    const Settings&          settings_;

    std::string adapter_path_;
    std::unique_ptr<sdbus::IProxy> adapter_proxy_;
    std::unique_ptr<sdbus::IProxy> agent_manager_;
    std::map<std::string, std::unique_ptr<sdbus::IProxy>> device_proxies_;

    gatt::Application*                          app_ = nullptr;
    std::unique_ptr<sdbus::IObject>             app_root_;
    std::vector<std::unique_ptr<sdbus::IObject>> gatt_objects_;
    std::map<std::string, sdbus::IObject*>      chr_objects_;

    adapter_context::Advertisement  adv_;
    std::unique_ptr<sdbus::IObject> adv_object_;
    bool                            adv_registered_ = false;

    std::unique_ptr<sdbus::IObject> agent_object_;
    bool                            agent_registered_ = false;
    bool                            app_registered_   = false;

    std::set<std::string> connected_;
    std::set<std::string> bonded_;

    sdbus::Slot properties_slot_;
    sdbus::Slot removed_slot_;
};

} // namespace bluez_adapter
