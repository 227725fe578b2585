#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "gatt.h"
#include "settings.h"

// ─── HID over GATT Services ─────────────────────────────────────────────────
// Characteristics of the keyboard's HID service (0x1812), Device
// Information service (0x180A) and Battery service (0x180F).

namespace hid_service {

// ─── UUIDs ──────────────────────────────────────────────────────────────────
constexpr uint16_t UUID_HID_SERVICE         = 0x1812;
constexpr uint16_t UUID_DEVICE_INFO_SERVICE = 0x180A;
constexpr uint16_t UUID_BATTERY_SERVICE     = 0x180F;

constexpr uint16_t UUID_HID_INFORMATION     = 0x2A4A;
constexpr uint16_t UUID_REPORT_MAP          = 0x2A4B;
constexpr uint16_t UUID_HID_CONTROL_POINT   = 0x2A4C;
constexpr uint16_t UUID_REPORT              = 0x2A4D;
constexpr uint16_t UUID_PROTOCOL_MODE       = 0x2A4E;
constexpr uint16_t UUID_BOOT_KBD_INPUT      = 0x2A22;
constexpr uint16_t UUID_BOOT_KBD_OUTPUT     = 0x2A32;
constexpr uint16_t UUID_REPORT_REFERENCE    = 0x2908;

constexpr uint16_t UUID_MANUFACTURER_NAME   = 0x2A29;
constexpr uint16_t UUID_MODEL_NUMBER        = 0x2A24;
constexpr uint16_t UUID_PNP_ID              = 0x2A50;
constexpr uint16_t UUID_BATTERY_LEVEL       = 0x2A19;

// Report Reference type byte
constexpr uint8_t REPORT_TYPE_INPUT  = 0x01;
constexpr uint8_t REPORT_TYPE_OUTPUT = 0x02;

/// Keyboard report map: report ID 1, modifiers, reserved byte, 5 LED
/// outputs, 6-key array.
const gatt::Bytes& report_map();

/// HID Information: bcdHID 1.11, country 0, RemoteWake | NormallyConnectable.
gatt::Bytes hid_information();

/// PnP ID with USB vendor source, little-endian fields.
gatt::Bytes pnp_id(uint16_t vid, uint16_t pid, uint16_t version);

// ─── Characteristics ────────────────────────────────────────────────────────

/// Read-only characteristic with a fixed value.
class StaticCharacteristic : public gatt::Characteristic, public gatt::Readable {
public:
    StaticCharacteristic(uint16_t uuid, std::vector<std::string> flags, gatt::Bytes value);

    gatt::Readable* readable() override { return this; }
    gatt::Bytes read_value() const override { return value_; }

private:
    gatt::Bytes value_;
};

/// Protocol Mode: 0 = boot, 1 = report (default).
class ProtocolModeCharacteristic : public gatt::Characteristic,
                                   public gatt::Readable,
                                   public gatt::Writable {
public:
    ProtocolModeCharacteristic();

    gatt::Readable* readable() override { return this; }
    gatt::Writable* writable() override { return this; }
    gatt::Bytes read_value() const override { return {mode_}; }
    bool write_value(const gatt::Bytes& value) override;

    uint8_t mode() const { return mode_; }
    bool boot_mode() const;

private:
    uint8_t mode_;
};

/// HID Control Point: 0 = suspend, 1 = exit suspend.
class ControlPointCharacteristic : public gatt::Characteristic, public gatt::Writable {
public:
    ControlPointCharacteristic();

    gatt::Writable* writable() override { return this; }
    bool write_value(const gatt::Bytes& value) override;

    bool suspended() const { return suspended_; }

private:
    bool suspended_ = false;
};

/// Keyboard input report (report protocol, with Report Reference) or boot
/// keyboard input report (no descriptor).
class InputReportCharacteristic : public gatt::Characteristic,
                                  public gatt::Readable,
                                  public gatt::Notifiable,
                                  public gatt::Describable {
public:
    /// report_id 0 builds the boot input report.
    InputReportCharacteristic(uint16_t uuid, uint8_t report_id);

    gatt::Readable* readable() override { return this; }
    gatt::Notifiable* notifiable() override { return this; }
    gatt::Describable* describable() override { return this; }

    gatt::Bytes read_value() const override { return value_; }
    void set_notifying(bool on) override { notifying_ = on; }
    bool notifying() const override { return notifying_; }
    std::vector<gatt::Descriptor>& descriptors() override { return descriptors_; }
    const std::vector<gatt::Descriptor>& descriptors() const override { return descriptors_; }

    /// Latest value sent; returned by reads.
    void set_value(const gatt::Bytes& value) { value_ = value; }

private:
    gatt::Bytes value_;
    bool notifying_ = false;
    std::vector<gatt::Descriptor> descriptors_;
};

/// Keyboard LED output report (report protocol or boot).
class OutputReportCharacteristic : public gatt::Characteristic,
                                   public gatt::Readable,
                                   public gatt::Writable,
                                   public gatt::Describable {
public:
    /// report_id 0 builds the boot output report.
    OutputReportCharacteristic(uint16_t uuid, uint8_t report_id);

    gatt::Readable* readable() override { return this; }
    gatt::Writable* writable() override { return this; }
    gatt::Describable* describable() override { return this; }

    gatt::Bytes read_value() const override { return {led_mask_}; }
    bool write_value(const gatt::Bytes& value) override;
    std::vector<gatt::Descriptor>& descriptors() override { return descriptors_; }
    const std::vector<gatt::Descriptor>& descriptors() const override { return descriptors_; }

    uint8_t led_mask() const { return led_mask_; }

private:
    uint8_t led_mask_ = 0;
    std::vector<gatt::Descriptor> descriptors_;
};

class BatteryLevelCharacteristic : public gatt::Characteristic,
                                   public gatt::Readable,
                                   public gatt::Notifiable {
public:
    explicit BatteryLevelCharacteristic(uint8_t level);

    gatt::Readable* readable() override { return this; }
    gatt::Notifiable* notifiable() override { return this; }
    gatt::Bytes read_value() const override { return {level_}; }
    void set_notifying(bool on) override { notifying_ = on; }
    bool notifying() const override { return notifying_; }

private:
    uint8_t level_;
    bool notifying_ = false;
};

/// Characteristics the peripheral drives after the tree is built.
struct HidHandles {
    ProtocolModeCharacteristic* protocol_mode = nullptr;
    ControlPointCharacteristic* control_point = nullptr;
    InputReportCharacteristic*  input         = nullptr;
    InputReportCharacteristic*  boot_input    = nullptr;
    OutputReportCharacteristic* output        = nullptr;
    OutputReportCharacteristic* boot_output   = nullptr;
};

/// Add the HID, Device Information and Battery services to app.
void build(const Settings& settings, gatt::Application& app, HidHandles& handles);

} // namespace hid_service
