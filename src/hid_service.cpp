#include "hid_service.h"
#include "config.h"
#include "logging.h"
#include "report_encoder.h"

namespace hid_service {

// ─── Static values ──────────────────────────────────────────────────────────

const gatt::Bytes& report_map() {
    static const gatt::Bytes map = {
        0x05, 0x01,        // Usage Page (Generic Desktop)
        0x09, 0x06,        // Usage (Keyboard)
        0xA1, 0x01,        // Collection (Application)
        0x85, KEYBOARD_REPORT_ID,
        0x05, 0x07,        //   Usage Page (Key Codes)
        0x19, 0xE0,        //   Usage Minimum (224)
        0x29, 0xE7,        //   Usage Maximum (231)
        0x15, 0x00,        //   Logical Minimum (0)
        0x25, 0x01,        //   Logical Maximum (1)
        0x75, 0x01,        //   Report Size (1)
        0x95, 0x08,        //   Report Count (8)
        0x81, 0x02,        //   Input (Data, Var, Abs): modifier byte
        0x95, 0x01,        //   Report Count (1)
        0x75, 0x08,        //   Report Size (8)
        0x81, 0x01,        //   Input (Const): reserved byte
        0x95, 0x05,        //   Report Count (5)
        0x75, 0x01,        //   Report Size (1)
        0x05, 0x08,        //   Usage Page (LEDs)
        0x19, 0x01,        //   Usage Minimum (Num Lock)
        0x29, 0x05,        //   Usage Maximum (Kana)
        0x91, 0x02,        //   Output (Data, Var, Abs): LED report
        0x95, 0x01,        //   Report Count (1)
        0x75, 0x03,        //   Report Size (3)
        0x91, 0x01,        //   Output (Const): LED padding
        0x95, 0x06,        //   Report Count (6)
        0x75, 0x08,        //   Report Size (8)
        0x15, 0x00,        //   Logical Minimum (0)
        0x25, 0x65,        //   Logical Maximum (101)
        0x05, 0x07,        //   Usage Page (Key Codes)
        0x19, 0x00,        //   Usage Minimum (0)
        0x29, 0x65,        //   Usage Maximum (101)
        0x81, 0x00,        //   Input (Data, Array): key array
        0xC0               // End Collection
    };
    return map;
}

gatt::Bytes hid_information() {
    return {0x11, 0x01, 0x00, 0x03};
}

gatt::Bytes pnp_id(uint16_t vid, uint16_t pid, uint16_t version) {
    return {
        0x02,  // vendor ID source: USB-IF
        static_cast<uint8_t>(vid & 0xFF), static_cast<uint8_t>(vid >> 8),
        static_cast<uint8_t>(pid & 0xFF), static_cast<uint8_t>(pid >> 8),
        static_cast<uint8_t>(version & 0xFF), static_cast<uint8_t>(version >> 8),
    };
}

static gatt::Descriptor report_reference(uint8_t report_id, uint8_t type) {
    return {gatt::uuid16(UUID_REPORT_REFERENCE), {"read"}, {report_id, type}, ""};
}

// ─── Characteristics ────────────────────────────────────────────────────────

StaticCharacteristic::StaticCharacteristic(uint16_t uuid, std::vector<std::string> flags,
                                           gatt::Bytes value)
    : gatt::Characteristic(gatt::uuid16(uuid), std::move(flags)), value_(std::move(value)) {}

ProtocolModeCharacteristic::ProtocolModeCharacteristic()
    : gatt::Characteristic(gatt::uuid16(UUID_PROTOCOL_MODE), {"read", "write-without-response"}),
      mode_(PROTOCOL_MODE_REPORT) {}

bool ProtocolModeCharacteristic::write_value(const gatt::Bytes& value) {
    if (value.size() != 1) return false;
    if (value[0] != PROTOCOL_MODE_BOOT && value[0] != PROTOCOL_MODE_REPORT) return false;

    mode_ = value[0];
    logging::info("[BLE] Protocol mode set: %s", boot_mode() ? "boot" : "report");
    return true;
}

bool ProtocolModeCharacteristic::boot_mode() const {
    return mode_ == PROTOCOL_MODE_BOOT;
}

ControlPointCharacteristic::ControlPointCharacteristic()
    : gatt::Characteristic(gatt::uuid16(UUID_HID_CONTROL_POINT), {"write-without-response"}) {}

bool ControlPointCharacteristic::write_value(const gatt::Bytes& value) {
    if (value.size() != 1) return false;
    suspended_ = value[0] == 0x00;
    logging::info("[BLE] HID control point: %s", suspended_ ? "suspend" : "exit suspend");
    return true;
}

InputReportCharacteristic::InputReportCharacteristic(uint16_t uuid, uint8_t report_id)
    : gatt::Characteristic(gatt::uuid16(uuid), {"read", "notify", "encrypt-read", "encrypt-notify"}),
      value_(report_encoder::ReportFrame::release().to_vector()) {
    if (report_id != 0) {
        descriptors_.push_back(report_reference(report_id, REPORT_TYPE_INPUT));
    }
}

OutputReportCharacteristic::OutputReportCharacteristic(uint16_t uuid, uint8_t report_id)
    : gatt::Characteristic(gatt::uuid16(uuid),
                           {"read", "write", "write-without-response", "encrypt-read", "encrypt-write"}) {
    if (report_id != 0) {
        descriptors_.push_back(report_reference(report_id, REPORT_TYPE_OUTPUT));
    }
}

bool OutputReportCharacteristic::write_value(const gatt::Bytes& value) {
    if (value.empty()) return false;
    led_mask_ = value[0] & 0x1F;
    logging::debug("[BLE] LED output report: 0x%02X", led_mask_);
    return true;
}

BatteryLevelCharacteristic::BatteryLevelCharacteristic(uint8_t level)
    : gatt::Characteristic(gatt::uuid16(UUID_BATTERY_LEVEL),
                           {"read", "notify", "encrypt-read", "encrypt-notify"}),
      level_(level) {}

// ─── Service tree ───────────────────────────────────────────────────────────

void build(const Settings& settings, gatt::Application& app, HidHandles& handles) {
    gatt::Service& hid = app.add_service(gatt::uuid16(UUID_HID_SERVICE));
    hid.add<StaticCharacteristic>(UUID_HID_INFORMATION, std::vector<std::string>{"read"},
                                  hid_information());
    hid.add<StaticCharacteristic>(UUID_REPORT_MAP, std::vector<std::string>{"read", "encrypt-read"},
                                  report_map());
    handles.control_point = &hid.add<ControlPointCharacteristic>();
    handles.protocol_mode = &hid.add<ProtocolModeCharacteristic>();
    handles.input         = &hid.add<InputReportCharacteristic>(UUID_REPORT, KEYBOARD_REPORT_ID);
    handles.output        = &hid.add<OutputReportCharacteristic>(UUID_REPORT, KEYBOARD_REPORT_ID);
    handles.boot_input    = &hid.add<InputReportCharacteristic>(UUID_BOOT_KBD_INPUT, 0);
    handles.boot_output   = &hid.add<OutputReportCharacteristic>(UUID_BOOT_KBD_OUTPUT, 0);

    gatt::Service& dis = app.add_service(gatt::uuid16(UUID_DEVICE_INFO_SERVICE));
    dis.add<StaticCharacteristic>(UUID_PNP_ID, std::vector<std::string>{"read"},
                                  pnp_id(settings.usb_vid, settings.usb_pid, settings.usb_version));
    dis.add<StaticCharacteristic>(UUID_MANUFACTURER_NAME, std::vector<std::string>{"read"},
                                  gatt::Bytes(settings.manufacturer.begin(), settings.manufacturer.end()));
    dis.add<StaticCharacteristic>(UUID_MODEL_NUMBER, std::vector<std::string>{"read"},
                                  gatt::Bytes(settings.model.begin(), settings.model.end()));

    gatt::Service& battery = app.add_service(gatt::uuid16(UUID_BATTERY_SERVICE));
    battery.add<BatteryLevelCharacteristic>(BATTERY_LEVEL_PERCENT);
}

} // namespace hid_service
