#pragma once

#include <cstddef>
#include <cstdint>

// ─── Filesystem Interfaces ──────────────────────────────────────────────────
// Producers write UTF-8 text to the FIFO; the flag exists while a host is
// subscribed to keyboard input notifications.
constexpr const char* FIFO_PATH          = "/run/ipr_bt_keyboard_fifo";
constexpr const char* READY_FLAG_PATH    = "/run/ipr_bt_keyboard_notifying";
constexpr uint32_t    FIFO_MODE          = 0666;   // world-writable for producers

// ─── Adapter / Identity ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_ADAPTER      = "hci0";
constexpr const char* DEFAULT_DEVICE_NAME  = "IPR Keyboard";
constexpr const char* DEFAULT_MANUFACTURER = "IPR";
constexpr const char* DEFAULT_MODEL        = "IPR Keyboard";

// PnP ID (pid.codes open-source VID)
constexpr uint16_t DEFAULT_USB_VID       = 0x1209;
constexpr uint16_t DEFAULT_USB_PID       = 0x0001;
constexpr uint16_t DEFAULT_USB_VERSION   = 0x0100;

constexpr uint16_t APPEARANCE_KEYBOARD   = 0x03C1;
constexpr uint8_t  BATTERY_LEVEL_PERCENT = 100;

// ─── D-Bus Object Paths ─────────────────────────────────────────────────────
constexpr const char* GATT_APP_ROOT      = "/org/kbdbridge/hid";
constexpr const char* ADVERTISEMENT_PATH = "/org/kbdbridge/advertisement0";
constexpr const char* AGENT_PATH         = "/org/kbdbridge/agent";

// ─── HID ────────────────────────────────────────────────────────────────────
constexpr uint8_t KEYBOARD_REPORT_ID     = 1;
constexpr uint8_t PROTOCOL_MODE_BOOT     = 0x00;
constexpr uint8_t PROTOCOL_MODE_REPORT   = 0x01;

// ─── Report Pacing (milliseconds) ───────────────────────────────────────────
constexpr uint32_t FRAME_INTERVAL_MS     = 20;     // gap after every frame sent
constexpr uint32_t FRAME_INTERVAL_MIN_MS = 5;      // below this the loop never returns to poll()
constexpr uint32_t FRAME_RETRY_MS        = 50;     // wait after a failed notify

// ─── Pairing Agent ──────────────────────────────────────────────────────────
constexpr const char* AGENT_CAPABILITY   = "NoInputNoOutput";
constexpr uint32_t PAIRING_DEADLINE_MS   = 250;    // answer BlueZ well inside its timeout
constexpr uint32_t PAIRING_DEADLINE_MIN_MS = 50;   // shorter answers race the Trusted write
constexpr uint32_t PAIRING_ANSWER_MARGIN_MS = 20;  // forced answers go out this much before the deadline
constexpr uint32_t AGENT_FIXED_PASSKEY   = 0;      // for hosts that still ask

// ─── FIFO Bridge ────────────────────────────────────────────────────────────
constexpr size_t   PENDING_TEXT_LIMIT    = 65536;  // queued code points before backpressure
constexpr size_t   FIFO_READ_CHUNK       = 4096;   // bytes per read()
constexpr uint32_t FIFO_RETRY_MS         = 1000;   // retry mkfifo/open after failure

// ─── BLE Registration Backoff ───────────────────────────────────────────────
constexpr uint32_t BLE_RETRY_INITIAL_MS        = 1000;   // initial backoff delay
constexpr uint32_t BLE_RETRY_MAX_MS            = 30000;  // max backoff delay
constexpr int      BLE_REGISTER_MAX_ATTEMPTS   = 60;     // GATT app: give up after this many
constexpr uint32_t ADV_REARM_DELAY_MS          = 50;     // settle time after disconnect

// ─── Status ─────────────────────────────────────────────────────────────────
constexpr uint32_t STATUS_INTERVAL_MS    = 30000;  // [STATUS] heartbeat

// ─── Sender Helper ──────────────────────────────────────────────────────────
constexpr int      SEND_WAIT_SECS        = 10;     // default wait for FIFO / flag
constexpr uint32_t SEND_POLL_MS          = 100;    // poll interval while waiting

// Compile-time flags (override via -D in CMake)
#ifndef KBD_BRIDGE_DEBUG_VERBOSE
#define KBD_BRIDGE_DEBUG_VERBOSE 0   // 1 = log every frame and D-Bus call
#endif
