#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include "keycode_table.h"

// ─── Runtime Settings ───────────────────────────────────────────────────────
// Defaults come from config.h, then BT_* environment variables, then the
// command line.

struct Settings {
    std::string adapter;
    std::string device_name;
    std::string manufacturer;
    std::string model;
    uint16_t    usb_vid;
    uint16_t    usb_pid;
    uint16_t    usb_version;

    std::string fifo_path;
    std::string ready_flag_path;
    keycode_table::Layout layout;

    uint32_t frame_interval_ms;
    uint32_t pairing_deadline_ms;
    size_t   pending_text_limit;

    bool le_only;
    bool verbose;
    bool show_help;
};

namespace settings {

/// Environment lookup; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

/// Compile-time defaults from config.h.
Settings defaults();

/// Trim whitespace and strip an inline " #comment".
std::string clean_env_value(const std::string& raw);

/// Parse a decimal or 0x-prefixed unsigned number.
bool parse_number(const std::string& text, uint32_t& out);

/// Overlay BT_* environment variables. Returns false with error set on an
/// invalid value.
bool apply_environment(Settings& s, std::string& error, const EnvLookup& lookup);
bool apply_environment(Settings& s, std::string& error);

/// Overlay command-line options. Returns false with error set on an
/// unknown option or invalid value. --help sets show_help.
bool parse_args(int argc, char** argv, Settings& s, std::string& error);

/// Usage text for the daemon.
std::string usage(const char* prog);

} // namespace settings
