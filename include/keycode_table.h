#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ─── Unicode to USB HID Keycode Table ──────────────────────────────────────
// Maps a code point to the key strokes (modifier byte + Usage Page 0x07
// keycode) that type it on a host using the selected keyboard layout.
// Accented letters on the Danish layout are dead-key sequences of two
// strokes. Newline is not in the table; the encoder handles it as Enter.

namespace keycode_table {

// ─── USB HID modifier bits (byte 0 of a keyboard report) ───────────────────
constexpr uint8_t MOD_NONE        = 0x00;
constexpr uint8_t MOD_LEFT_CTRL   = 0x01;
constexpr uint8_t MOD_LEFT_SHIFT  = 0x02;
constexpr uint8_t MOD_LEFT_ALT    = 0x04;
constexpr uint8_t MOD_LEFT_GUI    = 0x08;
constexpr uint8_t MOD_RIGHT_CTRL  = 0x10;
constexpr uint8_t MOD_RIGHT_SHIFT = 0x20;
constexpr uint8_t MOD_RIGHT_ALT   = 0x40;  // AltGr on European layouts
constexpr uint8_t MOD_RIGHT_GUI   = 0x80;

// ─── Selected USB HID keycodes ─────────────────────────────────────────────
constexpr uint8_t KEY_NONE        = 0x00;
constexpr uint8_t KEY_A           = 0x04;
constexpr uint8_t KEY_1           = 0x1E;
constexpr uint8_t KEY_0           = 0x27;
constexpr uint8_t KEY_ENTER       = 0x28;
constexpr uint8_t KEY_TAB         = 0x2B;
constexpr uint8_t KEY_SPACE       = 0x2C;
constexpr uint8_t KEY_NON_US_BSL  = 0x64;  // ISO key between left Shift and Z
constexpr uint8_t KEY_MAX_USAGE   = 0x65;  // logical maximum in the report map

/// One key press: modifiers held while the key goes down.
struct KeyStroke {
    uint8_t modifiers;
    uint8_t usage;
};

inline bool operator==(const KeyStroke& a, const KeyStroke& b) {
    return a.modifiers == b.modifiers && a.usage == b.usage;
}

/// Maximum strokes per character (dead key + base key).
constexpr size_t MAX_STROKES = 2;

/// A code point and the ordered strokes that produce it.
struct KeyMapEntry {
    char32_t  code_point;
    uint8_t   count;
    KeyStroke strokes[MAX_STROKES];
};

enum class Layout : uint8_t {
    US,
    DANISH
};

/// Parse a layout name ("us", "da"/"dk"/"danish"). Returns false if unknown.
bool parse_layout(const std::string& name, Layout& out);

/// Short name of a layout ("us" or "da").
const char* layout_name(Layout layout);

/// Find the entry for a code point, or nullptr if the layout cannot type it.
const KeyMapEntry* lookup(Layout layout, char32_t code_point);

/// All entries of a layout, in table order.
const std::vector<KeyMapEntry>& entries(Layout layout);

} // namespace keycode_table
