#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include "keycode_table.h"

// ─── HID Keyboard Report Encoder ───────────────────────────────────────────
// Turns characters into 8-byte boot-compatible keyboard reports:
//   [modifiers, reserved, key1..key6]
// Every key press is followed by the all-zero release report.

namespace report_encoder {

constexpr size_t REPORT_SIZE = 8;

/// Immutable keyboard input report.
class ReportFrame {
public:
    /// All-keys-released frame.
    ReportFrame() : bytes_{} {}

    /// Single key press with modifiers held.
    ReportFrame(uint8_t modifiers, uint8_t usage) : bytes_{} {
        bytes_[0] = modifiers;
        bytes_[2] = usage;
    }

    static ReportFrame release() { return ReportFrame(); }

    const std::array<uint8_t, REPORT_SIZE>& bytes() const { return bytes_; }
    std::vector<uint8_t> to_vector() const { return {bytes_.begin(), bytes_.end()}; }

    uint8_t modifiers() const { return bytes_[0]; }
    uint8_t usage() const { return bytes_[2]; }
    bool is_release() const;

    bool operator==(const ReportFrame& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ReportFrame& other) const { return bytes_ != other.bytes_; }

private:
    std::array<uint8_t, REPORT_SIZE> bytes_;
};

/// Append press + release frames for one key stroke.
void encode_stroke(const keycode_table::KeyStroke& stroke, std::vector<ReportFrame>& out);

/// Append the frames that type a character.
/// '\n' and '\r' are Enter. Returns false (and appends nothing) if the
/// layout has no key sequence for the code point.
bool encode(char32_t code_point, keycode_table::Layout layout, std::vector<ReportFrame>& out);

} // namespace report_encoder
