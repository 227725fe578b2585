#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ─── Bluetooth Management Socket ────────────────────────────────────────────
// Minimal client for the kernel's HCI control channel, used to put the
// controller in LE-only mode so hosts see one LE identity instead of a
// BR/EDR + LE pair. Requires CAP_NET_ADMIN.

namespace mgmt_control {

// ─── Opcodes / events (kernel mgmt API) ────────────────────────────────────
constexpr uint16_t OP_READ_INFO     = 0x0004;
constexpr uint16_t OP_SET_POWERED   = 0x0005;
constexpr uint16_t OP_SET_LE        = 0x000D;
constexpr uint16_t OP_SET_BREDR     = 0x002A;

constexpr uint16_t EV_CMD_COMPLETE  = 0x0001;
constexpr uint16_t EV_CMD_STATUS    = 0x0002;

constexpr uint32_t SETTING_POWERED  = 0x00000001;
constexpr uint32_t SETTING_BREDR    = 0x00000080;
constexpr uint32_t SETTING_LE       = 0x00000200;

constexpr size_t   HEADER_SIZE      = 6;
constexpr size_t   READ_INFO_CURRENT_SETTINGS_OFFSET = 13;
constexpr int      REPLY_TIMEOUT_MS = 2000;

/// Parsed CMD_COMPLETE / CMD_STATUS event.
struct Reply {
    uint16_t             opcode;
    uint8_t              status;
    std::vector<uint8_t> data;
};

/// "hci0" -> 0. Returns false for anything else.
bool parse_index(const std::string& name, uint16_t& index);

/// Encode a command packet.
std::vector<uint8_t> build_command(uint16_t opcode, uint16_t index, const std::vector<uint8_t>& params);

/// Decode an event packet if it answers `opcode` on `index`.
bool parse_reply(const uint8_t* buf, size_t len, uint16_t opcode, uint16_t index, Reply& out);

/// Read current_settings from a READ_INFO reply.
bool current_settings(const Reply& info, uint32_t& settings);

/// Power off, enable LE, disable BR/EDR. Leaves the controller powered
/// off; the caller powers it on through BlueZ. Returns false with error
/// set on failure.
bool set_le_only(uint16_t index, std::string& error);

} // namespace mgmt_control
