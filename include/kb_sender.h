#pragma once

#include <cstdint>
#include <string>
#include "settings.h"

// ─── Pipe Writer ────────────────────────────────────────────────────────────
// bt_kb_send: wait for the bridge to be ready, then write text into its
// FIFO. Used by scripts and the test harness.

namespace kb_sender {

constexpr int EXIT_SENT      = 0;
constexpr int EXIT_NOT_READY = 1;   // FIFO or flag missing, no reader, write failed
constexpr int EXIT_USAGE     = 2;

enum class NewlineMode : uint8_t {
    PRESERVE,   // send LF as-is
    CR,         // LF -> CR
    STRIP       // drop LF
};

struct Options {
    std::string fifo_path;
    std::string ready_flag_path;
    uint32_t    wait_secs;
    bool        wait_ready;
    bool        debug;
    NewlineMode newline_mode;
    std::string file;
    std::string text;
    bool        show_help;
};

/// Defaults plus BT_KB_WAIT_SECS. Returns false with error set on a bad value.
bool default_options(Options& opts, std::string& error, const settings::EnvLookup& lookup);

bool parse_newline_mode(const std::string& text, NewlineMode& out);

/// Returns false with error set on malformed arguments.
bool parse_args(int argc, char** argv, Options& opts, std::string& error);

/// Rewrite line feeds for the chosen mode.
std::string apply_newline_mode(const std::string& text, NewlineMode mode);

/// Load the payload (--file or the text argument). Returns false with error
/// set if the file cannot be read.
bool load_payload(const Options& opts, std::string& payload, std::string& error);

/// Wait for the FIFO and readiness flag, then write the payload.
/// Returns one of the EXIT_* codes.
int send(const Options& opts, const std::string& payload);

std::string usage(const char* prog);

} // namespace kb_sender
