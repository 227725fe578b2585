#pragma once

#include <functional>
#include <string>

// ─── Logging ────────────────────────────────────────────────────────────────
// Tagged printf-style lines on stderr ("[BLE] Connected ..."). Each line
// carries a syslog priority prefix so journald keeps the level.

namespace logging {

enum class Level : int {
    ERROR = 3,
    WARN  = 4,
    INFO  = 6,
    DEBUG = 7
};

using Sink = std::function<void(Level, const std::string&)>;

/// Enable or disable DEBUG output.
void set_verbose(bool on);
bool verbose();

/// Replace the output sink. Pass nullptr to restore stderr.
void set_sink(Sink sink);

void error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void warn(const char* fmt, ...)  __attribute__((format(printf, 1, 2)));
void info(const char* fmt, ...)  __attribute__((format(printf, 1, 2)));
void debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace logging
