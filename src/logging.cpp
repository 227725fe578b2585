#include "logging.h"
#include "config.h"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace logging {

static bool       s_verbose = KBD_BRIDGE_DEBUG_VERBOSE != 0;
static Sink       s_sink;
static std::mutex s_mutex;

void set_verbose(bool on) {
    s_verbose = on;
}

bool verbose() {
    return s_verbose;
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

static void vlog(Level level, const char* fmt, va_list args) {
    char buf[1024];
    int n = vsnprintf(buf, sizeof(buf), fmt, args);
    if (n < 0) return;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_sink) {
        s_sink(level, std::string(buf));
        return;
    }
    fprintf(stderr, "<%d>%s\n", static_cast<int>(level), buf);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Level::ERROR, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Level::WARN, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Level::INFO, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    if (!s_verbose) return;
    va_list args;
    va_start(args, fmt);
    vlog(Level::DEBUG, fmt, args);
    va_end(args);
}

} // namespace logging
