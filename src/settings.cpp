#include "settings.h"
#include "config.h"

#include <cerrno>
#include <cstdlib>
#include <getopt.h>
#include <string>

namespace settings {

Settings defaults() {
    Settings s;
    s.adapter             = DEFAULT_ADAPTER;
    s.device_name         = DEFAULT_DEVICE_NAME;
    s.manufacturer        = DEFAULT_MANUFACTURER;
    s.model               = DEFAULT_MODEL;
    s.usb_vid             = DEFAULT_USB_VID;
    s.usb_pid             = DEFAULT_USB_PID;
    s.usb_version         = DEFAULT_USB_VERSION;
    s.fifo_path           = FIFO_PATH;
    s.ready_flag_path     = READY_FLAG_PATH;
    s.layout              = keycode_table::Layout::DANISH;
    s.frame_interval_ms   = FRAME_INTERVAL_MS;
    s.pairing_deadline_ms = PAIRING_DEADLINE_MS;
    s.pending_text_limit  = PENDING_TEXT_LIMIT;
    s.le_only             = true;
    s.verbose             = KBD_BRIDGE_DEBUG_VERBOSE != 0;
    s.show_help           = false;
    return s;
}

std::string clean_env_value(const std::string& raw) {
    std::string v = raw;
    size_t hash = v.find(" #");
    if (hash != std::string::npos) v.erase(hash);

    const char* ws = " \t\r\n";
    size_t first = v.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = v.find_last_not_of(ws);
    return v.substr(first, last - first + 1);
}

bool parse_number(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = strtoull(text.c_str(), &end, 0);
    if (errno != 0 || end == text.c_str() || *end != '\0' || v > 0xFFFFFFFFULL) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static bool parse_u16(const std::string& text, uint16_t& out) {
    uint32_t v = 0;
    if (!parse_number(text, v) || v > 0xFFFF) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

static bool parse_at_least(const std::string& text, uint32_t min, uint32_t& out) {
    uint32_t v = 0;
    if (!parse_number(text, v) || v < min) return false;
    out = v;
    return true;
}

static bool parse_bool(const std::string& text) {
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

bool apply_environment(Settings& s, std::string& error, const EnvLookup& lookup) {
    auto get = [&](const char* name, std::string& value) {
        const char* raw = lookup(name);
        if (!raw) return false;
        value = clean_env_value(raw);
        return !value.empty();
    };
    auto bad = [&](const char* name, const std::string& value) {
        error = std::string("invalid ") + name + " value '" + value + "'";
        return false;
    };

    std::string v;
    if (get("BT_HCI", v))          s.adapter = v;
    if (get("BT_DEVICE_NAME", v))  s.device_name = v;
    if (get("BT_MANUFACTURER", v)) s.manufacturer = v;
    if (get("BT_MODEL", v))        s.model = v;

    if (get("BT_USB_VID", v) && !parse_u16(v, s.usb_vid)) return bad("BT_USB_VID", v);
    if (get("BT_USB_PID", v) && !parse_u16(v, s.usb_pid)) return bad("BT_USB_PID", v);
    if (get("BT_USB_VER", v) && !parse_u16(v, s.usb_version)) return bad("BT_USB_VER", v);

    if (get("BT_CONTROLLER_MODE", v)) {
        if (v == "le") s.le_only = true;
        else if (v == "dual") s.le_only = false;
        else return bad("BT_CONTROLLER_MODE", v);
    }
    if (get("BT_KB_LAYOUT", v) && !keycode_table::parse_layout(v, s.layout)) {
        return bad("BT_KB_LAYOUT", v);
    }
    if (get("BT_KB_FRAME_INTERVAL_MS", v) && !parse_at_least(v, FRAME_INTERVAL_MIN_MS, s.frame_interval_ms)) {
        return bad("BT_KB_FRAME_INTERVAL_MS", v);
    }
    if (get("BT_AGENT_DEADLINE_MS", v) && !parse_at_least(v, PAIRING_DEADLINE_MIN_MS, s.pairing_deadline_ms)) {
        return bad("BT_AGENT_DEADLINE_MS", v);
    }
    if (get("BT_BLE_DEBUG", v) && parse_bool(v)) s.verbose = true;
    return true;
}

bool apply_environment(Settings& s, std::string& error) {
    return apply_environment(s, error, [](const char* name) { return getenv(name); });
}

enum OptionId {
    OPT_ADAPTER = 1000,
    OPT_NAME,
    OPT_FIFO,
    OPT_READY_FLAG,
    OPT_LAYOUT,
    OPT_FRAME_INTERVAL,
    OPT_PAIRING_DEADLINE,
    OPT_QUEUE_LIMIT,
    OPT_DUAL_MODE,
    OPT_DEBUG,
    OPT_HELP
};

bool parse_args(int argc, char** argv, Settings& s, std::string& error) {
    static const struct option long_opts[] = {
        { "adapter",          required_argument, nullptr, OPT_ADAPTER },
        { "name",             required_argument, nullptr, OPT_NAME },
        { "fifo",             required_argument, nullptr, OPT_FIFO },
        { "ready-flag",       required_argument, nullptr, OPT_READY_FLAG },
        { "layout",           required_argument, nullptr, OPT_LAYOUT },
        { "frame-interval",   required_argument, nullptr, OPT_FRAME_INTERVAL },
        { "pairing-deadline", required_argument, nullptr, OPT_PAIRING_DEADLINE },
        { "queue-limit",      required_argument, nullptr, OPT_QUEUE_LIMIT },
        { "dual-mode",        no_argument,       nullptr, OPT_DUAL_MODE },
        { "debug",            no_argument,       nullptr, OPT_DEBUG },
        { "help",             no_argument,       nullptr, OPT_HELP },
        { nullptr, 0, nullptr, 0 }
    };

    optind = 0;  // full rescan; parse_args may run more than once
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":h", long_opts, nullptr)) != -1) {
        std::string arg = optarg ? optarg : "";
        uint32_t num = 0;
        switch (opt) {
        case OPT_ADAPTER:    s.adapter = arg; break;
        case OPT_NAME:       s.device_name = arg; break;
        case OPT_FIFO:       s.fifo_path = arg; break;
        case OPT_READY_FLAG: s.ready_flag_path = arg; break;
        case OPT_LAYOUT:
            if (!keycode_table::parse_layout(arg, s.layout)) {
                error = "unknown layout '" + arg + "'";
                return false;
            }
            break;
        case OPT_FRAME_INTERVAL:
            if (!parse_at_least(arg, FRAME_INTERVAL_MIN_MS, s.frame_interval_ms)) {
                error = "invalid --frame-interval '" + arg + "' (minimum " +
                        std::to_string(FRAME_INTERVAL_MIN_MS) + " ms)";
                return false;
            }
            break;
        case OPT_PAIRING_DEADLINE:
            if (!parse_at_least(arg, PAIRING_DEADLINE_MIN_MS, s.pairing_deadline_ms)) {
                error = "invalid --pairing-deadline '" + arg + "' (minimum " +
                        std::to_string(PAIRING_DEADLINE_MIN_MS) + " ms)";
                return false;
            }
            break;
        case OPT_QUEUE_LIMIT:
            if (!parse_number(arg, num) || num == 0) {
                error = "invalid --queue-limit '" + arg + "'";
                return false;
            }
            s.pending_text_limit = num;
            break;
        case OPT_DUAL_MODE: s.le_only = false; break;
        case OPT_DEBUG:     s.verbose = true; break;
        case 'h':
        case OPT_HELP:      s.show_help = true; break;
        case ':':
            error = std::string("missing value for ") + argv[optind - 1];
            return false;
        default:
            error = std::string("unknown option ") + (optind > 0 ? argv[optind - 1] : "?");
            return false;
        }
    }

    if (optind < argc) {
        error = std::string("unexpected argument '") + argv[optind] + "'";
        return false;
    }
    if (s.device_name.empty()) {
        error = "device name must not be empty";
        return false;
    }
    return true;
}

std::string usage(const char* prog) {
    std::string u = "Usage: ";
    u += prog;
    u += " [options]\n"
         "  --adapter <hciN>          Bluetooth adapter (BT_HCI, default hci0)\n"
         "  --name <name>             advertised name (BT_DEVICE_NAME)\n"
         "  --fifo <path>             input FIFO path\n"
         "  --ready-flag <path>       readiness flag path\n"
         "  --layout <us|da>          host keyboard layout (BT_KB_LAYOUT, default da)\n"
         "  --frame-interval <ms>     gap between reports (default 20)\n"
         "  --pairing-deadline <ms>   agent answer deadline (default 250)\n"
         "  --queue-limit <n>         characters buffered before backpressure\n"
         "  --dual-mode               keep BR/EDR enabled (BT_CONTROLLER_MODE=dual)\n"
         "  --debug                   verbose logging (BT_BLE_DEBUG=1)\n"
         "  --help                    show this text\n";
    return u;
}

} // namespace settings
