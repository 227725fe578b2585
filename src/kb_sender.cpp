#include "kb_sender.h"
#include "config.h"
#include "logging.h"

#include <cerrno>
#include <csignal>
#include <chrono>
#include <cstring>
#include <fstream>
#include <getopt.h>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kb_sender {

bool default_options(Options& opts, std::string& error, const settings::EnvLookup& lookup) {
    opts.fifo_path       = FIFO_PATH;
    opts.ready_flag_path = READY_FLAG_PATH;
    opts.wait_secs       = SEND_WAIT_SECS;
    opts.wait_ready      = true;
    opts.debug           = false;
    opts.newline_mode    = NewlineMode::CR;
    opts.file.clear();
    opts.text.clear();
    opts.show_help       = false;

    const char* raw = lookup("BT_KB_WAIT_SECS");
    if (raw) {
        std::string v = settings::clean_env_value(raw);
        if (!v.empty() && !settings::parse_number(v, opts.wait_secs)) {
            error = "invalid BT_KB_WAIT_SECS value '" + v + "'";
            return false;
        }
    }
    return true;
}

bool parse_newline_mode(const std::string& text, NewlineMode& out) {
    if (text == "preserve") out = NewlineMode::PRESERVE;
    else if (text == "cr")  out = NewlineMode::CR;
    else if (text == "strip") out = NewlineMode::STRIP;
    else return false;
    return true;
}

enum OptionId {
    OPT_NOWAIT = 1000,
    OPT_WAIT,
    OPT_DEBUG,
    OPT_NEWLINE_MODE,
    OPT_FIFO,
    OPT_READY_FLAG,
    OPT_FILE,
    OPT_HELP
};

bool parse_args(int argc, char** argv, Options& opts, std::string& error) {
    static const struct option long_opts[] = {
        { "nowait",       no_argument,       nullptr, OPT_NOWAIT },
        { "wait",         required_argument, nullptr, OPT_WAIT },
        { "debug",        no_argument,       nullptr, OPT_DEBUG },
        { "newline-mode", required_argument, nullptr, OPT_NEWLINE_MODE },
        { "fifo",         required_argument, nullptr, OPT_FIFO },
        { "ready-flag",   required_argument, nullptr, OPT_READY_FLAG },
        { "file",         required_argument, nullptr, OPT_FILE },
        { "help",         no_argument,       nullptr, OPT_HELP },
        { nullptr, 0, nullptr, 0 }
    };

    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":h", long_opts, nullptr)) != -1) {
        std::string arg = optarg ? optarg : "";
        switch (opt) {
        case OPT_NOWAIT: opts.wait_ready = false; break;
        case OPT_WAIT:
            if (!settings::parse_number(arg, opts.wait_secs)) {
                error = "--wait must be a non-negative integer";
                return false;
            }
            break;
        case OPT_DEBUG: opts.debug = true; break;
        case OPT_NEWLINE_MODE:
            if (!parse_newline_mode(arg, opts.newline_mode)) {
                error = "invalid --newline-mode '" + arg + "'";
                return false;
            }
            break;
        case OPT_FIFO:       opts.fifo_path = arg; break;
        case OPT_READY_FLAG: opts.ready_flag_path = arg; break;
        case OPT_FILE:       opts.file = arg; break;
        case 'h':
        case OPT_HELP:       opts.show_help = true; return true;
        case ':':
            error = std::string("missing value for ") + argv[optind - 1];
            return false;
        default:
            error = std::string("unknown argument ") + (optind > 0 ? argv[optind - 1] : "?");
            return false;
        }
    }

    // Remaining words form the text, joined by single spaces.
    for (int i = optind; i < argc; ++i) {
        if (!opts.text.empty()) opts.text += ' ';
        opts.text += argv[i];
    }

    if (!opts.file.empty() && !opts.text.empty()) {
        error = "give either --file or text, not both";
        return false;
    }
    if (opts.file.empty() && opts.text.empty()) {
        error = "no text to send";
        return false;
    }
    return true;
}

std::string apply_newline_mode(const std::string& text, NewlineMode mode) {
    if (mode == NewlineMode::PRESERVE) return text;

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\n') out += c;
        else if (mode == NewlineMode::CR) out += '\r';
    }
    return out;
}

bool load_payload(const Options& opts, std::string& payload, std::string& error) {
    if (opts.file.empty()) {
        payload = opts.text;
        return true;
    }

    struct stat st;
    if (stat(opts.file.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        error = "file not found: " + opts.file;
        return false;
    }
    std::ifstream in(opts.file, std::ios::binary);
    if (!in) {
        error = "cannot read " + opts.file;
        return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        error = "read failed on " + opts.file;
        return false;
    }
    payload = buf.str();
    return true;
}

static bool is_fifo(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISFIFO(st.st_mode);
}

static bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

/// Poll `ready` every SEND_POLL_MS until it holds or wait_secs pass.
template <typename Pred>
static bool wait_for(Pred ready, uint32_t wait_secs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_secs);
    while (!ready()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(SEND_POLL_MS));
    }
    return true;
}

int send(const Options& opts, const std::string& payload) {
    std::string data = apply_newline_mode(payload, opts.newline_mode);

    logging::debug("[SEND] Waiting for FIFO %s (timeout %u s)", opts.fifo_path.c_str(), opts.wait_secs);
    if (!wait_for([&] { return is_fifo(opts.fifo_path); }, opts.wait_secs)) {
        logging::error("[SEND] FIFO not ready: %s", opts.fifo_path.c_str());
        return EXIT_NOT_READY;
    }

    if (opts.wait_ready) {
        logging::debug("[SEND] Waiting for host subscription flag %s", opts.ready_flag_path.c_str());
        if (!wait_for([&] { return exists(opts.ready_flag_path); }, opts.wait_secs)) {
            logging::error("[SEND] No host subscribed (%s missing)", opts.ready_flag_path.c_str());
            return EXIT_NOT_READY;
        }
    }

    // Non-blocking open fails with ENXIO instead of hanging when nobody reads.
    int fd = open(opts.fifo_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENXIO) {
            logging::error("[SEND] Bridge is not reading %s", opts.fifo_path.c_str());
        } else {
            logging::error("[SEND] open %s: %s", opts.fifo_path.c_str(), strerror(errno));
        }
        return EXIT_NOT_READY;
    }

    // A reader that goes away mid-write must surface as EPIPE, not kill us.
    signal(SIGPIPE, SIG_IGN);

    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        logging::error("[SEND] fcntl: %s", strerror(errno));
        close(fd);
        return EXIT_NOT_READY;
    }

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("[SEND] write: %s", strerror(errno));
            close(fd);
            return EXIT_NOT_READY;
        }
        off += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        logging::error("[SEND] close: %s", strerror(errno));
        return EXIT_NOT_READY;
    }
    logging::debug("[SEND] Wrote %zu bytes", data.size());
    return EXIT_SENT;
}

std::string usage(const char* prog) {
    std::string u = "Usage: ";
    u += prog;
    u += " [options] (--file <path> | \"text\")\n"
         "  --file <path>             send the contents of a UTF-8 file\n"
         "  --wait <seconds>          wait for FIFO / host (BT_KB_WAIT_SECS, default 10)\n"
         "  --nowait                  do not wait for a subscribed host\n"
         "  --newline-mode <mode>     preserve | cr (default) | strip\n"
         "  --fifo <path>             bridge FIFO path\n"
         "  --ready-flag <path>       readiness flag path\n"
         "  --debug                   trace each step\n"
         "  --help                    show this text\n";
    return u;
}

} // namespace kb_sender
