#include "mgmt_control.h"
#include "logging.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>

namespace mgmt_control {

static uint16_t get_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static void put_le16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

bool parse_index(const std::string& name, uint16_t& index) {
    if (name.size() < 4 || name.compare(0, 3, "hci") != 0) return false;

    uint32_t v = 0;
    for (size_t i = 3; i < name.size(); ++i) {
        if (name[i] < '0' || name[i] > '9') return false;
        v = v * 10 + static_cast<uint32_t>(name[i] - '0');
        if (v >= HCI_DEV_NONE) return false;
    }
    index = static_cast<uint16_t>(v);
    return true;
}

std::vector<uint8_t> build_command(uint16_t opcode, uint16_t index, const std::vector<uint8_t>& params) {
    std::vector<uint8_t> pkt;
    pkt.reserve(HEADER_SIZE + params.size());
    put_le16(pkt, opcode);
    put_le16(pkt, index);
    put_le16(pkt, static_cast<uint16_t>(params.size()));
    pkt.insert(pkt.end(), params.begin(), params.end());
    return pkt;
}

bool parse_reply(const uint8_t* buf, size_t len, uint16_t opcode, uint16_t index, Reply& out) {
    if (len < HEADER_SIZE) return false;

    uint16_t event = get_le16(buf);
    uint16_t ev_index = get_le16(buf + 2);
    uint16_t plen = get_le16(buf + 4);
    if (ev_index != index || HEADER_SIZE + plen > len) return false;
    if (event != EV_CMD_COMPLETE && event != EV_CMD_STATUS) return false;
    if (plen < 3) return false;

    const uint8_t* params = buf + HEADER_SIZE;
    if (get_le16(params) != opcode) return false;

    out.opcode = opcode;
    out.status = params[2];
    out.data.assign(params + 3, params + plen);
    return true;
}

bool current_settings(const Reply& info, uint32_t& settings) {
    const size_t off = READ_INFO_CURRENT_SETTINGS_OFFSET;
    if (info.data.size() < off + 4) return false;
    settings = static_cast<uint32_t>(info.data[off]) |
               (static_cast<uint32_t>(info.data[off + 1]) << 8) |
               (static_cast<uint32_t>(info.data[off + 2]) << 16) |
               (static_cast<uint32_t>(info.data[off + 3]) << 24);
    return true;
}

// ─── Socket I/O ─────────────────────────────────────────────────────────────

namespace {

class ControlSocket {
public:
    ControlSocket() {
        fd_ = socket(PF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC | SOCK_NONBLOCK, BTPROTO_HCI);
        if (fd_ < 0) return;

        struct sockaddr_hci addr;
        memset(&addr, 0, sizeof(addr));
        addr.hci_family  = AF_BLUETOOTH;
        addr.hci_dev     = HCI_DEV_NONE;
        addr.hci_channel = HCI_CHANNEL_CONTROL;
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            int saved = errno;
            close(fd_);
            fd_ = -1;
            errno = saved;
        }
    }
    ~ControlSocket() {
        if (fd_ >= 0) close(fd_);
    }
    ControlSocket(const ControlSocket&) = delete;
    ControlSocket& operator=(const ControlSocket&) = delete;

    bool ok() const { return fd_ >= 0; }

    bool command(uint16_t opcode, uint16_t index, const std::vector<uint8_t>& params,
                 Reply& reply, std::string& error) {
        std::vector<uint8_t> pkt = build_command(opcode, index, params);
        if (write(fd_, pkt.data(), pkt.size()) != static_cast<ssize_t>(pkt.size())) {
            error = std::string("mgmt write: ") + strerror(errno);
            return false;
        }

        // Skip unrelated broadcast events until our reply shows up.
        uint8_t buf[1024];
        for (;;) {
            struct pollfd pfd = { fd_, POLLIN, 0 };
            int rc = poll(&pfd, 1, REPLY_TIMEOUT_MS);
            if (rc == 0) {
                error = "mgmt reply timeout";
                return false;
            }
            if (rc < 0) {
                if (errno == EINTR) continue;
                error = std::string("mgmt poll: ") + strerror(errno);
                return false;
            }
            ssize_t n = read(fd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                error = std::string("mgmt read: ") + strerror(errno);
                return false;
            }
            if (parse_reply(buf, static_cast<size_t>(n), opcode, index, reply)) {
                if (reply.status != 0) {
                    char msg[64];
                    snprintf(msg, sizeof(msg), "mgmt opcode 0x%04x failed (status 0x%02x)",
                             opcode, reply.status);
                    error = msg;
                    return false;
                }
                return true;
            }
        }
    }

private:
    int fd_ = -1;
};

} // namespace

bool set_le_only(uint16_t index, std::string& error) {
    ControlSocket sock;
    if (!sock.ok()) {
        error = std::string("mgmt socket: ") + strerror(errno);
        return false;
    }

    Reply info;
    uint32_t settings = 0;
    if (!sock.command(OP_READ_INFO, index, {}, info, error)) return false;
    if (!current_settings(info, settings)) {
        error = "short READ_INFO reply";
        return false;
    }

    if (info.data.size() >= 6) {
        bdaddr_t addr;
        memcpy(&addr, info.data.data(), sizeof(addr));
        char text[18];
        ba2str(&addr, text);
        logging::debug("[MGMT] hci%u %s settings 0x%08x", index, text, settings);
    }

    if ((settings & SETTING_LE) && !(settings & SETTING_BREDR)) {
        logging::info("[MGMT] hci%u already LE-only", index);
        return true;
    }

    Reply reply;
    if (settings & SETTING_POWERED) {
        if (!sock.command(OP_SET_POWERED, index, {0x00}, reply, error)) return false;
    }
    if (!(settings & SETTING_LE)) {
        if (!sock.command(OP_SET_LE, index, {0x01}, reply, error)) return false;
    }
    if (settings & SETTING_BREDR) {
        if (!sock.command(OP_SET_BREDR, index, {0x00}, reply, error)) return false;
    }
    logging::info("[MGMT] hci%u switched to LE-only", index);
    return true;
}

} // namespace mgmt_control
