#include "readiness_flag.h"
#include "logging.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace readiness_flag {

ReadinessFlag::ReadinessFlag(std::string path) : path_(std::move(path)) {}

ReadinessFlag::~ReadinessFlag() {
    if (published_ && !withdraw()) {
        logging::warn("[FLAG] %s left behind at exit", path_.c_str());
    }
}

bool ReadinessFlag::publish() {
    int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        logging::error("[FLAG] Cannot create %s: %s", path_.c_str(), strerror(errno));
        return false;
    }
    close(fd);

    if (!published_) logging::info("[FLAG] Published %s", path_.c_str());
    published_ = true;
    return true;
}

bool ReadinessFlag::withdraw() {
    bool was_published = published_;
    published_ = false;
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        logging::error("[FLAG] Cannot remove %s: %s", path_.c_str(), strerror(errno));
        return false;
    }
    if (was_published) logging::info("[FLAG] Withdrew %s", path_.c_str());
    return true;
}

bool ReadinessFlag::clear_stale() {
    if (!exists()) return true;
    logging::warn("[FLAG] Removing stale %s", path_.c_str());
    return withdraw();
}

bool ReadinessFlag::exists() const {
    struct stat st;
    return stat(path_.c_str(), &st) == 0;
}

} // namespace readiness_flag
