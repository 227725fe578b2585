#pragma once

#include <string>

// ─── Readiness Flag ─────────────────────────────────────────────────────────
// Empty marker file that exists while a host is subscribed to keyboard
// input. Producers poll for it before writing to the FIFO.

namespace readiness_flag {

class ReadinessFlag {
public:
    explicit ReadinessFlag(std::string path);

    /// Withdraws the flag.
    ~ReadinessFlag();

    ReadinessFlag(const ReadinessFlag&) = delete;
    ReadinessFlag& operator=(const ReadinessFlag&) = delete;

    /// Create the marker file. Returns false on I/O error.
    bool publish();

    /// Remove the marker file. A missing file is not an error.
    bool withdraw();

    /// Remove a flag left behind by a previous run. Returns false if it
    /// could not be removed.
    bool clear_stale();

    /// What we last published.
    bool published() const { return published_; }

    /// Whether the file exists on disk.
    bool exists() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool        published_ = false;
};

} // namespace readiness_flag
