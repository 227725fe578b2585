#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ─── GATT Object Model ──────────────────────────────────────────────────────
// Platform-neutral description of the GATT application we export. What a
// characteristic can do is expressed by the capability interfaces it
// implements; the BlueZ layer asks for each one and maps it to D-Bus
// methods and flags.

namespace gatt {

using Bytes = std::vector<uint8_t>;

/// Expand a 16-bit Bluetooth SIG UUID to its 128-bit string form.
std::string uuid16(uint16_t short_uuid);

struct Descriptor {
    std::string              uuid;
    std::vector<std::string> flags;
    Bytes                    value;
    std::string              path;
};

// ─── Capabilities ───────────────────────────────────────────────────────────

class Readable {
public:
    virtual ~Readable() = default;
    virtual Bytes read_value() const = 0;
};

class Writable {
public:
    virtual ~Writable() = default;
    /// Returns false if the value is rejected (reported as InvalidArgs).
    virtual bool write_value(const Bytes& value) = 0;
};

class Notifiable {
public:
    virtual ~Notifiable() = default;
    virtual void set_notifying(bool on) = 0;
    virtual bool notifying() const = 0;
};

class Describable {
public:
    virtual ~Describable() = default;
    virtual std::vector<Descriptor>& descriptors() = 0;
    virtual const std::vector<Descriptor>& descriptors() const = 0;
};

// ─── Characteristic ─────────────────────────────────────────────────────────

class Characteristic {
public:
    Characteristic(std::string uuid, std::vector<std::string> flags)
        : uuid_(std::move(uuid)), flags_(std::move(flags)) {}
    virtual ~Characteristic() = default;

    Characteristic(const Characteristic&) = delete;
    Characteristic& operator=(const Characteristic&) = delete;

    const std::string& uuid() const { return uuid_; }
    const std::vector<std::string>& flags() const { return flags_; }
    const std::string& path() const { return path_; }
    void set_path(std::string path) { path_ = std::move(path); }

    virtual Readable* readable() { return nullptr; }
    virtual Writable* writable() { return nullptr; }
    virtual Notifiable* notifiable() { return nullptr; }
    virtual Describable* describable() { return nullptr; }

private:
    std::string              uuid_;
    std::vector<std::string> flags_;
    std::string              path_;
};

// ─── Service ────────────────────────────────────────────────────────────────

class Service {
public:
    Service(std::string uuid, bool primary) : uuid_(std::move(uuid)), primary_(primary) {}

    /// Construct a characteristic in place and return it.
    template <typename T, typename... Args>
    T& add(Args&&... args) {
        auto chr = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *chr;
        characteristics_.push_back(std::move(chr));
        return ref;
    }

    const std::string& uuid() const { return uuid_; }
    bool primary() const { return primary_; }
    const std::string& path() const { return path_; }
    void set_path(std::string path) { path_ = std::move(path); }

    const std::vector<std::unique_ptr<Characteristic>>& characteristics() const {
        return characteristics_;
    }

private:
    std::string uuid_;
    bool        primary_;
    std::string path_;
    std::vector<std::unique_ptr<Characteristic>> characteristics_;
};

// ─── Application ────────────────────────────────────────────────────────────

class Application {
public:
    Service& add_service(const std::string& uuid, bool primary = true);

    /// Name every object below root: root/serviceN/charM/descK.
    void assign_paths(const std::string& root);

    /// Characteristic at an object path, or nullptr.
    Characteristic* find(const std::string& path) const;

    const std::string& root() const { return root_; }
    const std::vector<std::unique_ptr<Service>>& services() const { return services_; }

private:
    std::string root_;
    std::vector<std::unique_ptr<Service>> services_;
};

} // namespace gatt
