#include "gatt.h"

#include <cstdio>

namespace gatt {

std::string uuid16(uint16_t short_uuid) {
    char buf[40];
    snprintf(buf, sizeof(buf), "0000%04x-0000-1000-8000-00805f9b34fb", short_uuid);
    return buf;
}

Service& Application::add_service(const std::string& uuid, bool primary) {
    services_.push_back(std::make_unique<Service>(uuid, primary));
    return *services_.back();
}

void Application::assign_paths(const std::string& root) {
    root_ = root;
    for (size_t i = 0; i < services_.size(); ++i) {
        Service& svc = *services_[i];
        svc.set_path(root + "/service" + std::to_string(i));

        const auto& chars = svc.characteristics();
        for (size_t j = 0; j < chars.size(); ++j) {
            Characteristic& chr = *chars[j];
            chr.set_path(svc.path() + "/char" + std::to_string(j));

            if (Describable* d = chr.describable()) {
                auto& descs = d->descriptors();
                for (size_t k = 0; k < descs.size(); ++k) {
                    descs[k].path = chr.path() + "/desc" + std::to_string(k);
                }
            }
        }
    }
}

Characteristic* Application::find(const std::string& path) const {
    for (const auto& svc : services_) {
        for (const auto& chr : svc->characteristics()) {
            if (chr->path() == path) return chr.get();
        }
    }
    return nullptr;
}

} // namespace gatt
