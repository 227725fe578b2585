#include "adapter_context.h"

namespace adapter_context {

bool AdapterError::retryable() const {
    static const char* const RETRYABLE[] = {
        "org.bluez.Error.NotReady",
        "org.bluez.Error.InProgress",
        "org.bluez.Error.Failed",
        "org.bluez.Error.Busy",
        "org.freedesktop.DBus.Error.NoReply",
        "org.freedesktop.DBus.Error.Timeout",
        "org.freedesktop.DBus.Error.TimedOut",
        "org.freedesktop.DBus.Error.ServiceUnknown",
    };
    for (const char* r : RETRYABLE) {
        if (name == r) return true;
    }
    return false;
}

} // namespace adapter_context
