#include "nhdsync/api/device_api.hpp"

#include <utility>

namespace nhdsync {

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::DeviceOnline:
            return "device_online";
        case EventKind::DeviceOffline:
            return "device_offline";
        case EventKind::VideoFound:
            return "video_found";
        case EventKind::VideoLost:
            return "video_lost";
        case EventKind::SinkPowerChanged:
            return "sink_power_changed";
    }
    return "unknown";
}

Subscription::Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        cancel_ = std::move(other.cancel_);
        other.cancel_ = nullptr;
    }
    return *this;
}

void Subscription::reset() {
    if (cancel_) {
        auto cancel = std::move(cancel_);
        cancel_ = nullptr;
        cancel();
    }
}

}  // namespace nhdsync
