#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nhdsync/model/device.hpp"

namespace nhdsync {

enum class EventKind {
    DeviceOnline,
    DeviceOffline,
    VideoFound,
    VideoLost,
    SinkPowerChanged,
};

std::string_view to_string(EventKind kind);

struct NotificationEvent {
    EventKind kind{EventKind::DeviceOnline};
    std::string device;
    std::optional<PowerState> sink_power;
};

// Move-only handle for a notification subscription; the subscription ends
// when the handle is reset or destroyed.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// Capability set consumed from the transport layer. Every call may block on
// the network and throws TransportError when the call fails as a whole.
class DeviceApi {
public:
    using NotificationHandler = std::function<void(const NotificationEvent&)>;

    virtual ~DeviceApi() = default;

    virtual ControllerInfo fetch_controller_info() = 0;
    virtual std::vector<Device> fetch_device_descriptors() = 0;

    // Per-device failures are reported in the result, not thrown.
    virtual std::vector<DeviceStatusResult> fetch_device_status(const std::vector<std::string>& device_ids) = 0;

    virtual std::vector<MatrixAssignment> fetch_matrix_assignments() = 0;

    virtual void set_matrix(const std::string& source, const std::vector<std::string>& targets) = 0;
    virtual void set_matrix_null(const std::vector<std::string>& targets) = 0;
    virtual void set_display_power(const std::vector<std::string>& targets, PowerState state) = 0;

    // The handler may be invoked from any thread. Once the returned
    // Subscription is reset the handler is not running and is never called
    // again, so it must not reset its own subscription.
    virtual Subscription subscribe_notifications(NotificationHandler handler) = 0;
};

}  // namespace nhdsync
