#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "nhdsync/api/device_api.hpp"
#include "nhdsync/errors.hpp"

namespace nhdsync::testing {

inline Device make_device(const std::string& true_name, const std::string& alias, DeviceRole role) {
    Device device;
    device.true_name = true_name;
    device.alias = alias;
    device.role = role;
    device.online = true;
    return device;
}

inline DeviceStatus make_status(const std::string& true_name, bool active, const std::string& resolution) {
    DeviceStatus status;
    status.true_name = true_name;
    status.input_active = active;
    status.output_active = active;
    status.resolution = resolution;
    return status;
}

// Polls until the predicate holds or the timeout expires.
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// Scriptable DeviceApi. Counts calls, fails on request and can hold status and
// matrix fetches at a gate so tests can pile up concurrent callers.
class FakeDeviceApi : public DeviceApi {
public:
    FakeDeviceApi() {
        devices_ = {
            make_device("TX-1", "AppleTV", DeviceRole::Encoder),
            make_device("TX-2", "Cable", DeviceRole::Encoder),
            make_device("RX-1", "Kitchen", DeviceRole::Decoder),
            make_device("RX-2", "Lounge", DeviceRole::Decoder),
        };
        for (const auto& device : devices_) {
            statuses_[device.true_name] = make_status(device.true_name, true, "1920x1080p60");
        }
        assignments_ = {
            MatrixAssignment{"Kitchen", std::string("AppleTV")},
            MatrixAssignment{"Lounge", std::nullopt},
        };
    }

    ControllerInfo fetch_controller_info() override {
        ++controller_calls;
        if (fail_controller.load()) {
            throw TransportError("controller unreachable");
        }
        ControllerInfo info;
        info.api_version = "6.0.1";
        info.ip4addr = "192.168.1.50";
        return info;
    }

    std::vector<Device> fetch_device_descriptors() override {
        ++descriptor_calls;
        if (fail_descriptors.load()) {
            throw TransportError("descriptor query timed out");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_;
    }

    std::vector<DeviceStatusResult> fetch_device_status(const std::vector<std::string>& device_ids) override {
        ++status_calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_requests_.push_back(device_ids);
        }
        pass_gate();
        if (fail_status.load()) {
            throw TransportError("status query timed out");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DeviceStatusResult> out;
        for (const auto& id : device_ids) {
            DeviceStatusResult result;
            result.true_name = id;
            if (status_errors_.count(id) != 0) {
                result.error = "device did not respond";
            } else if (auto it = statuses_.find(id); it != statuses_.end()) {
                result.status = it->second;
            } else {
                result.error = "unknown device";
            }
            out.push_back(std::move(result));
        }
        return out;
    }

    std::vector<MatrixAssignment> fetch_matrix_assignments() override {
        ++matrix_calls;
        // Reads the routing table before stalling, so a gated fetch returns
        // what the controller held when the query arrived.
        std::vector<MatrixAssignment> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = assignments_;
        }
        pass_gate();
        if (fail_matrix.load()) {
            throw TransportError("matrix query timed out");
        }
        return current;
    }

    void set_matrix(const std::string& source, const std::vector<std::string>& targets) override {
        ++matrix_set_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& target : targets) {
            for (auto& assignment : assignments_) {
                if (assignment.decoder == target) {
                    assignment.encoder = source;
                }
            }
        }
    }

    void set_matrix_null(const std::vector<std::string>& targets) override {
        ++matrix_set_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& target : targets) {
            for (auto& assignment : assignments_) {
                if (assignment.decoder == target) {
                    assignment.encoder.reset();
                }
            }
        }
    }

    void set_display_power(const std::vector<std::string>& targets, PowerState state) override {
        ++power_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& target : targets) {
            power_[target] = state;
        }
    }

    Subscription subscribe_notifications(NotificationHandler handler) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler_ = std::move(handler);
        }
        return Subscription([this] {
            std::lock_guard<std::mutex> delivery(delivery_mutex_);
            std::lock_guard<std::mutex> lock(mutex_);
            handler_ = nullptr;
        });
    }

    // Delivers a notification the way the transport thread would.
    void emit(EventKind kind, const std::string& device) {
        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(NotificationEvent{kind, device, std::nullopt});
        }
    }

    bool subscribed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(handler_);
    }

    void set_devices(std::vector<Device> devices) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_ = std::move(devices);
    }

    void set_status(const DeviceStatus& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[status.true_name] = status;
    }

    void set_status_error(const std::string& true_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_errors_.insert(true_name);
    }

    void set_assignments(std::vector<MatrixAssignment> assignments) {
        std::lock_guard<std::mutex> lock(mutex_);
        assignments_ = std::move(assignments);
    }

    std::vector<std::vector<std::string>> status_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_requests_;
    }

    std::optional<PowerState> power(const std::string& true_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = power_.find(true_name);
        if (it == power_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void close_gate() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        gate_closed_ = true;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            gate_closed_ = false;
        }
        gate_cv_.notify_all();
    }

    // Blocks until `count` fetches are parked at the closed gate.
    bool wait_until_gated(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        return gate_cv_.wait_for(lock, timeout, [&] { return gated_ >= count; });
    }

    std::atomic_int controller_calls{0};
    std::atomic_int descriptor_calls{0};
    std::atomic_int status_calls{0};
    std::atomic_int matrix_calls{0};
    std::atomic_int matrix_set_calls{0};
    std::atomic_int power_calls{0};

    std::atomic_bool fail_controller{false};
    std::atomic_bool fail_descriptors{false};
    std::atomic_bool fail_status{false};
    std::atomic_bool fail_matrix{false};

private:
    void pass_gate() {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        if (!gate_closed_) {
            return;
        }
        ++gated_;
        gate_cv_.notify_all();
        gate_cv_.wait(lock, [this] { return !gate_closed_; });
        --gated_;
    }

    mutable std::mutex mutex_;
    std::mutex delivery_mutex_;
    std::vector<Device> devices_;
    std::map<std::string, DeviceStatus> statuses_;
    std::set<std::string> status_errors_;
    std::vector<MatrixAssignment> assignments_;
    std::vector<std::vector<std::string>> status_requests_;
    std::map<std::string, PowerState> power_;
    NotificationHandler handler_;

    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool gate_closed_{false};
    int gated_{0};
};

}  // namespace nhdsync::testing
