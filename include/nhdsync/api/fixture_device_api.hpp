#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nhdsync/api/device_api.hpp"

namespace nhdsync {

/**
 * @brief DeviceApi over an in-memory fleet loaded from JSON.
 *
 * Stands in for the controller session: commands mutate the fleet and emit
 * the notifications a controller would send. Devices flagged unreachable
 * report per-device status errors; set_transport_failure() makes every call
 * throw TransportError.
 *
 * The object must outlive every Subscription it hands out.
 */
class FixtureDeviceApi : public DeviceApi {
public:
    FixtureDeviceApi() = default;

    static FixtureDeviceApi from_json(const nlohmann::json& root);
    static FixtureDeviceApi from_json_file(const std::filesystem::path& path);

    FixtureDeviceApi(FixtureDeviceApi&& other) noexcept;
    FixtureDeviceApi& operator=(FixtureDeviceApi&&) = delete;

    ControllerInfo fetch_controller_info() override;
    std::vector<Device> fetch_device_descriptors() override;
    std::vector<DeviceStatusResult> fetch_device_status(const std::vector<std::string>& device_ids) override;
    std::vector<MatrixAssignment> fetch_matrix_assignments() override;

    void set_matrix(const std::string& source, const std::vector<std::string>& targets) override;
    void set_matrix_null(const std::vector<std::string>& targets) override;
    void set_display_power(const std::vector<std::string>& targets, PowerState state) override;

    Subscription subscribe_notifications(NotificationHandler handler) override;

    // Simulated controller-side changes.
    void set_device_online(const std::string& true_name, bool online);
    void set_video_signal(const std::string& true_name, bool active);
    void set_reachable(const std::string& true_name, bool reachable);
    void set_transport_failure(bool failing);

    std::optional<PowerState> sink_power(const std::string& true_name) const;
    std::uint64_t call_count() const;

private:
    struct FleetDevice {
        Device descriptor;
        DeviceStatus status;
        bool reachable{true};
        std::optional<PowerState> sink_power;
    };

    void check_transport_locked() const;
    FleetDevice& device_locked(const std::string& true_name);
    FleetDevice* find_by_alias_locked(const std::string& alias);
    void emit(const NotificationEvent& event);

    mutable std::mutex mutex_;
    ControllerInfo controller_;
    std::map<std::string, FleetDevice> devices_;
    std::map<std::string, std::optional<std::string>> matrix_;
    bool transport_failing_{false};
    mutable std::uint64_t calls_{0};

    // Held while handlers run so a cancelled subscription waits them out.
    std::mutex delivery_mutex_;
    mutable std::mutex handlers_mutex_;
    std::map<std::uint64_t, NotificationHandler> handlers_;
    std::uint64_t next_handler_{1};
};

}  // namespace nhdsync
