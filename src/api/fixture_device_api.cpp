#include "nhdsync/api/fixture_device_api.hpp"

#include "nhdsync/errors.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace nhdsync {

namespace {

using json = nlohmann::json;

ControllerInfo parse_controller(const json& node) {
    ControllerInfo info;
    info.api_version = node.value("api_version", "");
    info.web_version = node.value("web_version", "");
    info.core_version = node.value("core_version", "");
    info.ip4addr = node.value("ip4addr", "");
    info.netmask = node.value("netmask", "");
    info.gateway = node.value("gateway", "");
    return info;
}

DeviceStatus parse_status(const std::string& true_name, const json& node) {
    DeviceStatus status;
    status.true_name = true_name;
    status.online = true;
    if (!node.is_object()) {
        return status;
    }
    status.input_active = node.value("input_active", false);
    status.output_active = node.value("output_active", false);
    status.resolution = node.value("resolution", "");
    status.audio_format = node.value("audio_format", "");
    status.hdcp_mode = node.value("hdcp_mode", "");
    return status;
}

}  // namespace

FixtureDeviceApi::FixtureDeviceApi(FixtureDeviceApi&& other) noexcept {
    std::scoped_lock lock(other.mutex_, other.handlers_mutex_);
    controller_ = std::move(other.controller_);
    devices_ = std::move(other.devices_);
    matrix_ = std::move(other.matrix_);
    transport_failing_ = other.transport_failing_;
    calls_ = other.calls_;
    handlers_ = std::move(other.handlers_);
    next_handler_ = other.next_handler_;
}

FixtureDeviceApi FixtureDeviceApi::from_json(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("Fixture JSON must contain an object at the root");
    }

    FixtureDeviceApi api;
    if (root.contains("controller")) {
        api.controller_ = parse_controller(root.at("controller"));
    }

    const auto& devices = root.at("devices");
    if (!devices.is_array()) {
        throw std::runtime_error("Fixture 'devices' must be an array");
    }
    for (const auto& entry : devices) {
        FleetDevice device;
        device.descriptor.true_name = entry.at("true_name").get<std::string>();
        device.descriptor.alias = entry.value("alias", device.descriptor.true_name);
        device.descriptor.role = parse_device_role(entry.at("role").get<std::string>());
        device.descriptor.online = entry.value("online", true);
        device.descriptor.ip = entry.value("ip", "");
        device.descriptor.mac = entry.value("mac", "");
        device.descriptor.sequence = entry.value("sequence", 0);
        device.reachable = entry.value("reachable", true);
        device.status = parse_status(device.descriptor.true_name,
                                     entry.contains("status") ? entry.at("status") : json::object());

        auto name = device.descriptor.true_name;
        if (!api.devices_.emplace(name, std::move(device)).second) {
            throw std::runtime_error("Fixture lists device '" + name + "' twice");
        }
    }

    if (root.contains("matrix")) {
        for (const auto& entry : root.at("matrix")) {
            auto decoder = entry.at("decoder").get<std::string>();
            std::optional<std::string> encoder;
            if (entry.contains("encoder") && !entry.at("encoder").is_null()) {
                encoder = entry.at("encoder").get<std::string>();
            }
            api.matrix_[decoder] = std::move(encoder);
        }
    }
    return api;
}

FixtureDeviceApi FixtureDeviceApi::from_json_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open fixture file: " + path.string());
    }
    json root;
    input >> root;
    return from_json(root);
}

ControllerInfo FixtureDeviceApi::fetch_controller_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    return controller_;
}

std::vector<Device> FixtureDeviceApi::fetch_device_descriptors() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& [name, device] : devices_) {
        (void)name;
        out.push_back(device.descriptor);
    }
    return out;
}

std::vector<DeviceStatusResult> FixtureDeviceApi::fetch_device_status(const std::vector<std::string>& device_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    std::vector<DeviceStatusResult> out;
    out.reserve(device_ids.size());
    for (const auto& id : device_ids) {
        DeviceStatusResult result;
        result.true_name = id;
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            result.error = "unknown device";
        } else if (!it->second.reachable || !it->second.descriptor.online) {
            result.error = "device did not respond";
        } else {
            result.status = it->second.status;
        }
        out.push_back(std::move(result));
    }
    return out;
}

std::vector<MatrixAssignment> FixtureDeviceApi::fetch_matrix_assignments() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    std::vector<MatrixAssignment> out;
    out.reserve(matrix_.size());
    for (const auto& [decoder, encoder] : matrix_) {
        out.push_back(MatrixAssignment{decoder, encoder});
    }
    return out;
}

void FixtureDeviceApi::set_matrix(const std::string& source, const std::vector<std::string>& targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    auto* encoder = find_by_alias_locked(source);
    if (encoder == nullptr || encoder->descriptor.role != DeviceRole::Encoder) {
        throw TransportError("matrix set rejected: unknown source " + source);
    }
    for (const auto& target : targets) {
        auto* decoder = find_by_alias_locked(target);
        if (decoder == nullptr || decoder->descriptor.role != DeviceRole::Decoder) {
            throw TransportError("matrix set rejected: unknown target " + target);
        }
    }
    for (const auto& target : targets) {
        matrix_[target] = source;
    }
}

void FixtureDeviceApi::set_matrix_null(const std::vector<std::string>& targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_transport_locked();
    for (const auto& target : targets) {
        auto* decoder = find_by_alias_locked(target);
        if (decoder == nullptr || decoder->descriptor.role != DeviceRole::Decoder) {
            throw TransportError("matrix set rejected: unknown target " + target);
        }
    }
    for (const auto& target : targets) {
        matrix_[target] = std::nullopt;
    }
}

void FixtureDeviceApi::set_display_power(const std::vector<std::string>& targets, PowerState state) {
    std::vector<NotificationEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_transport_locked();
        for (const auto& target : targets) {
            auto it = devices_.find(target);
            if (it == devices_.end() || it->second.descriptor.role != DeviceRole::Decoder) {
                throw TransportError("sink power rejected: " + target + " is not a decoder");
            }
        }
        for (const auto& target : targets) {
            device_locked(target).sink_power = state;
            events.push_back(NotificationEvent{EventKind::SinkPowerChanged, target, state});
        }
    }
    for (const auto& event : events) {
        emit(event);
    }
}

Subscription FixtureDeviceApi::subscribe_notifications(NotificationHandler handler) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        id = next_handler_++;
        handlers_.emplace(id, std::move(handler));
    }
    return Subscription([this, id] {
        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(id);
    });
}

void FixtureDeviceApi::set_device_online(const std::string& true_name, bool online) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        device_locked(true_name).descriptor.online = online;
    }
    emit(NotificationEvent{online ? EventKind::DeviceOnline : EventKind::DeviceOffline, true_name, std::nullopt});
}

void FixtureDeviceApi::set_video_signal(const std::string& true_name, bool active) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& device = device_locked(true_name);
        if (device.descriptor.role == DeviceRole::Encoder) {
            device.status.input_active = active;
        } else {
            device.status.output_active = active;
        }
    }
    emit(NotificationEvent{active ? EventKind::VideoFound : EventKind::VideoLost, true_name, std::nullopt});
}

void FixtureDeviceApi::set_reachable(const std::string& true_name, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    device_locked(true_name).reachable = reachable;
}

void FixtureDeviceApi::set_transport_failure(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    transport_failing_ = failing;
}

std::optional<PowerState> FixtureDeviceApi::sink_power(const std::string& true_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(true_name);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.sink_power;
}

std::uint64_t FixtureDeviceApi::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

void FixtureDeviceApi::check_transport_locked() const {
    ++calls_;
    if (transport_failing_) {
        throw TransportError("controller session timed out");
    }
}

FixtureDeviceApi::FleetDevice& FixtureDeviceApi::device_locked(const std::string& true_name) {
    auto it = devices_.find(true_name);
    if (it == devices_.end()) {
        throw std::invalid_argument("Unknown fixture device: " + true_name);
    }
    return it->second;
}

FixtureDeviceApi::FleetDevice* FixtureDeviceApi::find_by_alias_locked(const std::string& alias) {
    for (auto& [name, device] : devices_) {
        (void)name;
        if (device.descriptor.alias == alias) {
            return &device;
        }
    }
    return nullptr;
}

void FixtureDeviceApi::emit(const NotificationEvent& event) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    std::vector<NotificationHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [id, handler] : handlers_) {
            (void)id;
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

}  // namespace nhdsync
