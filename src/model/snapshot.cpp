#include "nhdsync/model/snapshot.hpp"

namespace nhdsync {

Snapshot::Snapshot()
    : devices_(std::make_shared<const DeviceMap>()),
      statuses_(std::make_shared<const StatusMap>()),
      assignments_(std::make_shared<const AssignmentMap>()) {}

const Device* Snapshot::find_device(std::string_view name) const {
    auto it = devices_->find(std::string(name));
    if (it != devices_->end()) {
        return &it->second;
    }
    for (const auto& [true_name, device] : *devices_) {
        (void)true_name;
        if (device.alias == name) {
            return &device;
        }
    }
    return nullptr;
}

const DeviceStatus* Snapshot::find_status(std::string_view true_name) const {
    auto it = statuses_->find(std::string(true_name));
    if (it == statuses_->end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<Device> Snapshot::encoders() const {
    std::vector<Device> out;
    for (const auto& [name, device] : *devices_) {
        (void)name;
        if (device.role == DeviceRole::Encoder) {
            out.push_back(device);
        }
    }
    return out;
}

std::vector<Device> Snapshot::decoders() const {
    std::vector<Device> out;
    for (const auto& [name, device] : *devices_) {
        (void)name;
        if (device.role == DeviceRole::Decoder) {
            out.push_back(device);
        }
    }
    return out;
}

Availability Snapshot::availability(std::string_view name) const {
    const auto* device = find_device(name);
    if (device == nullptr || !device->online) {
        return Availability::Unavailable;
    }
    const auto* status = find_status(device->true_name);
    if (status != nullptr && !status->online) {
        return Availability::Unavailable;
    }
    return Availability::Available;
}

std::optional<bool> Snapshot::video_active(std::string_view name) const {
    if (availability(name) == Availability::Unavailable) {
        return std::nullopt;
    }
    const auto* device = find_device(name);
    const auto* status = find_status(device->true_name);
    if (status == nullptr) {
        return std::nullopt;
    }
    const bool signal = device->role == DeviceRole::Encoder ? status->input_active : status->output_active;
    return signal && !status->resolution.empty();
}

std::optional<std::string> Snapshot::assigned_encoder(std::string_view decoder_alias) const {
    auto it = assignments_->find(std::string(decoder_alias));
    if (it == assignments_->end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace nhdsync
