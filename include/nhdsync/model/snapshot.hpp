#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nhdsync/model/device.hpp"
#include "nhdsync/model/section.hpp"

namespace nhdsync {

using DeviceMap = std::map<std::string, Device>;        // keyed by true name
using StatusMap = std::map<std::string, DeviceStatus>;  // keyed by true name
// Decoder alias -> encoder alias, nullopt when the decoder has no source.
using AssignmentMap = std::map<std::string, std::optional<std::string>>;

struct SectionStamp {
    std::uint64_t version{0};
    std::chrono::system_clock::time_point updated_at{};
};

enum class Availability {
    Available,
    Unavailable,
};

// Immutable merged view of the fleet. Instances are only produced by
// SnapshotStore and shared between readers; section payloads are shared
// between consecutive snapshots when they did not change.
class Snapshot {
public:
    Snapshot();

    const DeviceMap& devices() const { return *devices_; }
    const StatusMap& statuses() const { return *statuses_; }
    const AssignmentMap& assignments() const { return *assignments_; }
    const std::optional<ControllerInfo>& controller() const { return controller_; }

    SectionStamp stamp(Section section) const { return stamps_[section_index(section)]; }
    std::uint64_t version(Section section) const { return stamp(section).version; }
    bool populated(Section section) const { return version(section) > 0; }

    // Lookup by true name first, then by alias.
    const Device* find_device(std::string_view name) const;
    const DeviceStatus* find_status(std::string_view true_name) const;

    std::vector<Device> encoders() const;
    std::vector<Device> decoders() const;

    Availability availability(std::string_view name) const;

    // Encoder: input signal present. Decoder: output signal present. Both
    // require a reported resolution; nullopt while the device is unavailable.
    std::optional<bool> video_active(std::string_view name) const;

    std::optional<std::string> assigned_encoder(std::string_view decoder_alias) const;

private:
    friend class SnapshotStore;

    std::shared_ptr<const DeviceMap> devices_;
    std::shared_ptr<const StatusMap> statuses_;
    std::shared_ptr<const AssignmentMap> assignments_;
    std::optional<ControllerInfo> controller_;
    std::array<SectionStamp, kSectionCount> stamps_{};
};

}  // namespace nhdsync
