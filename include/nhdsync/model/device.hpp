#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nhdsync {

enum class DeviceRole {
    Encoder,
    Decoder,
};

std::string_view to_string(DeviceRole role);

// Accepts the controller spellings (encoder/transmitter/tx, decoder/receiver/rx)
// in any case. Throws DataIntegrityError for anything else.
DeviceRole parse_device_role(std::string_view value);

// Descriptor of an endpoint as reported by the controller.
struct Device {
    std::string true_name;
    std::string alias;
    DeviceRole role{DeviceRole::Encoder};
    bool online{false};
    std::string ip;
    std::string mac;
    int sequence{0};
};

// Transient signal attributes of one endpoint.
struct DeviceStatus {
    std::string true_name;
    bool online{true};
    bool input_active{false};
    bool output_active{false};
    std::string resolution;
    std::string audio_format;
    std::string hdcp_mode;
};

// Per-device outcome of a batch status call. Exactly one of status/error is set.
struct DeviceStatusResult {
    std::string true_name;
    std::optional<DeviceStatus> status;
    std::string error;
};

struct MatrixAssignment {
    std::string decoder;
    std::optional<std::string> encoder;
};

struct ControllerInfo {
    std::string api_version;
    std::string web_version;
    std::string core_version;
    std::string ip4addr;
    std::string netmask;
    std::string gateway;
};

enum class PowerState {
    On,
    Off,
};

std::string_view to_string(PowerState state);

// Throws std::invalid_argument unless the value is "on" or "off".
PowerState parse_power_state(std::string_view value);

// "Encoder - Lounge TV", falling back to the IP address and then the true name
// when the alias is empty.
std::string display_name(const Device& device);

}  // namespace nhdsync
