#include "nhdsync/model/device.hpp"

#include "nhdsync/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nhdsync {

namespace {

std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

}  // namespace

std::string_view to_string(DeviceRole role) {
    return role == DeviceRole::Encoder ? "encoder" : "decoder";
}

DeviceRole parse_device_role(std::string_view value) {
    const auto lower = to_lower(value);
    if (lower == "encoder" || lower == "transmitter" || lower == "tx") {
        return DeviceRole::Encoder;
    }
    if (lower == "decoder" || lower == "receiver" || lower == "rx") {
        return DeviceRole::Decoder;
    }
    throw DataIntegrityError("Unknown device role: '" + std::string(value) + "'");
}

std::string_view to_string(PowerState state) {
    return state == PowerState::On ? "on" : "off";
}

PowerState parse_power_state(std::string_view value) {
    if (value == "on") {
        return PowerState::On;
    }
    if (value == "off") {
        return PowerState::Off;
    }
    throw std::invalid_argument("Invalid power state: '" + std::string(value) + "'");
}

std::string display_name(const Device& device) {
    std::string label = device.role == DeviceRole::Encoder ? "Encoder" : "Decoder";
    if (!device.alias.empty()) {
        return label + " - " + device.alias;
    }
    if (!device.ip.empty()) {
        return label + " - " + device.ip;
    }
    return label + " - " + (device.true_name.empty() ? std::string("Unknown") : device.true_name);
}

}  // namespace nhdsync
