#include "nhdsync/snapshot_json.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace nhdsync {

namespace {

using json = nlohmann::json;

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace

json to_json(const Snapshot& snapshot) {
    json root;

    json sections = json::object();
    for (auto section : kAllSections) {
        const auto stamp = snapshot.stamp(section);
        sections[std::string(to_string(section))] = {
            {"version", stamp.version},
            {"updated_at", format_timestamp(stamp.updated_at)},
        };
    }
    root["sections"] = std::move(sections);

    if (const auto& controller = snapshot.controller()) {
        root["controller"] = {
            {"api_version", controller->api_version},
            {"web_version", controller->web_version},
            {"core_version", controller->core_version},
            {"ip4addr", controller->ip4addr},
            {"netmask", controller->netmask},
            {"gateway", controller->gateway},
        };
    } else {
        root["controller"] = nullptr;
    }

    json devices = json::array();
    for (const auto& [true_name, device] : snapshot.devices()) {
        json node = {
            {"true_name", true_name},
            {"alias", device.alias},
            {"display_name", display_name(device)},
            {"role", std::string(to_string(device.role))},
            {"online", device.online},
            {"ip", device.ip},
            {"mac", device.mac},
            {"sequence", device.sequence},
            {"available", snapshot.availability(true_name) == Availability::Available},
        };
        if (const auto* status = snapshot.find_status(true_name)) {
            node["status"] = {
                {"online", status->online},
                {"input_active", status->input_active},
                {"output_active", status->output_active},
                {"resolution", status->resolution},
                {"audio_format", status->audio_format},
                {"hdcp_mode", status->hdcp_mode},
            };
        } else {
            node["status"] = nullptr;
        }
        if (auto video = snapshot.video_active(true_name)) {
            node["video_active"] = *video;
        } else {
            node["video_active"] = nullptr;
        }
        devices.push_back(std::move(node));
    }
    root["devices"] = std::move(devices);

    json matrix = json::object();
    for (const auto& [decoder, encoder] : snapshot.assignments()) {
        matrix[decoder] = encoder ? json(*encoder) : json(nullptr);
    }
    root["matrix"] = std::move(matrix);
    return root;
}

void write_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        }
        output << std::setw(2) << to_json(snapshot);
        output.flush();
        if (!output) {
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

}  // namespace nhdsync
