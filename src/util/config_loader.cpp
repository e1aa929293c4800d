#include "nhdsync/util/config_loader.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace nhdsync::util {

namespace {

constexpr int kMinUpdateIntervalS = 10;
constexpr int kMaxUpdateIntervalS = 300;

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    return node.as<T>();
}

template <typename T>
T scalar_or(const YAML::Node& node, const std::string& field, T fallback) {
    if (!node) {
        return fallback;
    }
    return scalar_or_throw<T>(node, field);
}

void require_positive(long long value, const std::string& field) {
    if (value <= 0) {
        throw std::runtime_error("Field '" + field + "' must be positive");
    }
}

void load_controller(const YAML::Node& node, ControllerEndpoint& controller) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("'controller' must be a mapping");
    }
    controller.host = scalar_or<std::string>(node["host"], "controller.host", controller.host);
    controller.port = scalar_or<int>(node["port"], "controller.port", controller.port);
    controller.username = scalar_or<std::string>(node["username"], "controller.username", controller.username);
    controller.password = scalar_or<std::string>(node["password"], "controller.password", controller.password);
    controller.ssh_timeout_s =
        scalar_or<int>(node["ssh_timeout_s"], "controller.ssh_timeout_s", controller.ssh_timeout_s);
    if (controller.port <= 0 || controller.port > 65535) {
        throw std::runtime_error("Field 'controller.port' must be between 1 and 65535");
    }
    require_positive(controller.ssh_timeout_s, "controller.ssh_timeout_s");
}

void load_coordinator(const YAML::Node& node, AppConfig& config) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("'coordinator' must be a mapping");
    }
    auto& coordinator = config.coordinator;

    const auto interval = scalar_or<int>(node["update_interval_s"], "coordinator.update_interval_s",
                                         static_cast<int>(coordinator.update_interval.count()));
    if (interval < kMinUpdateIntervalS || interval > kMaxUpdateIntervalS) {
        throw std::runtime_error("Field 'coordinator.update_interval_s' must be between " +
                                 std::to_string(kMinUpdateIntervalS) + " and " +
                                 std::to_string(kMaxUpdateIntervalS) + " seconds");
    }
    coordinator.update_interval = std::chrono::seconds(interval);

    const auto ttl = scalar_or<long long>(node["device_cache_ttl_s"], "coordinator.device_cache_ttl_s",
                                          coordinator.device_cache_ttl.count());
    require_positive(ttl, "coordinator.device_cache_ttl_s");
    coordinator.device_cache_ttl = std::chrono::seconds(ttl);

    const auto debounce =
        scalar_or<long long>(node["debounce_ms"], "coordinator.debounce_ms", coordinator.debounce.count());
    if (debounce < 0) {
        throw std::runtime_error("Field 'coordinator.debounce_ms' must not be negative");
    }
    coordinator.debounce = std::chrono::milliseconds(debounce);

    const auto retry_base =
        scalar_or<long long>(node["retry_base_s"], "coordinator.retry_base_s", coordinator.retry_base.count());
    const auto retry_max =
        scalar_or<long long>(node["retry_max_s"], "coordinator.retry_max_s", coordinator.retry_max.count());
    require_positive(retry_base, "coordinator.retry_base_s");
    if (retry_max < retry_base) {
        throw std::runtime_error("Field 'coordinator.retry_max_s' must not be below retry_base_s");
    }
    coordinator.retry_base = std::chrono::seconds(retry_base);
    coordinator.retry_max = std::chrono::seconds(retry_max);

    config.worker_threads = scalar_or<int>(node["worker_threads"], "coordinator.worker_threads", config.worker_threads);
    require_positive(config.worker_threads, "coordinator.worker_threads");
}

}  // namespace

AppConfig load_config(const std::filesystem::path& path) {
    YAML::Node root = YAML::LoadFile(path.string());
    if (!root.IsMap()) {
        throw std::runtime_error(path.string() + " must contain a mapping");
    }

    AppConfig config;
    load_controller(root["controller"], config.controller);

    config.fixture_path = scalar_or_throw<std::string>(root["fixture_path"], "fixture_path");
    if (config.fixture_path.is_relative()) {
        config.fixture_path = path.parent_path() / config.fixture_path;
    }

    load_coordinator(root["coordinator"], config);

    if (auto logging = root["logging"]; logging) {
        config.log_level = scalar_or<std::string>(logging["level"], "logging.level", config.log_level);
    }
    if (auto output = root["output"]; output) {
        config.snapshot_path =
            scalar_or<std::string>(output["snapshot_path"], "output.snapshot_path", std::string{});
        if (!config.snapshot_path.empty() && config.snapshot_path.is_relative()) {
            config.snapshot_path = path.parent_path() / config.snapshot_path;
        }
    }
    return config;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --config <nhdsync.yaml>\n";
}

Options parse_options(int argc, char** argv) {
    Options opt;
    bool has_config = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
            has_config = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }

    if (!has_config) {
        throw std::runtime_error("--config is required");
    }
    return opt;
}

}  // namespace nhdsync::util
