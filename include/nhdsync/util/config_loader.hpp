#pragma once

#include <filesystem>
#include <string>

#include "nhdsync/coordinator.hpp"

namespace nhdsync::util {

struct ControllerEndpoint {
    std::string host;
    int port{10022};
    std::string username;
    std::string password;
    int ssh_timeout_s{10};
};

struct AppConfig {
    ControllerEndpoint controller;
    // Fleet description served by FixtureDeviceApi. Relative paths resolve
    // against the directory of the config file.
    std::filesystem::path fixture_path;
    CoordinatorConfig coordinator;
    int worker_threads{2};
    std::string log_level{"info"};
    // Empty disables the JSON snapshot dump.
    std::filesystem::path snapshot_path;
};

struct Options {
    std::string config_path;
};

AppConfig load_config(const std::filesystem::path& path);

Options parse_options(int argc, char** argv);
void print_usage(const char* argv0);

}  // namespace nhdsync::util
