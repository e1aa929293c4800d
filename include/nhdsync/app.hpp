#pragma once

#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>

#include "nhdsync/api/fixture_device_api.hpp"
#include "nhdsync/coordinator.hpp"
#include "nhdsync/util/config_loader.hpp"

namespace nhdsync {

class DaemonApp {
public:
    DaemonApp(boost::asio::io_context& io_context, util::AppConfig config);

    void start();
    void stop();

private:
    void on_change(const ChangeEvent& event);

    util::AppConfig config_;
    FixtureDeviceApi api_;
    Coordinator coordinator_;
    SnapshotStore::SubscriptionId change_subscription_{0};
    std::mutex dump_mutex_;
};

int run(const std::string& config_path);

}  // namespace nhdsync
