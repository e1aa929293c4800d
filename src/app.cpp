#include "nhdsync/app.hpp"

#include <csignal>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>

#include "nhdsync/snapshot_json.hpp"
#include "nhdsync/util/logging.hpp"

namespace nhdsync {

DaemonApp::DaemonApp(boost::asio::io_context& io_context, util::AppConfig config)
    : config_(std::move(config)),
      api_(FixtureDeviceApi::from_json_file(config_.fixture_path)),
      coordinator_(io_context, api_, config_.coordinator) {}

void DaemonApp::start() {
    util::log::info("Using fleet fixture " + config_.fixture_path.string() + " for controller " +
                    config_.controller.host + ":" + std::to_string(config_.controller.port));
    change_subscription_ = coordinator_.subscribe_to_changes([this](const ChangeEvent& event) { on_change(event); });
    coordinator_.start();
}

void DaemonApp::stop() {
    coordinator_.stop();
    if (change_subscription_ != 0) {
        coordinator_.unsubscribe(change_subscription_);
        change_subscription_ = 0;
    }
}

void DaemonApp::on_change(const ChangeEvent& event) {
    const auto section = std::string(to_string(event.section));
    if (event.degraded) {
        util::log::warn("Section " + section + " degraded at version " + std::to_string(event.version) + ": " +
                        event.error);
        return;
    }
    util::log::info("Section " + section + " updated to version " + std::to_string(event.version));

    if (config_.snapshot_path.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(dump_mutex_);
    try {
        write_snapshot_file(*coordinator_.read_snapshot(), config_.snapshot_path);
    } catch (const std::exception& ex) {
        util::log::error("Failed to write snapshot to " + config_.snapshot_path.string() + ": " + ex.what());
    }
}

int run(const std::string& config_path) {
    try {
        auto config = util::load_config(config_path);
        util::log::set_level(config.log_level);

        boost::asio::io_context io_context;
        auto work = boost::asio::make_work_guard(io_context);

        DaemonApp app(io_context, config);
        app.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log::info("Signal received, shutting down...");
            work.reset();
            io_context.stop();
        });

        std::vector<std::thread> workers;
        for (int i = 1; i < config.worker_threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }
        app.stop();
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace nhdsync
