#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "nhdsync/api/device_api.hpp"
#include "nhdsync/dispatch/notification_dispatcher.hpp"
#include "nhdsync/engine/refresh_engine.hpp"
#include "nhdsync/scheduler/poll_scheduler.hpp"
#include "nhdsync/store/snapshot_store.hpp"

namespace nhdsync {

struct CoordinatorConfig {
    std::chrono::seconds update_interval{60};
    std::chrono::seconds device_cache_ttl{600};
    std::chrono::milliseconds debounce{1000};
    std::chrono::seconds retry_base{5};
    std::chrono::seconds retry_max{300};
};

// Facade handed to entity/UI collaborators. Owns the store, the refresh
// engine, the poll scheduler and the notification dispatcher.
class Coordinator {
public:
    Coordinator(boost::asio::io_context& io_context, DeviceApi& api, CoordinatorConfig config);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Fetches the controller descriptor (failures propagate: setup is not
    // possible without it), runs the first full refresh and starts the poll
    // timer and the notification listener.
    void start();
    void stop();

    std::shared_ptr<const Snapshot> read_snapshot() const;

    SnapshotStore::SubscriptionId subscribe_to_changes(SnapshotStore::ChangeHandler handler);
    void unsubscribe(SnapshotStore::SubscriptionId id);

    RefreshReport request_refresh(SectionSet sections);
    RefreshReport request_refresh(const RefreshRequest& request);

    // Routes targets to source, or disconnects them when source is empty, then
    // refreshes MatrixAssignment only. Unknown aliases throw
    // std::invalid_argument once the Device section is populated.
    RefreshReport invoke_matrix_set(const std::optional<std::string>& source, const std::vector<std::string>& targets);

    // Switches the displays attached to the given decoders. No section is
    // refreshed afterwards.
    void invoke_power(const std::vector<std::string>& targets, std::string_view state);

    bool is_ready() const;
    bool wait_for_data(std::chrono::milliseconds timeout) const;
    std::size_t device_count() const;
    std::vector<Device> encoders() const;
    std::vector<Device> decoders() const;

    RefreshEngine& engine() { return engine_; }
    PollScheduler& scheduler() { return scheduler_; }
    NotificationDispatcher& dispatcher() { return dispatcher_; }

private:
    DeviceApi& api_;
    CoordinatorConfig config_;
    SnapshotStore store_;
    RefreshEngine engine_;
    PollScheduler scheduler_;
    NotificationDispatcher dispatcher_;

    mutable std::mutex ready_mutex_;
    mutable std::condition_variable ready_cv_;
    SnapshotStore::SubscriptionId ready_subscription_{0};
    bool started_{false};
};

}  // namespace nhdsync
