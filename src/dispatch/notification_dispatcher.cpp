#include "nhdsync/dispatch/notification_dispatcher.hpp"

#include "nhdsync/util/logging.hpp"

#include <boost/asio/post.hpp>

#include <utility>

namespace nhdsync {

EventRoute route_for(EventKind kind) {
    switch (kind) {
        case EventKind::DeviceOnline:
        case EventKind::DeviceOffline:
            return EventRoute{.sections = {Section::Device}, .device_scoped = false, .bypass_cache = true};
        case EventKind::VideoFound:
        case EventKind::VideoLost:
            return EventRoute{.sections = {Section::DeviceStatus}, .device_scoped = true, .bypass_cache = false};
        case EventKind::SinkPowerChanged:
            // Display power is not part of any monitored section.
            return EventRoute{};
    }
    return EventRoute{};
}

NotificationDispatcher::NotificationDispatcher(boost::asio::io_context& io_context,
                                               DeviceApi& api,
                                               RefreshEngine& engine,
                                               std::chrono::milliseconds debounce_window)
    : io_context_(io_context),
      strand_(boost::asio::make_strand(io_context)),
      timer_(strand_),
      api_(api),
      engine_(engine),
      debounce_window_(debounce_window) {}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) {
            return;
        }
        running_.store(true);
    }
    subscription_ = api_.subscribe_notifications([this](const NotificationEvent& event) { handle_event(event); });
    util::log::info("Listening for device notifications");
}

void NotificationDispatcher::stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        was_running = running_.load();
        if (was_running) {
            running_.store(false);
            ++pending_ops_;
        }
    }
    const bool on_strand = strand_.running_in_this_thread();
    if (was_running) {
        subscription_.reset();
        auto cancel = [this] {
            timer_.cancel();
            timer_armed_ = false;
            pending_ = Pending{};
            end_op();
        };
        if (on_strand) {
            cancel();
        } else {
            boost::asio::post(strand_, std::move(cancel));
        }
        util::log::info("Stopped listening for device notifications");
    }
    if (!on_strand) {
        wait_idle();
    }
}

void NotificationDispatcher::handle_event(const NotificationEvent& event) {
    if (!begin_op()) {
        return;
    }
    ++events_received_;
    boost::asio::post(strand_, [this, event] {
        enqueue(event);
        end_op();
    });
}

bool NotificationDispatcher::begin_op() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return false;
    }
    ++pending_ops_;
    return true;
}

void NotificationDispatcher::end_op() {
    // Notify under the lock: the waiter may destroy *this as soon as it can
    // observe zero.
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    --pending_ops_;
    idle_cv_.notify_all();
}

void NotificationDispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    // Handlers of a stopped io_context never run; they are destroyed with it.
    while (pending_ops_ > 0 && !io_context_.stopped()) {
        idle_cv_.wait_for(lock, std::chrono::milliseconds(10));
    }
}

void NotificationDispatcher::enqueue(const NotificationEvent& event) {
    if (!running_.load()) {
        return;
    }
    const auto route = route_for(event.kind);
    util::log::info("Notification " + std::string(to_string(event.kind)) + " for " + event.device +
                    " -> " + to_string(route.sections));
    if (route.sections.empty()) {
        return;
    }

    pending_.sections.merge(route.sections);
    pending_.bypass_cache = pending_.bypass_cache || route.bypass_cache;
    if (route.sections.contains(Section::DeviceStatus)) {
        if (route.device_scoped && !event.device.empty()) {
            pending_.status_devices.insert(event.device);
        } else {
            pending_.status_all = true;
        }
    }
    arm_timer();
}

void NotificationDispatcher::arm_timer() {
    if (timer_armed_ || !begin_op()) {
        return;
    }
    timer_armed_ = true;
    timer_.expires_after(debounce_window_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            timer_armed_ = false;
            flush();
        }
        end_op();
    });
}

void NotificationDispatcher::flush() {
    if (!running_.load() || pending_.sections.empty()) {
        pending_ = Pending{};
        return;
    }

    RefreshRequest request;
    request.sections = pending_.sections;
    request.bypass_cache = pending_.bypass_cache;
    if (!pending_.status_all) {
        request.status_devices.assign(pending_.status_devices.begin(), pending_.status_devices.end());
    }
    pending_ = Pending{};

    ++refreshes_dispatched_;
    const auto report = engine_.refresh(request);
    if (!report.ok()) {
        util::log::warn("Notification-triggered refresh of " + to_string(request.sections) + " was degraded");
    }
}

}  // namespace nhdsync
