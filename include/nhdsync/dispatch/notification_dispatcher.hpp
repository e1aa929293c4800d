#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "nhdsync/api/device_api.hpp"
#include "nhdsync/engine/refresh_engine.hpp"
#include "nhdsync/model/section.hpp"

namespace nhdsync {

struct EventRoute {
    SectionSet sections;
    // Refresh only the device named in the event instead of the whole section.
    bool device_scoped{false};
    bool bypass_cache{false};
};

// Static event kind -> section table.
EventRoute route_for(EventKind kind);

/**
 * @brief Turns device notifications into debounced selective refreshes.
 *
 * Events are accumulated on a strand; the first event of a burst arms a timer
 * for the debounce window and everything that arrives before it fires is
 * folded into a single RefreshRequest.
 *
 * stop() returns once no queued handler can touch the dispatcher any more,
 * so the object may be destroyed right after it while the io_context keeps
 * running. It must not be called from a handler on a single-threaded
 * io_context other than this dispatcher's own strand.
 */
class NotificationDispatcher {
public:
    NotificationDispatcher(boost::asio::io_context& io_context,
                           DeviceApi& api,
                           RefreshEngine& engine,
                           std::chrono::milliseconds debounce_window);

    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void start();
    void stop();

    // Entry point for the transport callback; safe to call from any thread.
    void handle_event(const NotificationEvent& event);

    std::uint64_t events_received() const { return events_received_.load(); }
    std::uint64_t refreshes_dispatched() const { return refreshes_dispatched_.load(); }

private:
    struct Pending {
        SectionSet sections;
        std::set<std::string> status_devices;
        bool status_all{false};
        bool bypass_cache{false};
    };

    // Every handler queued on the io_context is counted so stop() can wait
    // for the last one.
    bool begin_op();
    void end_op();
    void wait_idle();

    void enqueue(const NotificationEvent& event);
    void arm_timer();
    void flush();

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    DeviceApi& api_;
    RefreshEngine& engine_;
    std::chrono::milliseconds debounce_window_;
    Subscription subscription_;
    Pending pending_;
    bool timer_armed_{false};
    std::mutex lifecycle_mutex_;
    std::condition_variable idle_cv_;
    int pending_ops_{0};
    std::atomic_bool running_{false};
    std::atomic_uint64_t events_received_{0};
    std::atomic_uint64_t refreshes_dispatched_{0};
};

}  // namespace nhdsync
