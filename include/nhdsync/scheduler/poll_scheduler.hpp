#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "nhdsync/engine/refresh_engine.hpp"

namespace nhdsync {

enum class PollState {
    Idle,
    Fetching,
    Updated,
    Failed,
};

std::string_view to_string(PollState state);

struct PollSchedulerConfig {
    std::chrono::milliseconds interval{std::chrono::seconds(60)};
    std::chrono::milliseconds retry_base{std::chrono::seconds(5)};
    std::chrono::milliseconds retry_max{std::chrono::seconds(300)};
};

/**
 * @brief Periodic full refresh with bounded exponential backoff.
 *
 * Idle -> Fetching -> Updated | Failed. After Updated the scheduler goes back
 * to Idle and waits one interval; after Failed it waits
 * retry_base * 2^(failures - 1), capped at retry_max. Readers keep seeing the
 * last good snapshot meanwhile. Selective refreshes issued elsewhere do not
 * move the timer.
 *
 * Like NotificationDispatcher, stop() waits for the queued timer handler so
 * the scheduler can be destroyed while its io_context keeps running.
 */
class PollScheduler {
public:
    using StateHandler = std::function<void(PollState)>;

    PollScheduler(boost::asio::io_context& io_context, RefreshEngine& engine, PollSchedulerConfig config);

    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    void start(std::chrono::milliseconds first_delay = std::chrono::milliseconds::zero());
    void stop();

    // Runs one Fetching cycle on the calling thread and returns the delay the
    // scheduler applies before the next one.
    std::chrono::milliseconds tick();

    void set_state_handler(StateHandler handler);

    PollState state() const;
    std::uint32_t consecutive_failures() const;
    std::uint64_t ticks() const { return ticks_.load(); }

    static std::chrono::milliseconds backoff_delay(const PollSchedulerConfig& config, std::uint32_t failures);

private:
    bool begin_op();
    void end_op();
    void wait_idle();

    void schedule(std::chrono::milliseconds delay);
    void transition(PollState next);

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    RefreshEngine& engine_;
    PollSchedulerConfig config_;

    mutable std::mutex mutex_;
    PollState state_{PollState::Idle};
    std::uint32_t failures_{0};
    StateHandler state_handler_;

    std::mutex lifecycle_mutex_;
    std::condition_variable idle_cv_;
    int pending_ops_{0};
    std::atomic_bool running_{false};
    std::atomic_uint64_t ticks_{0};
};

}  // namespace nhdsync
