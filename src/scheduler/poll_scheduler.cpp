#include "nhdsync/scheduler/poll_scheduler.hpp"

#include "nhdsync/util/logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace nhdsync {

namespace {
constexpr std::uint32_t kMaxBackoffShift = 16;
}

std::string_view to_string(PollState state) {
    switch (state) {
        case PollState::Idle:
            return "idle";
        case PollState::Fetching:
            return "fetching";
        case PollState::Updated:
            return "updated";
        case PollState::Failed:
            return "failed";
    }
    return "unknown";
}

PollScheduler::PollScheduler(boost::asio::io_context& io_context, RefreshEngine& engine, PollSchedulerConfig config)
    : io_context_(io_context),
      strand_(boost::asio::make_strand(io_context)),
      timer_(strand_),
      engine_(engine),
      config_(config) {}

PollScheduler::~PollScheduler() {
    stop();
}

std::chrono::milliseconds PollScheduler::backoff_delay(const PollSchedulerConfig& config, std::uint32_t failures) {
    if (failures == 0) {
        return config.interval;
    }
    const auto shift = std::min(failures - 1, kMaxBackoffShift);
    const auto delay = config.retry_base * (std::int64_t{1} << shift);
    return std::min(delay, config.retry_max);
}

void PollScheduler::start(std::chrono::milliseconds first_delay) {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) {
            return;
        }
        running_.store(true);
        ++pending_ops_;
    }
    boost::asio::post(strand_, [this, first_delay] {
        schedule(first_delay);
        end_op();
    });
}

void PollScheduler::stop() {
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
        auto cancel = [this] {
            timer_.cancel();
            end_op();
        };
        if (on_strand) {
            cancel();
        } else {
            boost::asio::post(strand_, std::move(cancel));
        }
    }
    if (!on_strand) {
        wait_idle();
    }
}

std::chrono::milliseconds PollScheduler::tick() {
    ++ticks_;
    transition(PollState::Fetching);
    const auto report = engine_.refresh(SectionSet::all());

    std::uint32_t failures = 0;
    if (report.ok()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_ = 0;
        }
        transition(PollState::Updated);
    } else {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failures = ++failures_;
        }
        transition(PollState::Failed);
    }

    const auto delay = backoff_delay(config_, failures);
    if (failures > 0) {
        util::log::warn("Full refresh failed (" + std::to_string(failures) + " in a row), retrying in " +
                        std::to_string(delay.count()) + " ms");
    } else {
        transition(PollState::Idle);
    }
    return delay;
}

void PollScheduler::set_state_handler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_handler_ = std::move(handler);
}

PollState PollScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t PollScheduler::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

bool PollScheduler::begin_op() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return false;
    }
    ++pending_ops_;
    return true;
}

void PollScheduler::end_op() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    --pending_ops_;
    idle_cv_.notify_all();
}

void PollScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    while (pending_ops_ > 0 && !io_context_.stopped()) {
        idle_cv_.wait_for(lock, std::chrono::milliseconds(10));
    }
}

void PollScheduler::schedule(std::chrono::milliseconds delay) {
    if (!begin_op()) {
        return;
    }
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && running_.load()) {
            const auto next = tick();
            schedule(next);
        }
        end_op();
    });
}

void PollScheduler::transition(PollState next) {
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = next;
        handler = state_handler_;
    }
    if (handler) {
        handler(next);
    }
}

}  // namespace nhdsync
