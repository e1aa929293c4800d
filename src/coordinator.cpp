#include "nhdsync/coordinator.hpp"

#include "nhdsync/util/logging.hpp"

#include <stdexcept>
#include <utility>

namespace nhdsync {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& value : values) {
        if (!out.empty()) {
            out += ", ";
        }
        out += value;
    }
    return out;
}

}  // namespace

Coordinator::Coordinator(boost::asio::io_context& io_context, DeviceApi& api, CoordinatorConfig config)
    : api_(api),
      config_(config),
      store_(),
      engine_(api_, store_, RefreshEngineConfig{.device_cache_ttl = config_.device_cache_ttl}),
      scheduler_(io_context, engine_,
                 PollSchedulerConfig{.interval = config_.update_interval,
                                     .retry_base = config_.retry_base,
                                     .retry_max = config_.retry_max}),
      dispatcher_(io_context, api_, engine_, config_.debounce) {
    ready_subscription_ = store_.subscribe([this](const ChangeEvent& event) {
        if (event.section == Section::Device && !event.degraded) {
            std::lock_guard<std::mutex> lock(ready_mutex_);
            ready_cv_.notify_all();
        }
    });
}

Coordinator::~Coordinator() {
    stop();
    store_.unsubscribe(ready_subscription_);
}

void Coordinator::start() {
    if (started_) {
        return;
    }
    util::log::info("Starting coordinator setup");
    store_.set_controller(api_.fetch_controller_info());

    dispatcher_.start();
    const auto next_delay = scheduler_.tick();
    if (scheduler_.state() == PollState::Failed) {
        util::log::warn("Initial refresh incomplete, serving partial data until the next attempt");
    }
    scheduler_.start(next_delay);
    started_ = true;

    const auto snapshot = store_.read();
    util::log::info("Coordinator setup complete: " + std::to_string(snapshot->encoders().size()) +
                    " encoders, " + std::to_string(snapshot->decoders().size()) + " decoders, " +
                    std::to_string(snapshot->assignments().size()) + " matrix assignments");
}

void Coordinator::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    // Cancel the engine first so a refresh running on the io_context returns
    // promptly and the scheduler and dispatcher can drain.
    engine_.shutdown();
    scheduler_.stop();
    dispatcher_.stop();
    util::log::info("Coordinator shutdown complete");
}

std::shared_ptr<const Snapshot> Coordinator::read_snapshot() const {
    return store_.read();
}

SnapshotStore::SubscriptionId Coordinator::subscribe_to_changes(SnapshotStore::ChangeHandler handler) {
    return store_.subscribe(std::move(handler));
}

void Coordinator::unsubscribe(SnapshotStore::SubscriptionId id) {
    store_.unsubscribe(id);
}

RefreshReport Coordinator::request_refresh(SectionSet sections) {
    return engine_.refresh(sections);
}

RefreshReport Coordinator::request_refresh(const RefreshRequest& request) {
    return engine_.refresh(request);
}

RefreshReport Coordinator::invoke_matrix_set(const std::optional<std::string>& source,
                                             const std::vector<std::string>& targets) {
    if (targets.empty()) {
        throw std::invalid_argument("Matrix set requires at least one target");
    }

    const auto snapshot = store_.read();
    if (snapshot->populated(Section::Device)) {
        for (const auto& target : targets) {
            const auto* device = snapshot->find_device(target);
            if (device == nullptr || device->role != DeviceRole::Decoder || device->alias != target) {
                throw std::invalid_argument("Target device '" + target + "' not found");
            }
        }
        if (source) {
            const auto* device = snapshot->find_device(*source);
            if (device == nullptr || device->role != DeviceRole::Encoder || device->alias != *source) {
                throw std::invalid_argument("Source device '" + *source + "' not found");
            }
        }
    }

    if (source) {
        api_.set_matrix(*source, targets);
        util::log::info("Matrix set successful: " + *source + " -> " + join(targets));
    } else {
        api_.set_matrix_null(targets);
        util::log::info("Disconnected decoders: " + join(targets));
    }

    // Routing cannot change online state or descriptors.
    RefreshRequest request;
    request.sections = {Section::MatrixAssignment};
    request.after_command = true;
    return engine_.refresh(request);
}

void Coordinator::invoke_power(const std::vector<std::string>& targets, std::string_view state) {
    const auto power = parse_power_state(state);
    if (targets.empty()) {
        throw std::invalid_argument("Power control requires at least one device");
    }

    std::vector<std::string> resolved;
    resolved.reserve(targets.size());
    const auto snapshot = store_.read();
    for (const auto& target : targets) {
        if (!snapshot->populated(Section::Device)) {
            resolved.push_back(target);
            continue;
        }
        const auto* device = snapshot->find_device(target);
        if (device == nullptr || device->role != DeviceRole::Decoder) {
            throw std::invalid_argument("Device '" + target + "' not found or does not support power control");
        }
        resolved.push_back(device->true_name);
    }

    api_.set_display_power(resolved, power);
    // Display power is not tracked by any section, so nothing goes stale.
    util::log::info("Power control successful: " + join(resolved) + " -> " + std::string(to_string(power)));
}

bool Coordinator::is_ready() const {
    return store_.read()->populated(Section::Device);
}

bool Coordinator::wait_for_data(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(ready_mutex_);
    return ready_cv_.wait_for(lock, timeout, [this] { return is_ready(); });
}

std::size_t Coordinator::device_count() const {
    return store_.read()->devices().size();
}

std::vector<Device> Coordinator::encoders() const {
    return store_.read()->encoders();
}

std::vector<Device> Coordinator::decoders() const {
    return store_.read()->decoders();
}

}  // namespace nhdsync
