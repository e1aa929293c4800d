#include "nhdsync/store/snapshot_store.hpp"

#include "nhdsync/errors.hpp"
#include "nhdsync/util/logging.hpp"

#include <chrono>
#include <utility>

namespace nhdsync {

SnapshotStore::SnapshotStore() : current_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const Snapshot> SnapshotStore::read() const {
    return current_.load();
}

template <typename Mutator>
std::uint64_t SnapshotStore::publish(Section section, Mutator&& mutate) {
    std::uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto next = std::make_shared<Snapshot>(*current_.load());
        mutate(*next);
        auto& stamp = next->stamps_[section_index(section)];
        stamp.version += 1;
        stamp.updated_at = std::chrono::system_clock::now();
        version = stamp.version;
        current_.store(std::shared_ptr<const Snapshot>(std::move(next)));
    }
    notify(ChangeEvent{.section = section, .version = version, .degraded = false, .error = {}});
    return version;
}

std::uint64_t SnapshotStore::apply_devices(std::vector<Device> devices) {
    auto map = std::make_shared<DeviceMap>();
    for (auto& device : devices) {
        if (device.true_name.empty()) {
            throw DataIntegrityError("Device descriptor without a true name");
        }
        auto name = device.true_name;
        if (!map->emplace(name, std::move(device)).second) {
            throw DataIntegrityError("Duplicate device descriptor: " + name);
        }
    }
    return publish(Section::Device, [&](Snapshot& snapshot) {
        snapshot.devices_ = std::move(map);
    });
}

std::uint64_t SnapshotStore::apply_statuses(StatusMap statuses) {
    for (auto& [name, status] : statuses) {
        if (name.empty()) {
            throw DataIntegrityError("Device status without a true name");
        }
        status.true_name = name;
    }
    auto map = std::make_shared<const StatusMap>(std::move(statuses));
    return publish(Section::DeviceStatus, [&](Snapshot& snapshot) {
        snapshot.statuses_ = std::move(map);
    });
}

std::uint64_t SnapshotStore::apply_assignments(const std::vector<MatrixAssignment>& assignments) {
    auto map = std::make_shared<AssignmentMap>();
    for (const auto& assignment : assignments) {
        if (assignment.decoder.empty()) {
            throw DataIntegrityError("Matrix assignment without a decoder");
        }
        if (!map->emplace(assignment.decoder, assignment.encoder).second) {
            throw DataIntegrityError("Decoder " + assignment.decoder + " assigned more than once");
        }
    }
    return publish(Section::MatrixAssignment, [&](Snapshot& snapshot) {
        snapshot.assignments_ = std::move(map);
    });
}

void SnapshotStore::set_controller(ControllerInfo info) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<Snapshot>(*current_.load());
    next->controller_ = std::move(info);
    current_.store(std::shared_ptr<const Snapshot>(std::move(next)));
}

void SnapshotStore::report_failure(Section section, const std::string& error) {
    const auto version = read()->version(section);
    notify(ChangeEvent{.section = section, .version = version, .degraded = true, .error = error});
}

SnapshotStore::SubscriptionId SnapshotStore::subscribe(ChangeHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    const auto id = next_subscription_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void SnapshotStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(id);
}

void SnapshotStore::notify(const ChangeEvent& event) const {
    std::vector<ChangeHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            (void)id;
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            util::log::error(std::string("Change subscriber failed: ") + ex.what());
        }
    }
}

}  // namespace nhdsync
