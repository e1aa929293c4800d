#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nhdsync/model/device.hpp"
#include "nhdsync/model/section.hpp"
#include "nhdsync/model/snapshot.hpp"

namespace nhdsync {

struct ChangeEvent {
    Section section{Section::Device};
    std::uint64_t version{0};
    // Set when a refresh of the section failed; version is then the retained one.
    bool degraded{false};
    std::string error;
};

// Holds the latest merged snapshot. Every apply_* call replaces exactly one
// section and bumps its version in a single atomic publish; readers never
// wait on the write mutex.
class SnapshotStore {
public:
    using ChangeHandler = std::function<void(const ChangeEvent&)>;
    using SubscriptionId = std::uint64_t;

    SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    std::shared_ptr<const Snapshot> read() const;

    // Each apply_* returns the new section version. Payloads that break a
    // section invariant throw DataIntegrityError and publish nothing.
    std::uint64_t apply_devices(std::vector<Device> devices);
    std::uint64_t apply_statuses(StatusMap statuses);
    std::uint64_t apply_assignments(const std::vector<MatrixAssignment>& assignments);

    void set_controller(ControllerInfo info);

    // Publishes a degraded event for the section without touching its data.
    void report_failure(Section section, const std::string& error);

    SubscriptionId subscribe(ChangeHandler handler);
    void unsubscribe(SubscriptionId id);

private:
    template <typename Mutator>
    std::uint64_t publish(Section section, Mutator&& mutate);

    void notify(const ChangeEvent& event) const;

    mutable std::mutex write_mutex_;
    std::atomic<std::shared_ptr<const Snapshot>> current_;

    mutable std::mutex handlers_mutex_;
    std::map<SubscriptionId, ChangeHandler> handlers_;
    SubscriptionId next_subscription_{1};
};

}  // namespace nhdsync
