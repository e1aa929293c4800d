#include "nhdsync/engine/refresh_engine.hpp"

#include "nhdsync/errors.hpp"
#include "nhdsync/util/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nhdsync {

namespace {

const std::string kDescriptorKey = "device_descriptors";

class RefreshCancelled : public std::runtime_error {
public:
    explicit RefreshCancelled(Section section)
        : std::runtime_error("Refresh of " + std::string(to_string(section)) + " cancelled") {}
};

DeviceStatus offline_status(const Snapshot& snapshot, const std::string& true_name) {
    DeviceStatus status;
    if (const auto* previous = snapshot.find_status(true_name)) {
        status = *previous;
    }
    status.true_name = true_name;
    status.online = false;
    return status;
}

}  // namespace

bool RefreshReport::ok() const {
    return std::all_of(outcomes.begin(), outcomes.end(), [](const SectionOutcome& outcome) {
        return outcome.ok;
    });
}

const SectionOutcome* RefreshReport::find(Section section) const {
    for (const auto& outcome : outcomes) {
        if (outcome.section == section) {
            return &outcome;
        }
    }
    return nullptr;
}

RefreshEngine::RefreshEngine(DeviceApi& api,
                             SnapshotStore& store,
                             RefreshEngineConfig config,
                             DescriptorCache::TimeSource now)
    : api_(api), store_(store), config_(config), descriptor_cache_(std::move(now)) {}

RefreshReport RefreshEngine::refresh(SectionSet sections) {
    RefreshRequest request;
    request.sections = sections;
    return refresh(request);
}

RefreshReport RefreshEngine::refresh(const RefreshRequest& request) {
    if (request.sections.contains(Section::DeviceStatus) && !request.status_devices.empty() &&
        !store_.read()->populated(Section::Device)) {
        util::log::info("Device list not loaded yet, widening scoped status refresh to a full refresh");
        RefreshRequest widened = request;
        widened.sections = SectionSet::all();
        widened.status_devices.clear();
        return refresh(widened);
    }

    RefreshReport report;
    util::log::debug("Refresh requested for: " + to_string(request.sections));
    for (auto section : request.sections.to_vector()) {
        report.outcomes.push_back(run_section(section, request));
    }
    return report;
}

void RefreshEngine::shutdown() {
    stopped_.store(true);
}

void RefreshEngine::invalidate_device_cache() {
    descriptor_cache_.invalidate(kDescriptorKey);
}

RefreshStats RefreshEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool RefreshEngine::covers(const Flight& running, const Scope& scope, const RefreshRequest& request, Section section) {
    if (request.after_command) {
        return false;
    }
    const bool bypass_cache = section == Section::Device && request.bypass_cache;
    if (bypass_cache && !running.bypass_cache) {
        return false;
    }
    if (!running.scope) {
        return true;
    }
    if (!scope) {
        return false;
    }
    return std::includes(running.scope->begin(), running.scope->end(), scope->begin(), scope->end());
}

SectionOutcome RefreshEngine::run_section(Section section, const RefreshRequest& request) {
    Scope scope;
    if (section == Section::DeviceStatus && !request.status_devices.empty()) {
        scope.emplace(request.status_devices.begin(), request.status_devices.end());
    }
    const bool bypass = section == Section::Device && request.bypass_cache;

    std::promise<SectionOutcome> promise;
    for (;;) {
        std::shared_future<SectionOutcome> running;
        bool join = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = in_flight_[section_index(section)];
            if (!slot) {
                slot.emplace(Flight{promise.get_future().share(), scope, bypass});
                break;
            }
            running = slot->result;
            join = covers(*slot, scope, request, section);
            if (join) {
                ++stats_.joined;
            }
        }
        if (join) {
            auto outcome = running.get();
            outcome.joined = true;
            return outcome;
        }
        // The running fetch does not cover this request or may have read the
        // controller before a command changed it: wait it out, then take the
        // slot ourselves.
        running.wait();
    }

    auto outcome = execute(section, request, scope);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[section_index(section)].reset();
    }
    promise.set_value(outcome);
    return outcome;
}

SectionOutcome RefreshEngine::execute(Section section, const RefreshRequest& request, const Scope& scope) {
    SectionOutcome outcome;
    outcome.section = section;
    const auto name = std::string(to_string(section));

    try {
        ensure_running(section);
        switch (section) {
            case Section::Device:
                refresh_devices(request.bypass_cache, outcome);
                break;
            case Section::DeviceStatus:
                refresh_statuses(scope, outcome);
                break;
            case Section::MatrixAssignment:
                refresh_assignments(outcome);
                break;
        }
        outcome.ok = true;
        util::log::debug("Refreshed " + name + " (version " + std::to_string(outcome.version) +
                         (outcome.from_cache ? ", cached)" : ")"));
        return outcome;
    } catch (const RefreshCancelled& ex) {
        outcome.error = ex.what();
        util::log::debug(outcome.error);
        return outcome;
    } catch (const TransportError& ex) {
        outcome.error = ex.what();
        util::log::warn("Refresh of " + name + " failed, keeping previous data: " + outcome.error);
    } catch (const DataIntegrityError& ex) {
        outcome.error = ex.what();
        util::log::error("Rejected " + name + " data: " + outcome.error);
    } catch (const std::exception& ex) {
        outcome.error = ex.what();
        util::log::error("Unexpected error refreshing " + name + ": " + outcome.error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failures;
    }
    store_.report_failure(section, outcome.error);
    return outcome;
}

void RefreshEngine::refresh_devices(bool bypass_cache, SectionOutcome& outcome) {
    if (bypass_cache) {
        descriptor_cache_.invalidate(kDescriptorKey);
    }

    bool fetched = false;
    auto devices = descriptor_cache_.get_or_fetch(kDescriptorKey, config_.device_cache_ttl, [&] {
        fetched = true;
        count_fetch(Section::Device);
        return api_.fetch_device_descriptors();
    });
    ensure_running(Section::Device);

    const auto snapshot = store_.read();
    if (!fetched) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.cache_hits;
    }
    if (!fetched && snapshot->populated(Section::Device)) {
        outcome.from_cache = true;
        outcome.version = snapshot->version(Section::Device);
        return;
    }

    try {
        outcome.version = store_.apply_devices(std::move(devices));
    } catch (const DataIntegrityError&) {
        descriptor_cache_.clear();
        throw;
    }
    outcome.from_cache = !fetched;
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.applies;
}

void RefreshEngine::refresh_statuses(const Scope& scope, SectionOutcome& outcome) {
    const auto snapshot = store_.read();

    std::vector<std::string> ids;
    if (scope) {
        for (const auto& name : *scope) {
            const auto* device = snapshot->find_device(name);
            if (device == nullptr) {
                util::log::debug("Ignoring status refresh for unknown device " + name);
                continue;
            }
            if (std::find(ids.begin(), ids.end(), device->true_name) == ids.end()) {
                ids.push_back(device->true_name);
            }
        }
        if (ids.empty()) {
            outcome.version = snapshot->version(Section::DeviceStatus);
            return;
        }
    } else {
        ids.reserve(snapshot->devices().size());
        for (const auto& [true_name, device] : snapshot->devices()) {
            (void)device;
            ids.push_back(true_name);
        }
    }

    std::vector<DeviceStatusResult> results;
    if (!ids.empty()) {
        count_fetch(Section::DeviceStatus);
        results = api_.fetch_device_status(ids);
    }
    ensure_running(Section::DeviceStatus);

    StatusMap merged = scope ? snapshot->statuses() : StatusMap{};
    std::set<std::string> reported;
    for (auto& result : results) {
        if (result.true_name.empty()) {
            throw DataIntegrityError("Device status result without a device name");
        }
        if (!reported.insert(result.true_name).second) {
            throw DataIntegrityError("Duplicate device status for " + result.true_name);
        }
        if (result.status) {
            auto status = std::move(*result.status);
            status.true_name = result.true_name;
            merged.insert_or_assign(result.true_name, std::move(status));
        } else {
            util::log::warn("Status of " + result.true_name + " unavailable, marking offline: " + result.error);
            merged.insert_or_assign(result.true_name, offline_status(*snapshot, result.true_name));
        }
    }
    for (const auto& id : ids) {
        if (reported.count(id) == 0) {
            util::log::warn("No status reported for " + id + ", marking offline");
            merged.insert_or_assign(id, offline_status(*snapshot, id));
        }
    }

    outcome.version = store_.apply_statuses(std::move(merged));
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.applies;
}

void RefreshEngine::refresh_assignments(SectionOutcome& outcome) {
    count_fetch(Section::MatrixAssignment);
    auto assignments = api_.fetch_matrix_assignments();
    ensure_running(Section::MatrixAssignment);

    outcome.version = store_.apply_assignments(assignments);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.applies;
}

void RefreshEngine::count_fetch(Section section) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.api_fetches[section_index(section)];
}

void RefreshEngine::ensure_running(Section section) const {
    if (stopped_.load()) {
        throw RefreshCancelled(section);
    }
}

}  // namespace nhdsync
