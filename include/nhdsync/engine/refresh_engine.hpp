#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nhdsync/api/device_api.hpp"
#include "nhdsync/cache/ttl_cache.hpp"
#include "nhdsync/model/section.hpp"
#include "nhdsync/store/snapshot_store.hpp"

namespace nhdsync {

struct RefreshRequest {
    SectionSet sections;
    // Limits a DeviceStatus refresh to these devices (true names); empty
    // means every device in the current Device section.
    std::vector<std::string> status_devices;
    // Re-fetch device descriptors even when the cached list is still fresh.
    bool bypass_cache{false};
    // Issued right after a command changed controller state. Never joins a
    // fetch that was already running, since that one may predate the change.
    bool after_command{false};
};

struct SectionOutcome {
    Section section{Section::Device};
    bool ok{false};
    // The request was served by a fetch another caller had already started.
    bool joined{false};
    bool from_cache{false};
    std::uint64_t version{0};
    std::string error;
};

struct RefreshReport {
    std::vector<SectionOutcome> outcomes;

    bool ok() const;
    const SectionOutcome* find(Section section) const;
};

struct RefreshStats {
    std::array<std::uint64_t, kSectionCount> api_fetches{};
    std::uint64_t joined{0};
    std::uint64_t cache_hits{0};
    std::uint64_t applies{0};
    std::uint64_t failures{0};
};

struct RefreshEngineConfig {
    std::chrono::steady_clock::duration device_cache_ttl{std::chrono::seconds(600)};
};

/**
 * @brief Executes full or selective refreshes against the device API.
 *
 * At most one fetch per section is in flight. A caller asking for a section
 * whose fetch is already running waits for that result instead of issuing a
 * second call; a scoped status request that the running fetch does not cover
 * waits for it to finish and then runs its own. Different sections refresh
 * concurrently when requested from different threads.
 */
class RefreshEngine {
public:
    using DescriptorCache = TtlCache<std::string, std::vector<Device>>;

    RefreshEngine(DeviceApi& api,
                  SnapshotStore& store,
                  RefreshEngineConfig config = {},
                  DescriptorCache::TimeSource now = [] { return DescriptorCache::Clock::now(); });

    RefreshEngine(const RefreshEngine&) = delete;
    RefreshEngine& operator=(const RefreshEngine&) = delete;

    RefreshReport refresh(SectionSet sections);
    // A device-scoped status request issued before any device list was loaded
    // is widened to a full refresh of every section.
    RefreshReport refresh(const RefreshRequest& request);

    // Later requests fail immediately and results of fetches still running
    // are discarded instead of applied.
    void shutdown();
    bool stopped() const { return stopped_.load(); }

    void invalidate_device_cache();

    RefreshStats stats() const;

private:
    using Scope = std::optional<std::set<std::string>>;

    struct Flight {
        std::shared_future<SectionOutcome> result;
        Scope scope;
        bool bypass_cache{false};
    };

    SectionOutcome run_section(Section section, const RefreshRequest& request);
    SectionOutcome execute(Section section, const RefreshRequest& request, const Scope& scope);

    void refresh_devices(bool bypass_cache, SectionOutcome& outcome);
    void refresh_statuses(const Scope& scope, SectionOutcome& outcome);
    void refresh_assignments(SectionOutcome& outcome);

    void count_fetch(Section section);
    void ensure_running(Section section) const;
    static bool covers(const Flight& running, const Scope& scope, const RefreshRequest& request, Section section);

    DeviceApi& api_;
    SnapshotStore& store_;
    RefreshEngineConfig config_;
    DescriptorCache descriptor_cache_;

    mutable std::mutex mutex_;
    std::array<std::optional<Flight>, kSectionCount> in_flight_;
    RefreshStats stats_;
    std::atomic_bool stopped_{false};
};

}  // namespace nhdsync
