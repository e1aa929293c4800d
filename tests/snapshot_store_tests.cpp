#include "nhdsync/errors.hpp"
#include "nhdsync/store/snapshot_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "support/fake_device_api.hpp"

using namespace nhdsync;
using nhdsync::testing::make_device;
using nhdsync::testing::make_status;

namespace {

std::vector<Device> sample_devices() {
    return {
        make_device("TX-1", "AppleTV", DeviceRole::Encoder),
        make_device("RX-1", "Kitchen", DeviceRole::Decoder),
    };
}

}  // namespace

TEST_CASE("SnapshotStore starts empty with every section at version zero", "[store]") {
    SnapshotStore store;
    const auto snapshot = store.read();
    for (auto section : kAllSections) {
        REQUIRE(snapshot->version(section) == 0);
        REQUIRE_FALSE(snapshot->populated(section));
    }
    REQUIRE(snapshot->devices().empty());
    REQUIRE_FALSE(snapshot->controller().has_value());
}

TEST_CASE("SnapshotStore bumps only the applied section", "[store]") {
    SnapshotStore store;
    const auto before = store.read();

    REQUIRE(store.apply_devices(sample_devices()) == 1);
    const auto after = store.read();

    REQUIRE(after->version(Section::Device) == 1);
    REQUIRE(after->version(Section::DeviceStatus) == 0);
    REQUIRE(after->version(Section::MatrixAssignment) == 0);
    REQUIRE(after->devices().size() == 2);

    // Snapshots already handed out are never mutated.
    REQUIRE(before->devices().empty());
    REQUIRE(before->version(Section::Device) == 0);

    REQUIRE(store.apply_assignments({MatrixAssignment{"Kitchen", std::string("AppleTV")}}) == 1);
    REQUIRE(store.apply_assignments({MatrixAssignment{"Kitchen", std::nullopt}}) == 2);
    REQUIRE(store.read()->version(Section::Device) == 1);
}

TEST_CASE("SnapshotStore rejects payloads that break section invariants", "[store]") {
    SnapshotStore store;
    store.apply_assignments({MatrixAssignment{"Kitchen", std::string("AppleTV")}});

    SECTION("decoder assigned twice") {
        REQUIRE_THROWS_AS(store.apply_assignments({
                              MatrixAssignment{"Kitchen", std::string("AppleTV")},
                              MatrixAssignment{"Kitchen", std::string("Cable")},
                          }),
                          DataIntegrityError);
        const auto snapshot = store.read();
        REQUIRE(snapshot->version(Section::MatrixAssignment) == 1);
        REQUIRE(snapshot->assigned_encoder("Kitchen") == std::optional<std::string>("AppleTV"));
    }

    SECTION("duplicate device descriptor") {
        auto devices = sample_devices();
        devices.push_back(make_device("TX-1", "Other", DeviceRole::Encoder));
        REQUIRE_THROWS_AS(store.apply_devices(devices), DataIntegrityError);
        REQUIRE(store.read()->version(Section::Device) == 0);
    }

    SECTION("status without a name") {
        StatusMap statuses;
        statuses[""] = DeviceStatus{};
        REQUIRE_THROWS_AS(store.apply_statuses(statuses), DataIntegrityError);
        REQUIRE(store.read()->version(Section::DeviceStatus) == 0);
    }
}

TEST_CASE("SnapshotStore notifies subscribers after publishing", "[store]") {
    SnapshotStore store;
    std::vector<ChangeEvent> events;
    std::uint64_t seen_version = 0;
    const auto id = store.subscribe([&](const ChangeEvent& event) {
        events.push_back(event);
        seen_version = store.read()->version(event.section);
    });

    store.apply_devices(sample_devices());
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].section == Section::Device);
    REQUIRE(events[0].version == 1);
    REQUIRE_FALSE(events[0].degraded);
    REQUIRE(seen_version == 1);

    store.report_failure(Section::Device, "timeout");
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].degraded);
    REQUIRE(events[1].version == 1);
    REQUIRE(events[1].error == "timeout");

    store.unsubscribe(id);
    store.apply_devices(sample_devices());
    REQUIRE(events.size() == 2);
}

TEST_CASE("SnapshotStore keeps publishing when a subscriber throws", "[store]") {
    SnapshotStore store;
    int delivered = 0;
    store.subscribe([](const ChangeEvent&) { throw std::runtime_error("subscriber bug"); });
    store.subscribe([&](const ChangeEvent&) { ++delivered; });

    REQUIRE_NOTHROW(store.apply_devices(sample_devices()));
    REQUIRE(delivered == 1);
    REQUIRE(store.read()->version(Section::Device) == 1);
}

TEST_CASE("SnapshotStore readers always see a complete snapshot", "[store]") {
    SnapshotStore store;
    store.apply_devices(sample_devices());
    std::atomic_bool done{false};
    std::atomic_int torn{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            std::uint64_t last = 0;
            while (!done.load()) {
                const auto snapshot = store.read();
                const auto version = snapshot->version(Section::MatrixAssignment);
                if (version < last || (version > 0 && snapshot->assignments().size() != 1)) {
                    ++torn;
                }
                last = version;
            }
        });
    }

    for (int i = 0; i < 500; ++i) {
        store.apply_assignments({MatrixAssignment{"Kitchen", i % 2 == 0 ? std::optional<std::string>("AppleTV")
                                                                           : std::nullopt}});
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    REQUIRE(torn.load() == 0);
    REQUIRE(store.read()->version(Section::MatrixAssignment) == 500);
}

TEST_CASE("Snapshot derives availability and video state", "[store]") {
    SnapshotStore store;
    auto devices = sample_devices();
    auto lounge = make_device("RX-2", "Lounge", DeviceRole::Decoder);
    lounge.online = false;
    devices.push_back(lounge);
    store.apply_devices(devices);

    StatusMap statuses;
    statuses["TX-1"] = make_status("TX-1", true, "1920x1080p60");
    statuses["RX-1"] = make_status("RX-1", true, "");
    store.apply_statuses(statuses);

    const auto snapshot = store.read();
    REQUIRE(snapshot->find_device("Kitchen") != nullptr);
    REQUIRE(snapshot->find_device("Kitchen")->true_name == "RX-1");
    REQUIRE(snapshot->find_device("nowhere") == nullptr);

    REQUIRE(snapshot->availability("AppleTV") == Availability::Available);
    REQUIRE(snapshot->availability("Lounge") == Availability::Unavailable);
    REQUIRE(snapshot->availability("nowhere") == Availability::Unavailable);

    REQUIRE(snapshot->video_active("TX-1") == std::optional<bool>(true));
    // Output flag without a resolution does not count as video.
    REQUIRE(snapshot->video_active("Kitchen") == std::optional<bool>(false));
    REQUIRE_FALSE(snapshot->video_active("Lounge").has_value());

    REQUIRE(snapshot->encoders().size() == 1);
    REQUIRE(snapshot->decoders().size() == 2);
    REQUIRE(display_name(*snapshot->find_device("TX-1")) == "Encoder - AppleTV");
}

TEST_CASE("Section names and sets", "[store]") {
    REQUIRE(parse_section("device_status") == Section::DeviceStatus);
    REQUIRE_FALSE(parse_section("power").has_value());

    SectionSet sections{Section::MatrixAssignment, Section::Device};
    REQUIRE(sections.size() == 2);
    const std::vector<Section> expected{Section::Device, Section::MatrixAssignment};
    REQUIRE(sections.to_vector() == expected);
    REQUIRE(to_string(sections) == "device,matrix_assignment");
    REQUIRE(to_string(SectionSet{}) == "none");
    REQUIRE(SectionSet::all().size() == kSectionCount);
}
