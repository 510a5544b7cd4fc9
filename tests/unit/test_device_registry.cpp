/**
 * @file test_device_registry.cpp
 * @brief Unit tests for the known-device registry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <kasad/core/device_registry.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace kasad;
using namespace kasad::core;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

DeviceCandidate candidate(const std::string& id, const std::string& host,
                          const std::string& alias = "", const std::string& model = "") {
    DeviceCandidate c;
    c.device_id = id;
    c.alias = alias;
    c.address = net::SocketAddress(host, 9999);
    c.model = model;
    return c;
}

std::vector<std::string> ids(const std::vector<DeviceRecord>& records) {
    std::vector<std::string> result;
    for (const auto& r : records) {
        result.push_back(r.device_id);
    }
    return result;
}

}  // namespace

class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistry registry;
    TimePoint t0 = TimePoint(std::chrono::seconds(1700000000));
};

TEST_F(DeviceRegistryTest, MergeAddsNewDevices) {
    MergeStats stats = registry.merge({candidate("B", "10.0.0.2", "Heater", "KP115(EU)"),
                                       candidate("A", "10.0.0.1", "Kettle")},
                                      true, 5, t0);

    EXPECT_EQ(stats.added, 2u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_THAT(ids(registry.all()), ElementsAre("A", "B"));

    auto heater = registry.get("B");
    ASSERT_TRUE(heater.has_value());
    EXPECT_EQ(heater->alias, "Heater");
    EXPECT_EQ(heater->model, "KP115(EU)");
    EXPECT_EQ(heater->state, DeviceState::DISCOVERED);
    EXPECT_EQ(heater->first_seen_at, t0);
    EXPECT_EQ(heater->last_sighted_at, t0);
    EXPECT_FALSE(heater->last_reading.has_value());
}

TEST_F(DeviceRegistryTest, MergeIsIdempotent) {
    std::vector<DeviceCandidate> pass = {candidate("A", "10.0.0.1", "Kettle"),
                                         candidate("B", "10.0.0.2", "Heater")};
    registry.merge(pass, true, 5, t0);
    auto before = registry.all();

    MergeStats stats = registry.merge(pass, true, 5, t0);
    EXPECT_EQ(stats.added, 0u);
    EXPECT_EQ(stats.updated, 0u);
    EXPECT_EQ(stats.missed, 0u);

    auto after = registry.all();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].device_id, before[i].device_id);
        EXPECT_EQ(after[i].address, before[i].address);
        EXPECT_EQ(after[i].alias, before[i].alias);
        EXPECT_EQ(after[i].missed_sightings, before[i].missed_sightings);
        EXPECT_EQ(after[i].last_sighted_at, before[i].last_sighted_at);
    }
}

TEST_F(DeviceRegistryTest, AddressChangeUpdatesInPlace) {
    registry.merge({candidate("A", "10.0.0.1", "Kettle")}, true, 5, t0);
    registry.update("A", [](DeviceRecord& r) {
        r.state = DeviceState::REACHABLE;
        r.consecutive_successes = 4;
    });

    MergeStats stats = registry.merge({candidate("A", "10.0.0.77", "Kettle")}, true, 5, t0);
    EXPECT_EQ(stats.added, 0u);
    EXPECT_EQ(stats.updated, 1u);
    ASSERT_EQ(registry.size(), 1u);

    auto record = registry.get("A");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->address.host, "10.0.0.77");
    // Health history survives the move
    EXPECT_EQ(record->state, DeviceState::REACHABLE);
    EXPECT_EQ(record->consecutive_successes, 4u);
}

TEST_F(DeviceRegistryTest, EmptyFieldsNeverEraseKnownOnes) {
    registry.merge({candidate("A", "10.0.0.1", "Kettle", "HS110(EU)")}, true, 5, t0);

    // Directory entries often carry an id and address only
    MergeStats stats = registry.merge({candidate("A", "10.0.0.1")}, true, 5, t0);
    EXPECT_EQ(stats.updated, 0u);

    auto record = registry.get("A");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->alias, "Kettle");
    EXPECT_EQ(record->model, "HS110(EU)");
}

TEST_F(DeviceRegistryTest, LaterCandidateWins) {
    registry.merge({candidate("A", "10.0.0.1", "Old"), candidate("A", "10.0.0.9", "New")},
                   true, 5, t0);

    ASSERT_EQ(registry.size(), 1u);
    auto record = registry.get("A");
    EXPECT_EQ(record->alias, "New");
    EXPECT_EQ(record->address.host, "10.0.0.9");
}

TEST_F(DeviceRegistryTest, CandidatesWithoutIdAreIgnored) {
    MergeStats stats = registry.merge({candidate("", "10.0.0.1", "Nameless")}, true, 5, t0);
    EXPECT_EQ(stats.added, 0u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DeviceRegistryTest, AbsentDevicesAgeAndAreRemoved) {
    registry.merge({candidate("A", "10.0.0.1"), candidate("B", "10.0.0.2")}, true, 3, t0);

    for (int pass = 1; pass <= 2; ++pass) {
        MergeStats stats = registry.merge({candidate("A", "10.0.0.1")}, true, 3, t0);
        EXPECT_EQ(stats.missed, 1u);
        EXPECT_EQ(stats.removed, 0u);
        EXPECT_EQ(registry.get("B")->missed_sightings, static_cast<uint32_t>(pass));
    }

    MergeStats stats = registry.merge({candidate("A", "10.0.0.1")}, true, 3, t0);
    EXPECT_EQ(stats.removed, 1u);
    EXPECT_FALSE(registry.contains("B"));
    EXPECT_TRUE(registry.contains("A"));
}

TEST_F(DeviceRegistryTest, SightingResetsMissCount) {
    registry.merge({candidate("A", "10.0.0.1")}, true, 3, t0);
    registry.merge({}, true, 3, t0);
    registry.merge({}, true, 3, t0);
    EXPECT_EQ(registry.get("A")->missed_sightings, 2u);

    registry.merge({candidate("A", "10.0.0.1")}, true, 3, t0 + std::chrono::seconds(60));
    auto record = registry.get("A");
    EXPECT_EQ(record->missed_sightings, 0u);
    EXPECT_EQ(record->last_sighted_at, t0 + std::chrono::seconds(60));
    EXPECT_EQ(record->first_seen_at, t0);
}

TEST_F(DeviceRegistryTest, IncompletePassDoesNotAge) {
    registry.merge({candidate("A", "10.0.0.1")}, true, 1, t0);

    MergeStats stats = registry.merge({}, false, 1, t0);
    EXPECT_EQ(stats.missed, 0u);
    EXPECT_TRUE(registry.contains("A"));
    EXPECT_EQ(registry.get("A")->missed_sightings, 0u);
}

TEST_F(DeviceRegistryTest, ZeroThresholdNeverRemoves) {
    registry.merge({candidate("A", "10.0.0.1")}, true, 0, t0);
    for (int i = 0; i < 20; ++i) {
        registry.merge({}, true, 0, t0);
    }
    ASSERT_TRUE(registry.contains("A"));
    EXPECT_EQ(registry.get("A")->missed_sightings, 20u);
}

TEST_F(DeviceRegistryTest, UpdateAndRemove) {
    EXPECT_FALSE(registry.update("missing", [](DeviceRecord&) {}));
    EXPECT_FALSE(registry.remove("missing"));

    registry.merge({candidate("A", "10.0.0.1")}, true, 5, t0);
    EXPECT_TRUE(registry.update("A", [](DeviceRecord& r) { r.consecutive_failures = 2; }));
    EXPECT_EQ(registry.get("A")->consecutive_failures, 2u);

    EXPECT_TRUE(registry.remove("A"));
    EXPECT_THAT(registry.all(), IsEmpty());
    EXPECT_FALSE(registry.get("A").has_value());
}

TEST_F(DeviceRegistryTest, ConcurrentMergeAndRead) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 100; ++i) {
                std::string id = "dev-" + std::to_string(t) + "-" + std::to_string(i % 10);
                registry.merge({candidate(id, "10.0.0." + std::to_string(i % 10))}, false, 0);
                registry.all();
                registry.update(id, [](DeviceRecord& r) { ++r.consecutive_successes; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 40u);
}
