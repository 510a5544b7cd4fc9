/**
 * @file test_polling_service.cpp
 * @brief Integration test: sourcing and polling threads against fake plugs
 */

#include <gtest/gtest.h>
#include <kasad/utils/logger.hpp>
#include <kasad/core/device_client.hpp>
#include <kasad/core/directory_provider.hpp>
#include <kasad/core/discovery_client.hpp>
#include <kasad/core/poll_orchestrator.hpp>
#include <kasad/core/polling_service.hpp>

#include "support/fake_device.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

using namespace kasad;
using namespace kasad::core;

namespace {

bool waitFor(const std::function<bool()>& condition,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

// Directory that can be told to fail its next passes
class FlakyDirectory : public DirectoryProvider {
public:
    explicit FlakyDirectory(std::vector<DeviceCandidate> devices)
        : devices_(std::move(devices))
    {}

    std::string name() const override { return "flaky"; }

    std::vector<DeviceCandidate> listDevices() override {
        if (failing_.load()) {
            throw DirectoryError("inventory service unavailable");
        }
        return devices_;
    }

    void setFailing(bool failing) { failing_.store(failing); }
    void clear() { devices_.clear(); }

private:
    std::vector<DeviceCandidate> devices_;
    std::atomic<bool> failing_{false};
};

DeviceCandidate staticEntry(const std::string& id, const std::string& alias,
                            const net::SocketAddress& address) {
    DeviceCandidate c;
    c.device_id = id;
    c.alias = alias;
    c.address = address;
    return c;
}

}  // namespace

class PollingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        clientConfig_.connect_timeout = std::chrono::milliseconds(300);
        clientConfig_.read_timeout = std::chrono::milliseconds(300);
        client_ = std::make_shared<DeviceClient>(clientConfig_);

        orchestratorConfig_.max_in_flight = 4;
        orchestratorConfig_.health.remove_after_missed = 1;

        polling_.discovery_enabled = false;
        polling_.discovery_timeout = std::chrono::milliseconds(200);
        polling_.discovery_interval = std::chrono::milliseconds(60000);
        polling_.poll_interval = std::chrono::milliseconds(100);
    }

    void TearDown() override {
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::shared_ptr<PollOrchestrator> makeOrchestrator() {
        auto client = client_;
        return std::make_shared<PollOrchestrator>(
            orchestratorConfig_,
            [client](const DeviceRecord& record) { return client->poll(record); },
            std::make_shared<SnapshotStore>());
    }

    net::SocketInitializer init_;
    DeviceClientConfig clientConfig_;
    std::shared_ptr<DeviceClient> client_;
    OrchestratorConfig orchestratorConfig_;
    PollingConfig polling_;
};

TEST_F(PollingServiceTest, StaticDevicesAreExported) {
    fakes::FakeDevice kettle(fakes::FakeSysinfo{"AAAA", "Kettle"});
    fakes::FakeDevice heater(fakes::FakeSysinfo{"BBBB", "Heater"});
    ASSERT_TRUE(kettle.start());
    ASSERT_TRUE(heater.start());

    auto directory = std::make_shared<StaticDirectoryProvider>(std::vector<DeviceCandidate>{
        staticEntry("AAAA", "Kettle", kettle.address()),
        staticEntry("BBBB", "Heater", heater.address())});

    auto orchestrator = makeOrchestrator();
    PollingService service(polling_, orchestrator, nullptr, {directory});
    ASSERT_TRUE(service.start());
    EXPECT_FALSE(service.start());

    ASSERT_TRUE(waitFor([&] { return service.pollCycles() >= 2; }));

    auto snapshot = orchestrator->store()->getSnapshot();
    EXPECT_TRUE(snapshot->contains("AAAA"));
    EXPECT_TRUE(snapshot->contains("BBBB"));
    EXPECT_NEAR(snapshot->entries.at("BBBB").reading.voltage_volts, 230.0, 1e-9);
    EXPECT_GE(kettle.requestCount(), 2u);

    service.stop();
    EXPECT_FALSE(service.isRunning());
}

TEST_F(PollingServiceTest, FirstCycleRunsAfterFirstSourcingPass) {
    fakes::FakeDevice plug(fakes::FakeSysinfo{"CCCC", "Washer"});
    ASSERT_TRUE(plug.start());

    fakes::FakeDiscoveryResponder responder;
    responder.addReply(fakes::sysinfoReply(fakes::FakeSysinfo{"CCCC", "Washer"}));
    ASSERT_TRUE(responder.start());

    DiscoveryConfig discoveryConfig;
    discoveryConfig.bind_address = "127.0.0.1";
    discoveryConfig.device_port = plug.port();
    auto discovery = std::make_shared<DiscoveryClient>(discoveryConfig);

    polling_.discovery_enabled = true;
    polling_.broadcast_address = responder.address();
    polling_.poll_interval = std::chrono::milliseconds(60000);

    auto orchestrator = makeOrchestrator();
    PollingService service(polling_, orchestrator, discovery, {});
    ASSERT_TRUE(service.start());

    ASSERT_TRUE(waitFor([&] { return service.pollCycles() >= 1; }));

    // The discovery window is longer than zero, so a cycle that did not wait
    // for it would have found nothing to poll
    auto snapshot = orchestrator->store()->getSnapshot();
    EXPECT_EQ(snapshot->generation, 1u);
    ASSERT_TRUE(snapshot->contains("CCCC"));
    EXPECT_EQ(snapshot->entries.at("CCCC").alias, "Washer");
    EXPECT_EQ(responder.queryCount(), 1u);
}

TEST_F(PollingServiceTest, StopIsPromptWhileIdle) {
    polling_.poll_interval = std::chrono::milliseconds(60000);

    auto orchestrator = makeOrchestrator();
    auto directory = std::make_shared<StaticDirectoryProvider>(std::vector<DeviceCandidate>{});
    PollingService service(polling_, orchestrator, nullptr, {directory});
    ASSERT_TRUE(service.start());
    ASSERT_TRUE(waitFor([&] { return service.pollCycles() >= 1; }));

    auto start = std::chrono::steady_clock::now();
    service.stop();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    EXPECT_LT(elapsed.count(), 1000);
}

TEST_F(PollingServiceTest, FailedSourceDoesNotAgeDevices) {
    auto directory = std::make_shared<FlakyDirectory>(std::vector<DeviceCandidate>{
        staticEntry("DDDD", "Pump", net::SocketAddress("127.0.0.1", 9))});

    auto orchestrator = makeOrchestrator();
    PollingService service(polling_, orchestrator, nullptr, {directory});

    EXPECT_TRUE(service.runSourcingPass());
    ASSERT_TRUE(orchestrator->getDevice("DDDD").has_value());

    directory->setFailing(true);
    EXPECT_FALSE(service.runSourcingPass());
    EXPECT_FALSE(service.runSourcingPass());
    ASSERT_TRUE(orchestrator->getDevice("DDDD").has_value());
    EXPECT_EQ(orchestrator->getDevice("DDDD")->missed_sightings, 0u);

    // A complete pass without the device removes it (threshold 1)
    directory->setFailing(false);
    directory->clear();
    EXPECT_TRUE(service.runSourcingPass());
    EXPECT_FALSE(orchestrator->getDevice("DDDD").has_value());
    EXPECT_EQ(service.sourcingPasses(), 4u);
}

TEST_F(PollingServiceTest, DeviceOutageAndRecovery) {
    orchestratorConfig_.health.unreachable_after = 2;

    fakes::FakeDevice plug(fakes::FakeSysinfo{"EEEE", "Freezer"});
    ASSERT_TRUE(plug.start());

    auto directory = std::make_shared<StaticDirectoryProvider>(std::vector<DeviceCandidate>{
        staticEntry("EEEE", "Freezer", plug.address())});

    auto orchestrator = makeOrchestrator();
    PollingService service(polling_, orchestrator, nullptr, {directory});
    ASSERT_TRUE(service.start());

    auto exported = [&] { return orchestrator->store()->getSnapshot()->contains("EEEE"); };
    ASSERT_TRUE(waitFor(exported));

    plug.setMode(fakes::FakeMode::GARBAGE);
    ASSERT_TRUE(waitFor([&] { return !exported(); }));
    EXPECT_EQ(orchestrator->getDevice("EEEE")->state, DeviceState::UNREACHABLE);

    plug.setMode(fakes::FakeMode::OK);
    ASSERT_TRUE(waitFor(exported));
    EXPECT_EQ(orchestrator->getDevice("EEEE")->state, DeviceState::REACHABLE);
}
