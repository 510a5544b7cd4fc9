/**
 * @file test_device_client.cpp
 * @brief Unit tests for TCP telemetry queries against fake plugs
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <kasad/core/device_client.hpp>

#include "support/fake_device.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace kasad;
using namespace kasad::core;
using kasad::fakes::FakeDevice;
using kasad::fakes::FakeMode;
using kasad::fakes::FakeSysinfo;
using ::testing::DoubleNear;
using ::testing::HasSubstr;

class DeviceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.connect_timeout = std::chrono::milliseconds(500);
        config_.read_timeout = std::chrono::milliseconds(300);
    }

    FakeDevice& startDevice(FakeMode mode = FakeMode::OK) {
        info_.device_id = "8006F00D";
        info_.alias = "Dishwasher";
        device_ = std::make_unique<FakeDevice>(info_, mode);
        EXPECT_TRUE(device_->start());
        return *device_;
    }

    DeviceRecord recordFor(const FakeDevice& device) const {
        DeviceRecord record;
        record.device_id = info_.device_id;
        record.alias = info_.alias;
        record.address = device.address();
        record.model = info_.model;
        record.hw_version = info_.hw_ver;
        return record;
    }

    PollOutcome pollOnce(FakeMode mode) {
        FakeDevice& device = startDevice(mode);
        DeviceClient client(config_);
        return client.poll(recordFor(device));
    }

    net::SocketInitializer init_;
    DeviceClientConfig config_;
    FakeSysinfo info_;
    std::unique_ptr<FakeDevice> device_;
};

// =============================================================================
// Successful polls
// =============================================================================

TEST_F(DeviceClientTest, PollsV2DeviceInSiUnits) {
    PollOutcome outcome = pollOnce(FakeMode::OK);
    ASSERT_TRUE(outcome.ok()) << outcome.detail();

    const Reading& reading = outcome.reading();
    EXPECT_THAT(reading.current_amperes, DoubleNear(1.5, 1e-9));
    EXPECT_THAT(reading.voltage_volts, DoubleNear(230.0, 1e-9));
    EXPECT_THAT(reading.power_watts, DoubleNear(345.0, 1e-9));
    EXPECT_THAT(reading.energy_joules_total, DoubleNear(7.2e6, 1e-3));

    EXPECT_EQ(outcome.identity().device_id, "8006F00D");
    EXPECT_EQ(outcome.identity().alias, "Dishwasher");
    EXPECT_EQ(outcome.identity().model, "KP115(EU)");
}

TEST_F(DeviceClientTest, RequestMatchesModel) {
    FakeDevice& device = startDevice();
    DeviceClient client(config_);
    ASSERT_TRUE(client.poll(recordFor(device)).ok());

    EXPECT_EQ(device.requestCount(), 1u);
    protocol::JsonValue request = device.lastRequest();
    EXPECT_NE(protocol::findPath(request, {"system", "get_sysinfo"}), nullptr);
    EXPECT_NE(protocol::findPath(request, {"emeter", "get_realtime"}), nullptr);
}

TEST_F(DeviceClientTest, PollsV1Device) {
    info_.model = "HS110(EU)";
    info_.hw_ver = "1.0";
    FakeDevice& device = startDevice();
    device.setRealtime(fakes::realtimeV1(0.5, 240.0, 120.0, 3.0));

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(recordFor(device));
    ASSERT_TRUE(outcome.ok()) << outcome.detail();
    EXPECT_DOUBLE_EQ(outcome.reading().power_watts, 120.0);
    EXPECT_DOUBLE_EQ(outcome.reading().energy_joules_total, 3.0 * 3.6e6);
}

TEST_F(DeviceClientTest, UnknownModelUsesGenericProfile) {
    info_.model = "HS300(US)";
    FakeDevice& device = startDevice();

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(recordFor(device));
    ASSERT_TRUE(outcome.ok()) << outcome.detail();
    EXPECT_THAT(outcome.reading().power_watts, DoubleNear(345.0, 1e-9));

    protocol::JsonValue request = device.lastRequest();
    EXPECT_NE(protocol::findPath(request, {"smartlife.iot.common.emeter", "get_realtime"}),
              nullptr);
}

// =============================================================================
// Failure mapping
// =============================================================================

TEST_F(DeviceClientTest, ConnectRefusedIsUnreachable) {
    uint16_t port;
    {
        FakeDevice probe(FakeSysinfo{"gone", "gone"});
        ASSERT_TRUE(probe.start());
        port = probe.port();
    }

    DeviceRecord record;
    record.device_id = "gone";
    record.address = net::SocketAddress("127.0.0.1", port);

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(record);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UNREACHABLE);
}

TEST_F(DeviceClientTest, SilentDeviceTimesOut) {
    auto start = std::chrono::steady_clock::now();
    PollOutcome outcome = pollOnce(FakeMode::SILENT);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::TIMEOUT);
    EXPECT_LT(elapsed.count(), 1500);
}

TEST_F(DeviceClientTest, SlowDeviceTimesOut) {
    FakeDevice& device = startDevice();
    device.setDelay(std::chrono::milliseconds(800));

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(recordFor(device));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::TIMEOUT);
}

TEST_F(DeviceClientTest, GarbageIsProtocolError) {
    PollOutcome outcome = pollOnce(FakeMode::GARBAGE);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::PROTOCOL);
}

TEST_F(DeviceClientTest, TruncatedFrameIsProtocolError) {
    PollOutcome outcome = pollOnce(FakeMode::CLOSE_MID_FRAME);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::PROTOCOL);
    EXPECT_THAT(outcome.detail(), HasSubstr("frame body"));
}

TEST_F(DeviceClientTest, OversizedFrameIsProtocolError) {
    PollOutcome outcome = pollOnce(FakeMode::OVERSIZE);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::PROTOCOL);
    EXPECT_THAT(outcome.detail(), HasSubstr("exceeds limit"));
}

TEST_F(DeviceClientTest, MissingMeterIsUnexpectedSchema) {
    PollOutcome outcome = pollOnce(FakeMode::NO_EMETER);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UNEXPECTED_SCHEMA);
}

TEST_F(DeviceClientTest, MeterErrorIsUnexpectedSchema) {
    FakeDevice& device = startDevice();
    auto block = protocol::parseJson("{\"err_code\":-1,\"err_msg\":\"module not support\"}");
    ASSERT_TRUE(block.has_value());
    device.setRealtime(*block);

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(recordFor(device));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UNEXPECTED_SCHEMA);
    EXPECT_THAT(outcome.detail(), HasSubstr("module not support"));
}

TEST_F(DeviceClientTest, ForeignDeviceIsUnexpectedSchema) {
    FakeDevice& device = startDevice();
    DeviceRecord record = recordFor(device);
    record.device_id = "SOMEONE_ELSE";

    DeviceClient client(config_);
    PollOutcome outcome = client.poll(record);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UNEXPECTED_SCHEMA);
    EXPECT_THAT(outcome.detail(), HasSubstr("8006F00D"));
}

TEST_F(DeviceClientTest, DeviceServesNextPollAfterFailure) {
    FakeDevice& device = startDevice(FakeMode::GARBAGE);
    DeviceClient client(config_);
    EXPECT_FALSE(client.poll(recordFor(device)).ok());

    device.setMode(FakeMode::OK);
    EXPECT_TRUE(client.poll(recordFor(device)).ok());
    EXPECT_EQ(device.requestCount(), 2u);
}
