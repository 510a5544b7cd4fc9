/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <kasad/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <string>

using namespace kasad::net;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketInitializer init_;
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, RejectsBadBindAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-address"));
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", receiver.getLocalPort()),
                             message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer), 1000, from);

    ASSERT_GT(received, 0);
    EXPECT_EQ(std::string(buffer, static_cast<size_t>(received)), message);
    EXPECT_EQ(from.host, "127.0.0.1");
    EXPECT_EQ(from.port, sender.getLocalPort());
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90);
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setBroadcast(true));
}

TEST_F(UdpSocketTest, SendToBadHostFails) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_LT(socket.sendTo(SocketAddress("no.such.host", 9999), "x", 1), 0);
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket a;
    ASSERT_TRUE(a.bind(0, "127.0.0.1"));
    uint16_t port = a.getLocalPort();

    UdpSocket b(std::move(a));
    EXPECT_FALSE(a.isValid());
    EXPECT_TRUE(b.isValid());
    EXPECT_EQ(b.getLocalPort(), port);
}
