// test/test_p2p_channel.cc
#include <gtest/gtest.h>
#include "../include/channels/p2p_channel.hh"
#include "../include/sim_errors.hh"
#include "mock_modules.hh"

class P2PChannelTest : public ::testing::Test {
protected:
    SimLog log{LogLevel::Off};
    EventQueue eq{&log};
    P2PChannel ch{"e2", &eq};
    MockElement a{"a", &eq};
    MockElement b{"b", &eq};

    void SetUp() override {
        ch.registerNode("a", &a);
        ch.registerNode("b", &b);
    }
};

TEST_F(P2PChannelTest, DeliversAfterLatency) {
    ch.setLatency(0.5);
    ch.sendAfter(1.0, Message("PING", {{"n", 1}}), "a", "b");
    eq.run(1.4);
    EXPECT_TRUE(b.received.empty());
    eq.run(2.0);
    ASSERT_EQ(b.received.size(), 1u);
    const Message& m = b.received[0];
    EXPECT_EQ(m.type, "PING");
    EXPECT_EQ(m.src, "a");
    EXPECT_EQ(m.dst, "b");
    EXPECT_EQ(m.channel, "e2");
    EXPECT_DOUBLE_EQ(m.recv_time, 1.5);
    EXPECT_DOUBLE_EQ(m.getDelay(), 1.5);
    EXPECT_EQ(b.sources[0], "a");
    EXPECT_EQ(ch.getStats().delivered, 1u);
}

TEST_F(P2PChannelTest, UnknownDestinationThrowsAndDeliversNothing) {
    EXPECT_THROW(ch.send(Message("PING", {}), "a", "ghost"), AddressError);
    EXPECT_THROW(ch.send(Message("PING", {}), "ghost", "b"), AddressError);
    EXPECT_EQ(eq.pending(), 0u);
    eq.run(5.0);
    EXPECT_TRUE(b.received.empty());
    EXPECT_EQ(ch.getStats().sent, 0u);
}

TEST_F(P2PChannelTest, DuplicateRegistrationIsNoop) {
    MockElement other("a", &eq);
    EXPECT_FALSE(ch.registerNode("a", &other));
    EXPECT_EQ(ch.findNode("a"), &a);
    EXPECT_FALSE(ch.registerNode("x", nullptr));
    EXPECT_EQ(log.count(LogLevel::Warn), 1u);
}

TEST_F(P2PChannelTest, VanishedDestinationIsDropped) {
    ch.send(Message("PING", {}), "a", "b");
    ch.unregisterNode("b");
    EXPECT_NO_THROW(eq.run(1.0));
    EXPECT_TRUE(b.received.empty());
    EXPECT_EQ(ch.getStats().dropped, 1u);
    EXPECT_GE(log.count(LogLevel::Error), 1u);
}

TEST_F(P2PChannelTest, ThrowingHandlerDoesNotAffectOthers) {
    b.throw_on_receive = true;
    ch.send(Message("PING", {}), "a", "b");
    ch.send(Message("PONG", {}), "b", "a");
    eq.run(1.0);
    EXPECT_EQ(ch.getStats().failed, 1u);
    ASSERT_EQ(a.received.size(), 1u);
    EXPECT_EQ(a.received[0].type, "PONG");
    EXPECT_EQ(eq.getStats().callback_errors, 0u);
}

TEST_F(P2PChannelTest, NonStandardThrowIsIsolated) {
    b.throw_status_code = true;
    ch.send(Message("PING", {}), "a", "b");
    ch.send(Message("PONG", {}), "b", "a");
    EXPECT_NO_THROW(eq.run(1.0));
    EXPECT_EQ(ch.getStats().failed, 1u);
    EXPECT_EQ(a.received.size(), 1u);
    EXPECT_EQ(log.count(LogLevel::Error), 1u);
}

TEST_F(P2PChannelTest, DelayModelAddsToLatency) {
    ch.setLatency(0.1);
    ch.setDelayModel(std::make_unique<ConstantDelay>(0.2));
    ch.send(Message("PING", {}), "a", "b");
    eq.run(0.29);
    EXPECT_TRUE(b.received.empty());
    eq.run(0.31);
    ASSERT_EQ(b.received.size(), 1u);
    EXPECT_NEAR(ch.getStats().avgDelay(), 0.3, 1e-9);
}

TEST_F(P2PChannelTest, SameTimeSendsKeepOrder) {
    for (int i = 0; i < 5; ++i) ch.send(Message("SEQ", {{"i", i}}), "a", "b");
    eq.run(1.0);
    ASSERT_EQ(b.received.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(b.received[i].payload["i"], i);
        EXPECT_EQ(b.received[i].seq, static_cast<uint64_t>(i));
    }
}
