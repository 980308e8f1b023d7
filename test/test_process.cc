// test/test_process.cc
#include <gtest/gtest.h>
#include "../include/process.hh"

#include <stdexcept>
#include <vector>

TEST(ProcessTest, FiresEveryPeriod) {
    EventQueue eq;
    std::vector<double> fired;
    Process p(&eq, 1.0, [&](SimTime now) { fired.push_back(now); }, "tick");
    p.start();
    eq.run(3.5);
    EXPECT_EQ(fired, (std::vector<double>{1.0, 2.0, 3.0}));
    EXPECT_EQ(p.getFireCount(), 3u);
}

TEST(ProcessTest, InitialDelayOverridesFirstFiring) {
    EventQueue eq;
    std::vector<double> fired;
    Process p(&eq, 2.0, [&](SimTime now) { fired.push_back(now); });
    p.start(0.0);
    eq.run(4.5);
    EXPECT_EQ(fired, (std::vector<double>{0.0, 2.0, 4.0}));
}

TEST(ProcessTest, StopInvalidatesQueuedFiring) {
    EventQueue eq;
    int count = 0;
    Process p(&eq, 1.0, [&](SimTime) { count++; });
    p.start();
    eq.run(2.5);
    p.stop();
    EXPECT_FALSE(p.running());
    eq.run(10.0);
    EXPECT_EQ(count, 2);
}

TEST(ProcessTest, StopFromInsideBody) {
    EventQueue eq;
    int count = 0;
    Process* self = nullptr;
    Process p(&eq, 1.0, [&](SimTime) {
        if (++count == 3) self->stop();
    });
    self = &p;
    p.start();
    eq.run(10.0);
    EXPECT_EQ(count, 3);
}

TEST(ProcessTest, ThrowingBodyKeepsRunning) {
    SimLog log(LogLevel::Off);
    EventQueue eq(&log);
    int count = 0;
    Process p(&eq, 1.0, [&](SimTime) {
        count++;
        throw std::runtime_error("body failed");
    });
    p.start();
    eq.run(3.0);
    EXPECT_EQ(count, 3);
    EXPECT_EQ(eq.getStats().callback_errors, 3u);
}

TEST(ProcessTest, NonPositivePeriodRejected) {
    EventQueue eq;
    EXPECT_THROW(Process(&eq, 0.0, [](SimTime) {}), ValidationError);
    EXPECT_THROW(Process(&eq, -1.0, [](SimTime) {}), ValidationError);
}

TEST(ProcessTest, DestroyedProcessLeavesQueueSafe) {
    EventQueue eq;
    int count = 0;
    {
        Process p(&eq, 1.0, [&](SimTime) { count++; });
        p.start();
        eq.run(1.5);
    }
    eq.run(5.0);
    EXPECT_EQ(count, 1);
}
