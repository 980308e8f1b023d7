// test/test_local_controller.cc
#include <gtest/gtest.h>
#include "../include/modules/local_controller.hh"
#include "../include/apps/xapp.hh"
#include "../include/sim_errors.hh"
#include "mock_modules.hh"

namespace {
json makePolicy(const std::string& id, const std::string& target, json content, unsigned version = 1) {
    return {
        {"policy_id", id},
        {"policy_type", "POLICY-TYPE-1"},
        {"policy_content", content},
        {"version", version},
        {"target", target}
    };
}
}

class LocalControllerTest : public ::testing::Test {
protected:
    SimLog log{LogLevel::Off};
    EventQueue eq{&log};
    P2PChannel a1{"a1", &eq};
    P2PChannel e2{"e2", &eq};
    PubSubChannel indications{"e2_indications", &eq};
    LocalController lc{"ric", &eq, &a1, &e2, &indications};
    MockElement du{"du1", &eq, ElementClass::DistributedUnit};
    MockElement ru{"ru1", &eq, ElementClass::RadioUnit};
};

TEST_F(LocalControllerTest, RegisterElementBindsE2) {
    EXPECT_TRUE(lc.registerElement("du1", &du));
    EXPECT_TRUE(e2.isRegistered("du1"));
    EXPECT_EQ(du.getChannel("e2"), &e2);
    EXPECT_EQ(du.getPeer("e2"), "ric");
    EXPECT_FALSE(lc.registerElement("du1", &du));
}

TEST_F(LocalControllerTest, RejectsUnmanagedClasses) {
    MockElement ue("ue1", &eq, ElementClass::UserTerminal);
    MockElement other_ric("ric2", &eq, ElementClass::LocalController);
    EXPECT_FALSE(lc.registerElement("ue1", &ue));
    EXPECT_FALSE(lc.registerElement("ric2", &other_ric));
    EXPECT_FALSE(lc.registerElement("x", nullptr));
    EXPECT_FALSE(lc.hasElement("ue1"));
    EXPECT_FALSE(e2.isRegistered("ue1"));
}

TEST_F(LocalControllerTest, MalformedPolicyRejectedWithoutThrowing) {
    json bad = makePolicy("p1", "ue", json::object());
    EXPECT_NO_THROW(EXPECT_FALSE(lc.receivePolicy(bad)));
    EXPECT_FALSE(lc.receivePolicy(json{{"policy_id", 5}}));
    EXPECT_EQ(lc.getPoliciesRejected(), 2u);
    EXPECT_EQ(lc.policyCount(), 0u);
    EXPECT_EQ(log.count(LogLevel::Error), 2u);
}

TEST_F(LocalControllerTest, DuplicatePolicyIdLastWriteWins) {
    EXPECT_TRUE(lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 1}})));
    EXPECT_TRUE(lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 2}}, 2)));
    ASSERT_NE(lc.getPolicy("p1"), nullptr);
    EXPECT_EQ(lc.getPolicy("p1")->version, 2u);
    EXPECT_EQ(lc.getPolicy("p1")->content["gain"], 2);
    EXPECT_EQ(lc.policyCount(), 1u);
}

TEST_F(LocalControllerTest, EnforcementTargetsMatchingClassOnly) {
    lc.registerElement("du1", &du);
    lc.registerElement("ru1", &ru);
    lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 5}}));

    EXPECT_EQ(lc.enforcePolicies(), 1u);
    eq.run(1.0);
    EXPECT_EQ(du.policies.size(), 1u);
    EXPECT_EQ(ru.policies.size(), 0u);
    EXPECT_EQ(du.getParams()["gain"], 5);
}

TEST_F(LocalControllerTest, EnforcementIsIdempotent) {
    lc.registerElement("du1", &du);
    lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 5}, {"mode", "eco"}}));
    lc.enforcePolicies();
    eq.run(1.0);
    json after_first = du.getParams();

    lc.enforcePolicies();
    lc.enforcePolicies();
    eq.run(2.0);
    EXPECT_EQ(du.getParams(), after_first);
    EXPECT_EQ(du.getAppliedPolicies().at("p1").times, 3u);
    EXPECT_EQ(du.getPolicyApplyCount(), 3u);
}

TEST_F(LocalControllerTest, ConflictingPoliciesLastAppliedWins) {
    lc.registerElement("du1", &du);
    lc.receivePolicy(makePolicy("p-a", "o_du", {{"gain", 1}}));
    lc.receivePolicy(makePolicy("p-b", "o_du", {{"gain", 2}}));
    EXPECT_EQ(lc.enforcePolicies(), 2u);
    eq.run(1.0);
    // Sweep order is by policy id, so p-b lands last
    EXPECT_EQ(du.getParams()["gain"], 2);
}

TEST_F(LocalControllerTest, PolicyOverA1GetsFeedback) {
    MockElement smo("smo", &eq, ElementClass::GlobalController);
    a1.registerNode("smo", &smo);
    a1.send(Message(MSG_A1_POLICY, makePolicy("p1", "o_ru", {{"gain", 3}})), "smo", "ric");
    a1.send(Message(MSG_A1_POLICY, makePolicy("", "o_ru", json::object())), "smo", "ric");
    eq.run(1.0);
    ASSERT_EQ(smo.received.size(), 2u);
    EXPECT_EQ(smo.received[0].type, MSG_A1_POLICY_FEEDBACK);
    EXPECT_EQ(smo.received[0].payload["status"], "accepted");
    EXPECT_EQ(smo.received[1].payload["status"], "rejected");
    EXPECT_EQ(lc.policyCount(), 1u);
}

TEST_F(LocalControllerTest, IndicationsRepublishedToObservers) {
    lc.registerElement("du1", &du);
    std::vector<std::string> origins;
    lc.addObserver("obs", [&](const Message& m, const std::string& origin) {
        EXPECT_EQ(m.type, MSG_INDICATION);
        origins.push_back(origin);
    });
    du.sendOn("e2", Message(MSG_INDICATION, {{"metric", "cell_load"}}));
    eq.run(1.0);
    EXPECT_EQ(origins, (std::vector<std::string>{"du1"}));
    EXPECT_EQ(lc.getIndicationsRouted(), 1u);
    EXPECT_TRUE(lc.removeObserver("obs"));
}

TEST_F(LocalControllerTest, SendControlRequiresManagedElement) {
    EXPECT_THROW(lc.sendControl(Message(MSG_CONTROL, {}), "du1"), AddressError);
    lc.registerElement("du1", &du);
    lc.sendControl(Message("ANY", {{"k", 1}}), "du1");
    eq.run(1.0);
    ASSERT_EQ(du.received.size(), 1u);
    EXPECT_EQ(du.received[0].type, MSG_CONTROL);
}

TEST_F(LocalControllerTest, XAppReceivesIndications) {
    lc.registerElement("du1", &du);
    XApp app("watcher");
    EXPECT_TRUE(lc.addXApp(&app));
    EXPECT_FALSE(lc.addXApp(&app));
    EXPECT_TRUE(app.isAttached());
    du.sendOn("e2", Message(MSG_INDICATION, {{"message_type", "KPM_REPORT"}}));
    eq.run(1.0);
    EXPECT_EQ(app.getIndicationsSeen(), 1u);
    EXPECT_TRUE(lc.removeXApp("watcher"));
    EXPECT_FALSE(app.isAttached());
}

TEST_F(LocalControllerTest, PeriodicEnforcement) {
    lc.registerElement("du1", &du);
    lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 1}}));
    lc.startPeriodicEnforcement(1.0);
    eq.run(3.5);
    EXPECT_EQ(du.policies.size(), 3u);
    lc.stopPeriodicEnforcement();
    eq.run(6.0);
    EXPECT_EQ(du.policies.size(), 3u);
}

TEST_F(LocalControllerTest, RemoveElementStopsEnforcement) {
    lc.registerElement("du1", &du);
    EXPECT_TRUE(lc.receivePolicy(makePolicy("p1", "o_du", json::object())));
    EXPECT_TRUE(lc.removeElement("du1"));
    EXPECT_FALSE(e2.isRegistered("du1"));
    EXPECT_EQ(lc.enforcePolicies(), 0u);
    EXPECT_FALSE(lc.removeElement("du1"));
}

TEST_F(LocalControllerTest, IdTakenOnE2IsRejected) {
    LocalController other_lc("ric-b", &eq, &a1, &e2, &indications);
    MockElement clash("du1", &eq);
    ASSERT_TRUE(lc.registerElement("du1", &du));

    EXPECT_FALSE(other_lc.registerElement("du1", &clash));
    EXPECT_FALSE(other_lc.hasElement("du1"));
    EXPECT_EQ(clash.getChannel("e2"), nullptr);

    // A controller name is taken too
    EXPECT_FALSE(other_lc.registerElement("ric", &clash));

    other_lc.receivePolicy(makePolicy("p1", "o_du", {{"gain", 3}}));
    EXPECT_EQ(other_lc.enforcePolicies(), 0u);
    eq.run(1.0);
    EXPECT_TRUE(du.policies.empty());
    EXPECT_TRUE(clash.policies.empty());
}

TEST_F(LocalControllerTest, DuplicateControllerNameThrows) {
    EXPECT_THROW(LocalController("ric", &eq, &a1, &e2, &indications), ValidationError);
    EXPECT_TRUE(a1.isRegistered("ric"));
    EXPECT_TRUE(e2.isRegistered("ric"));
}

TEST_F(LocalControllerTest, DestructionWithdrawsChannelRegistrations) {
    MockElement ru9("ru9", &eq, ElementClass::RadioUnit);
    XApp app("watcher");
    {
        LocalController scoped("ric-tmp", &eq, &a1, &e2, &indications);
        ASSERT_TRUE(scoped.registerElement("ru9", &ru9));
        ASSERT_TRUE(scoped.addXApp(&app));
        EXPECT_EQ(indications.subscriberCount(), 1u);
    }
    EXPECT_FALSE(a1.isRegistered("ric-tmp"));
    EXPECT_FALSE(e2.isRegistered("ric-tmp"));
    EXPECT_FALSE(e2.isRegistered("ru9"));
    EXPECT_EQ(indications.subscriberCount(), 0u);
    EXPECT_TRUE(a1.isRegistered("ric"));
}
