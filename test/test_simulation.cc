// test/test_simulation.cc
#include <gtest/gtest.h>
#include "../include/simulation.hh"
#include "../include/config_loader.hh"
#include "../include/modules.hh"
#include "../include/sim_errors.hh"

namespace {
json smallScenario() {
    return R"({
        "duration": 5.0,
        "seed": 3,
        "log_level": "off",
        "latency": { "a1": 0.01, "e2": 0.005, "f1": 0.002 },
        "nodes": [ { "node_id": "du1", "node_type": "o-du", "max_ues": 2 } ],
        "elements": [
            { "name": "ru1", "type": "o_ru", "fronthaul_du": "du1", "iq_period": 0.5 },
            { "name": "du1", "type": "o_du", "f1_peer": "cucp1", "report_period": 1.0 },
            { "name": "cucp1", "type": "o_cu_cp", "cu_up": "cuup1", "bearers": ["ue1"] },
            { "name": "cuup1", "type": "o_cu_up" },
            { "name": "ue1", "type": "ue", "serving_du": "du1", "position": { "x": 5, "y": 5 },
              "mobility": { "model": "random_walk", "step_size": 1.0 } }
        ],
        "local_controllers": [
            { "name": "ric", "elements": ["ru1", "du*"],
              "xapps": [ { "id": "ho", "type": "handover", "probability": 1.0 } ] }
        ],
        "global_controller": {
            "name": "smo",
            "policies": [
                { "at": 1.0, "type": "POLICY-TYPE-1", "target": "o_du",
                  "content": { "transmit_power": 40.0 } }
            ]
        }
    })"_json;
}
}

TEST(SimulationTest, BuildsAndRunsSmallScenario) {
    Simulation sim;
    sim.build(smallScenario());
    sim.run();

    EXPECT_DOUBLE_EQ(sim.getEventQueue().now(), 5.0);
    auto* du = dynamic_cast<DistributedUnit*>(sim.getElements().find("du1"));
    ASSERT_NE(du, nullptr);
    EXPECT_TRUE(du->isF1Established());
    EXPECT_DOUBLE_EQ(du->load(), 0.5);
    EXPECT_DOUBLE_EQ(du->getParams()["transmit_power"].get<double>(), 40.0);
    EXPECT_GT(du->getIqSlots(), 0u);
    EXPECT_GT(du->getControlsApplied(), 0u);

    LocalController* lc = sim.getLocalController("ric");
    ASSERT_NE(lc, nullptr);
    EXPECT_EQ(lc->getElementIds(), (std::vector<std::string>{"du1", "ru1"}));
    EXPECT_EQ(lc->policyCount(), 1u);
    EXPECT_EQ(sim.getGlobalController()->getPolicyStatus("policy-1"), "accepted");
}

TEST(SimulationTest, StatsReport) {
    Simulation sim;
    sim.build(smallScenario());
    sim.run(3.0);

    json stats = sim.collectStats();
    EXPECT_DOUBLE_EQ(stats["time"].get<double>(), 3.0);
    EXPECT_EQ(stats["events"]["callback_errors"], 0);
    EXPECT_GT(stats["channels"]["e2"]["delivered"].get<uint64_t>(), 0u);
    EXPECT_EQ(stats["elements"]["cucp1"]["bearers_established"], 1);
    EXPECT_EQ(stats["elements"]["cuup1"]["bearers"], 1);
    EXPECT_EQ(stats["elements"]["cucp1"]["connected_dus"], 1);
    EXPECT_GT(stats["elements"]["ue1"]["position_updates"].get<uint64_t>(), 0u);
    EXPECT_EQ(stats["mobility"]["entities"], 1);
    EXPECT_EQ(stats["config"]["nodes"], 1);
    EXPECT_TRUE(stats["local_controllers"].contains("ric"));
}

TEST(SimulationTest, SampleStatsEveryPeriod) {
    Simulation sim;
    sim.build(smallScenario());
    std::vector<double> times;
    sim.sampleStats(1.0, [&](const json& s) { times.push_back(s["time"].get<double>()); });
    sim.run(3.0);
    EXPECT_EQ(times, (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(SimulationTest, RunBeforeBuildThrows) {
    Simulation sim;
    EXPECT_THROW(sim.run(1.0), SimError);
}

TEST(SimulationTest, BuildTwiceThrows) {
    Simulation sim;
    sim.build(smallScenario());
    EXPECT_THROW(sim.build(smallScenario()), SimError);
}

TEST(SimulationTest, RejectsBadScenarios) {
    {
        Simulation sim;
        json s = smallScenario();
        s["elements"].push_back({{"name", "x"}, {"type", "gnb"}});
        EXPECT_THROW(sim.build(s), ValidationError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["log_level"] = "loud";
        EXPECT_THROW(sim.build(s), ValidationError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["duration"] = 0.0;
        EXPECT_THROW(sim.build(s), ValidationError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["elements"][4]["serving_du"] = "cucp1";
        EXPECT_THROW(sim.build(s), AddressError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["local_controllers"][0]["elements"].push_back("du9");
        EXPECT_THROW(sim.build(s), AddressError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["latency"]["o2"] = 0.1;
        EXPECT_THROW(sim.build(s), ValidationError);
    }
    {
        Simulation sim;
        json s = smallScenario();
        s["global_controller"]["policies"][0]["to"] = "ric-north";
        EXPECT_THROW(sim.build(s), AddressError);
    }
}

TEST(SimulationTest, ObserversOnlySeeTheirControllersElements) {
    json scenario = R"({
        "duration": 5.0,
        "log_level": "off",
        "latency": { "e2": 0.01 },
        "elements": [
            { "name": "du1", "type": "o_du", "report_period": 1.0 },
            { "name": "du2", "type": "o_du", "report_period": 1.0 }
        ],
        "local_controllers": [
            { "name": "ric-east", "elements": ["du1"], "enforcement_period": 0,
              "xapps": [ { "id": "ho", "type": "handover", "probability": 1.0 } ] },
            { "name": "ric-west", "elements": ["du2"], "enforcement_period": 0,
              "xapps": [ { "id": "kpm", "type": "observer" } ] }
        ]
    })"_json;

    Simulation sim;
    sim.build(scenario);
    sim.run(2.5);

    PubSubChannel* east = sim.getIndicationChannel("ric-east");
    PubSubChannel* west = sim.getIndicationChannel("ric-west");
    ASSERT_NE(east, nullptr);
    ASSERT_NE(west, nullptr);
    EXPECT_NE(east, west);
    // Two reports of two indications each, one subscriber per channel
    EXPECT_EQ(east->getStats().delivered, 4u);
    EXPECT_EQ(west->getStats().delivered, 4u);
    EXPECT_EQ(east->getStats().failed, 0u);
    EXPECT_EQ(west->getStats().failed, 0u);

    auto* du1 = dynamic_cast<DistributedUnit*>(sim.getElements().find("du1"));
    auto* du2 = dynamic_cast<DistributedUnit*>(sim.getElements().find("du2"));
    EXPECT_EQ(du1->getControlsApplied(), 2u);
    EXPECT_EQ(du2->getControlsApplied(), 0u);
    EXPECT_EQ(sim.getLocalController("ric-east")->getControlsSent(), 2u);
    EXPECT_EQ(sim.getEventQueue().getStats().callback_errors, 0u);

    json stats = sim.collectStats();
    EXPECT_TRUE(stats["channels"].contains("e2_indications.ric-east"));
    EXPECT_TRUE(stats["channels"].contains("e2_indications.ric-west"));
}

TEST(SimulationTest, BasicSampleRuns) {
    Simulation sim;
    json scenario = loadConfig("samples/basic/scenario.json");
    scenario["log_level"] = "off";
    sim.build(scenario);
    sim.run();

    json stats = sim.collectStats();
    EXPECT_DOUBLE_EQ(stats["time"].get<double>(), 20.0);
    EXPECT_EQ(stats["events"]["callback_errors"], 0);
    EXPECT_DOUBLE_EQ(stats["elements"]["du1"]["load"].get<double>(), 1.0);
    EXPECT_EQ(stats["elements"]["cucp1"]["handovers_acked"], 1);
    EXPECT_EQ(stats["channels"]["e2_indications.ric-east"]["failed"], 0);
    EXPECT_EQ(stats["channels"]["e2_indications.ric-west"]["failed"], 0);
    EXPECT_EQ(sim.getMobility()->entityCount(), 3u);

    auto* du1 = dynamic_cast<DistributedUnit*>(sim.getElements().find("du1"));
    ASSERT_NE(du1, nullptr);
    EXPECT_EQ(du1->getParams()["traffic_steering"].value("target_du", ""), "du2");
}
