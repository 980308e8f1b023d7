// test/test_config_store.cc
#include <gtest/gtest.h>
#include "../include/config_store.hh"
#include "../include/node_registry.hh"
#include "../include/channels/p2p_channel.hh"
#include "../include/sim_errors.hh"
#include "mock_modules.hh"

class ConfigStoreTest : public ::testing::Test {
protected:
    SimLog log{LogLevel::Off};
    EventQueue eq{&log};
    ConfigStore store{&log};
};

TEST(ConfigValidationTest, AcceptsWellFormedConfig) {
    json cfg = {
        {"node_id", "du1"},
        {"node_type", "o-du"},
        {"tx_power", 40},
        {"max_ues", 64},
        {"frequency", 3.5e9},
        {"cells", json::array({{{"cell_id", "c1"}}})}
    };
    EXPECT_NO_THROW(ConfigStore::validate(cfg));
}

TEST(ConfigValidationTest, RejectsBadFields) {
    EXPECT_THROW(ConfigStore::validate(json::array()), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_type", "o-du"}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"node_type", "gnb"}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"tx_power", 51}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"tx_power", -31}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"tx_power", "high"}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"max_ues", -1}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"max_ues", 2.5}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"}, {"bandwidth", -1.0}}), ValidationError);
    EXPECT_THROW(ConfigStore::validate({{"node_id", "x"},
                                        {"cells", json::array({{{"pci", 1}}})}}), ValidationError);
}

TEST(ConfigValidationTest, BoundaryValuesAreValid) {
    EXPECT_NO_THROW(ConfigStore::validate({{"node_id", "x"}, {"tx_power", 50}}));
    EXPECT_NO_THROW(ConfigStore::validate({{"node_id", "x"}, {"tx_power", -30}}));
    EXPECT_NO_THROW(ConfigStore::validate({{"node_id", "x"}, {"max_ues", 0}}));
}

TEST_F(ConfigStoreTest, LoadNodesSkipsInvalidEntries) {
    json nodes = json::array({
        {{"node_id", "du1"}, {"max_ues", 8}},
        {{"node_id", "ru1"}, {"tx_power", 99}},
        {{"node_id", "ru2"}, {"tx_power", 20}}
    });
    EXPECT_EQ(store.loadNodes(nodes), 2u);
    EXPECT_EQ(store.getRejectedCount(), 1u);
    EXPECT_EQ(store.getNodeIds(), (std::vector<std::string>{"du1", "ru2"}));
    EXPECT_EQ(store.loadNodes(json::object()), 0u);
}

TEST_F(ConfigStoreTest, StoreMergesAndKeepsHistory) {
    store.storeConfig({{"node_id", "du1"}, {"max_ues", 8}, {"tx_power", 20}});
    store.storeConfig({{"node_id", "du1"}, {"tx_power", 30}});
    const json& cfg = store.getConfig("du1");
    EXPECT_EQ(cfg["max_ues"], 8);
    EXPECT_EQ(cfg["tx_power"], 30);
    EXPECT_EQ(store.historySize("du1"), 2u);
    EXPECT_EQ(store.getStatus("du1").status, ConfigStatus::Applied);
    EXPECT_EQ(store.getStatus("du1").version, 1u);
    EXPECT_THROW(store.getConfig("du9"), AddressError);
}

TEST_F(ConfigStoreTest, RollbackAndCommit) {
    store.storeConfig({{"node_id", "du1"}, {"tx_power", 20}});
    EXPECT_THROW(store.rollbackConfig("du1"), ValidationError);
    store.storeConfig({{"node_id", "du1"}, {"tx_power", 30}});

    store.rollbackConfig("du1");
    EXPECT_EQ(store.getConfig("du1")["tx_power"], 20);
    EXPECT_EQ(store.getStatus("du1").status, ConfigStatus::RolledBack);
    EXPECT_EQ(store.getStatus("du1").version, 0u);
    EXPECT_STREQ(configStatusName(store.getStatus("du1").status), "rolled_back");

    store.rollbackConfig("du1", 1);
    EXPECT_EQ(store.getConfig("du1")["tx_power"], 30);
    EXPECT_THROW(store.rollbackConfig("du1", 5), ValidationError);
    EXPECT_THROW(store.rollbackConfig("du9"), AddressError);

    store.commitConfig("du1");
    EXPECT_EQ(store.getStatus("du1").status, ConfigStatus::Committed);
    EXPECT_THROW(store.commitConfig("du9"), AddressError);
}

TEST_F(ConfigStoreTest, ApplyConfigUpdatesKnownParams) {
    MockElement du("du1", &eq);
    store.storeConfig({{"node_id", "du1"}, {"gain", 5}, {"node_type", "o-du"}});
    EXPECT_TRUE(store.applyConfig(&du, "du1"));
    EXPECT_EQ(du.getParams()["gain"], 5);
    EXPECT_FALSE(du.getParams().contains("node_type"));
    EXPECT_EQ(du.getConfigApplyCount(), 1u);

    EXPECT_FALSE(store.applyConfig(&du, "du9"));
    EXPECT_FALSE(store.applyConfig(nullptr, "du1"));
    EXPECT_EQ(store.getApplyErrorCount(), 2u);
}

TEST_F(ConfigStoreTest, ApplyConfigsSkipsNodesWithoutConfig) {
    MockElement du1("du1", &eq);
    MockElement du2("du2", &eq);
    NodeRegistry reg;
    reg.add("du1", &du1);
    reg.add("du2", &du2);
    store.storeConfig({{"node_id", "du2"}, {"mode", "eco"}});
    EXPECT_EQ(store.applyConfigs(reg), 1u);
    EXPECT_EQ(du1.getConfigApplyCount(), 0u);
    EXPECT_EQ(du2.getParams()["mode"], "eco");
}

TEST_F(ConfigStoreTest, PushConfigTravelsOverChannel) {
    P2PChannel o1("o1", &eq);
    o1.setLatency(0.5);
    MockElement smo("smo", &eq, ElementClass::GlobalController);
    MockElement du("du1", &eq);
    o1.registerNode("smo", &smo);
    o1.registerNode("du1", &du);

    store.storeConfig({{"node_id", "du1"}, {"gain", 3}});
    store.pushConfig(&o1, "smo", "du1");
    EXPECT_EQ(du.getParams()["gain"], 0);
    eq.run(1.0);
    EXPECT_EQ(du.getParams()["gain"], 3);
    EXPECT_TRUE(du.received.empty());

    EXPECT_THROW(store.pushConfig(&o1, "smo", "du9"), AddressError);
    EXPECT_THROW(store.pushConfig(nullptr, "smo", "du1"), AddressError);
}
