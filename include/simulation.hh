// include/simulation.hh
#ifndef SIMULATION_HH
#define SIMULATION_HH

#include "sim_log.hh"
#include "event_queue.hh"
#include "node_registry.hh"
#include "config_store.hh"
#include "module_factory.hh"
#include "channels/p2p_channel.hh"
#include "channels/pubsub_channel.hh"
#include "mobility/mobility_engine.hh"
#include "modules/local_controller.hh"
#include "modules/global_controller.hh"
#include "apps/xapp.hh"
#include "apps/rapp.hh"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * One simulation run: owns the log, the clock, every channel, the
 * elements and the controller hierarchy built from a scenario document.
 *
 * Members are declared so that the queue outlives the channels whose
 * delivery closures it holds, and apps outlive nothing they point into.
 */
class Simulation {
private:
    SimLog log;
    EventQueue event_queue;

    P2PChannel a1;
    P2PChannel e2;
    P2PChannel f1;
    P2PChannel xn;
    P2PChannel x2;
    P2PChannel fronthaul;

    ConfigStore config_store;
    std::vector<std::unique_ptr<XApp>> xapps;
    std::vector<std::unique_ptr<RApp>> rapps;
    ModuleFactory factory;
    NodeRegistry elements;
    std::unique_ptr<MobilityEngine> mobility;
    // One per local controller, so observers only see their own elements
    std::map<std::string, std::unique_ptr<PubSubChannel>> indication_channels;
    std::map<std::string, std::unique_ptr<LocalController>> local_controllers;
    std::unique_ptr<GlobalController> global_controller;
    std::unique_ptr<Process> stats_sampler;

    SimTime duration = 10.0;
    uint32_t seed = 1;
    bool built = false;

    void buildChannels(const json& scenario);
    void buildElements(const json& scenario);
    void buildLocalControllers(const json& scenario, SimTime enforcement_period);
    void buildGlobalController(const json& scenario);
    void startElements(const json& scenario);
    void schedulePolicy(const json& entry);

public:
    Simulation();
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Throws ValidationError/AddressError/SimError on a bad scenario.
    void build(const json& scenario);
    void run(SimTime until);
    void run() { run(duration); }

    json collectStats() const;
    // Pushes collectStats() to the callback every period.
    void sampleStats(SimTime period, std::function<void(const json&)> callback);

    SimLog& getLog() { return log; }
    EventQueue& getEventQueue() { return event_queue; }
    SimTime getDuration() const { return duration; }
    ConfigStore& getConfigStore() { return config_store; }
    ModuleFactory& getFactory() { return factory; }
    const NodeRegistry& getElements() const { return elements; }
    MobilityEngine* getMobility() const { return mobility.get(); }
    LocalController* getLocalController(const std::string& id) const;
    GlobalController* getGlobalController() const { return global_controller.get(); }

    P2PChannel* getChannel(const std::string& name);
    PubSubChannel* getIndicationChannel(const std::string& lc_id) const;
};

#endif // SIMULATION_HH
