// include/channels/p2p_channel.hh
#ifndef P2P_CHANNEL_HH
#define P2P_CHANNEL_HH

#include "../node_registry.hh"
#include "../channel_stats.hh"
#include "../message.hh"
#include "delay_model.hh"
#include <memory>
#include <string>

class EventQueue;

/**
 * Point-to-point router for one logical interface (A1, E2, F1, Xn, ...).
 *
 * Endpoints register under a unique id. send() validates both ids right
 * away and throws AddressError on a miss; otherwise the message is queued
 * as an event at now + explicit delay + fixed latency + sampled delay.
 * At delivery the destination is resolved again: a vanished endpoint or a
 * throwing handler is logged and counted, never propagated.
 */
class P2PChannel {
private:
    std::string name;
    EventQueue* event_queue;
    NodeRegistry registry;
    SimTime latency = 0.0;
    std::unique_ptr<DelayModel> delay_model;
    ChannelStats stats;
    uint64_t next_seq = 0;
    uint64_t in_flight = 0;

    void deliver(const Message& msg);

public:
    P2PChannel(const std::string& n, EventQueue* eq) : name(n), event_queue(eq) {}

    P2PChannel(const P2PChannel&) = delete;
    P2PChannel& operator=(const P2PChannel&) = delete;

    // Re-registration of an id is ignored with a warning.
    bool registerNode(const std::string& id, SimObject* node);
    bool unregisterNode(const std::string& id);
    bool isRegistered(const std::string& id) const { return registry.contains(id); }
    SimObject* findNode(const std::string& id) const { return registry.find(id); }
    const NodeRegistry& getRegistry() const { return registry; }

    void send(Message msg, const std::string& src, const std::string& dst);
    void sendAfter(SimTime delay, Message msg, const std::string& src, const std::string& dst);

    void setLatency(SimTime d) { latency = d < 0.0 ? 0.0 : d; }
    SimTime getLatency() const { return latency; }
    void setDelayModel(std::unique_ptr<DelayModel> model) { delay_model = std::move(model); }
    bool hasDelayModel() const { return delay_model != nullptr; }

    const std::string& getName() const { return name; }
    const ChannelStats& getStats() const { return stats; }
    void resetStats() { stats.reset(); }
    uint64_t getInFlight() const { return in_flight; }
};

#endif // P2P_CHANNEL_HH
