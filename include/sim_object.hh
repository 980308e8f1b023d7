// include/sim_object.hh
#ifndef SIM_OBJECT_HH
#define SIM_OBJECT_HH

#include "event_queue.hh"
#include "message.hh"
#include <map>
#include <string>
#include <unordered_map>

class P2PChannel;

// Explicit class tag carried by every simulated node.
enum class ElementClass {
    RadioUnit,        // o_ru
    DistributedUnit,  // o_du
    CuControlPlane,   // o_cu_cp
    CuUserPlane,      // o_cu_up
    UserTerminal,     // ue
    LocalController,  // near_rt_ric
    GlobalController  // non_rt_ric
};

const char* elementClassName(ElementClass c);
bool parseElementClass(const std::string& s, ElementClass& out);
// Classes a policy may target and a local controller may manage
bool isManagedClass(ElementClass c);

/**
 * Base of every simulated node.
 *
 * Channels deliver into receive(); policy enforcement and O1 configuration
 * messages are dispatched to applyPolicy()/applyConfig(), anything else to
 * handleMessage(). Nodes reach channels through named bindings
 * ("e2", "f1", "fronthaul", ...).
 */
class SimObject {
public:
    struct AppliedPolicy {
        unsigned version = 0;
        SimTime applied_at = 0.0;
        uint64_t times = 0;
    };

protected:
    std::string name;
    ElementClass element_class;
    EventQueue* event_queue;
    json params = json::object();

    std::unordered_map<std::string, P2PChannel*> channels;
    std::unordered_map<std::string, std::string> default_peers;

    std::map<std::string, AppliedPolicy> applied_policies;
    uint64_t policy_apply_count = 0;
    uint64_t config_apply_count = 0;
    std::map<std::string, uint64_t> received_by_type;

    // Element-specific handling of any message that is not policy/config
    virtual void handleMessage(const Message& msg, const std::string& src);

    // Merges keys of obj that exist in params (or all keys when allow_new)
    void mergeParams(const json& obj, bool allow_new);

public:
    SimObject(const std::string& n, ElementClass c, EventQueue* eq)
        : name(n), element_class(c), event_queue(eq) {}
    virtual ~SimObject() = default;

    SimObject(const SimObject&) = delete;
    SimObject& operator=(const SimObject&) = delete;

    // Element contract
    void receive(const Message& msg, const std::string& src);
    virtual void applyPolicy(const json& policy);
    virtual void applyConfig(const json& config);
    virtual void updatePosition(SimTime /*elapsed*/) {}

    // Channel bindings; peer is the default destination for sendOn()
    void bindChannel(const std::string& label, P2PChannel* ch, const std::string& peer = "");
    void unbindChannel(const std::string& label);
    P2PChannel* getChannel(const std::string& label) const;
    bool hasChannel(const std::string& label) const { return getChannel(label) != nullptr; }
    const std::string& getPeer(const std::string& label) const;

    // Sends through a bound channel; throws AddressError if the binding,
    // the source or the destination is unknown.
    void sendOn(const std::string& label, Message msg, const std::string& dst = "");

    const std::string& getName() const { return name; }
    ElementClass getElementClass() const { return element_class; }
    const char* getClassName() const { return elementClassName(element_class); }
    EventQueue* getEventQueue() const { return event_queue; }
    SimTime getCurrentTime() const { return event_queue->now(); }

    const json& getParams() const { return params; }
    // Scenario-time overrides of known parameters
    void setParams(const json& p) { mergeParams(p, false); }
    const std::map<std::string, AppliedPolicy>& getAppliedPolicies() const { return applied_policies; }
    uint64_t getPolicyApplyCount() const { return policy_apply_count; }
    uint64_t getConfigApplyCount() const { return config_apply_count; }
    uint64_t getReceivedCount(const std::string& type) const;
    uint64_t getReceivedCount() const;
};

#endif // SIM_OBJECT_HH
