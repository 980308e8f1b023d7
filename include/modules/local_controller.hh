// include/modules/local_controller.hh
#ifndef LOCAL_CONTROLLER_HH
#define LOCAL_CONTROLLER_HH

#include "../sim_object.hh"
#include "../policy.hh"
#include "../process.hh"
#include "../channels/p2p_channel.hh"
#include "../channels/pubsub_channel.hh"
#include <map>
#include <memory>
#include <string>
#include <vector>

class XApp;

/**
 * Fast control tier (near-RT RIC).
 *
 * Holds policies received over A1 and pushes them to the managed elements
 * whose class matches the policy target, over E2. E2 indications coming
 * up from elements are republished on the indication channel for observers
 * (xApps).
 */
class LocalController : public SimObject {
private:
    P2PChannel* a1;
    P2PChannel* e2;
    PubSubChannel* indications;

    std::map<std::string, SimObject*> elements;
    std::map<std::string, Policy> policies;
    std::map<std::string, XApp*> xapps;
    std::unique_ptr<Process> enforcement;

    uint64_t policies_received = 0;
    uint64_t policies_rejected = 0;
    uint64_t enforcements_sent = 0;
    uint64_t indications_routed = 0;
    uint64_t controls_sent = 0;

    void sendFeedback(const std::string& to, const std::string& policy_id,
                      bool accepted, const std::string& reason);

protected:
    void handleMessage(const Message& msg, const std::string& src) override;

public:
    LocalController(const std::string& n, EventQueue* eq,
                    P2PChannel* a1_ch, P2PChannel* e2_ch, PubSubChannel* ind_ch);
    ~LocalController() override;

    // Managed elements only (o_ru, o_du, o_cu_cp, o_cu_up).
    bool registerElement(const std::string& id, SimObject* element);
    bool removeElement(const std::string& id);
    bool hasElement(const std::string& id) const { return elements.count(id) > 0; }
    SimObject* findElement(const std::string& id) const;
    std::vector<std::string> getElementIds() const;

    // Validates and stores; sender non-empty means the policy came over A1
    // and gets an A1_POLICY_FEEDBACK answer.
    bool receivePolicy(const json& policy, const std::string& sender = "");
    bool removePolicy(const std::string& policy_id);
    const Policy* getPolicy(const std::string& policy_id) const;
    size_t policyCount() const { return policies.size(); }

    // One sweep over stored policies; returns enforcement messages sent.
    size_t enforcePolicies();
    void startPeriodicEnforcement(SimTime period);
    void stopPeriodicEnforcement();

    bool addObserver(const std::string& id, PubSubChannel::Callback cb);
    bool removeObserver(const std::string& id);
    bool addXApp(XApp* xapp);
    bool removeXApp(const std::string& id);
    size_t xappCount() const { return xapps.size(); }

    // Throws AddressError for an element this controller does not manage.
    void sendControl(Message msg, const std::string& element_id);

    P2PChannel* getA1() const { return a1; }
    P2PChannel* getE2() const { return e2; }
    PubSubChannel* getIndicationChannel() const { return indications; }

    uint64_t getPoliciesReceived() const { return policies_received; }
    uint64_t getPoliciesRejected() const { return policies_rejected; }
    uint64_t getEnforcementsSent() const { return enforcements_sent; }
    uint64_t getIndicationsRouted() const { return indications_routed; }
    uint64_t getControlsSent() const { return controls_sent; }

    json statsJson() const;
};

#endif // LOCAL_CONTROLLER_HH
