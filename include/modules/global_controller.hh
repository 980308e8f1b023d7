// include/modules/global_controller.hh
#ifndef GLOBAL_CONTROLLER_HH
#define GLOBAL_CONTROLLER_HH

#include "../sim_object.hh"
#include "../policy.hh"
#include "../channels/p2p_channel.hh"
#include <map>
#include <string>
#include <vector>

class LocalController;
class RApp;

/**
 * Slow control tier (non-RT RIC).
 *
 * Authors policies and pushes them over A1 to the local controllers it
 * manages. Policy ids are "policy-N" from a per-controller counter, so two
 * controllers never share state. Feedback from local controllers updates
 * a per-policy status: pending, accepted or rejected.
 */
class GlobalController : public SimObject {
private:
    P2PChannel* a1;
    std::map<std::string, LocalController*> local_controllers;
    std::map<std::string, Policy> policies;
    std::map<std::string, std::string> policy_status;
    std::map<std::string, RApp*> rapps;
    uint64_t next_policy_id = 1;
    uint64_t policies_distributed = 0;
    uint64_t feedback_received = 0;

protected:
    void handleMessage(const Message& msg, const std::string& src) override;

public:
    GlobalController(const std::string& n, EventQueue* eq, P2PChannel* a1_ch);

    // Throws ValidationError for a non-object content or unmanaged target.
    std::string createPolicy(PolicyType type, const json& content,
                             ElementClass target = ElementClass::DistributedUnit);
    bool updatePolicy(const std::string& policy_id, const json& content);
    bool deletePolicy(const std::string& policy_id);
    const Policy* getPolicy(const std::string& policy_id) const;
    std::vector<std::string> getPolicyIds() const;

    // Throws AddressError when the local controller is not managed here.
    void distributePolicy(const Policy& policy, const std::string& lc_id);
    // Same, looking the policy up by id; an unknown id is an AddressError.
    void distributePolicy(const std::string& policy_id, const std::string& lc_id);
    size_t broadcastPolicy(const std::string& policy_id);

    bool addManagedLocalController(LocalController* lc);
    bool removeManagedLocalController(const std::string& lc_id);
    LocalController* getLocalController(const std::string& lc_id) const;
    const std::map<std::string, LocalController*>& getLocalControllers() const { return local_controllers; }
    // Local controller managing the element, or nullptr
    LocalController* findControllerFor(const std::string& element_id) const;

    bool addRApp(RApp* rapp);
    bool removeRApp(const std::string& id);
    size_t rappCount() const { return rapps.size(); }

    // "pending", "accepted", "rejected"; empty for an unknown id
    std::string getPolicyStatus(const std::string& policy_id) const;

    uint64_t getPoliciesDistributed() const { return policies_distributed; }
    uint64_t getFeedbackReceived() const { return feedback_received; }
    P2PChannel* getA1() const { return a1; }

    json statsJson() const;
};

#endif // GLOBAL_CONTROLLER_HH
