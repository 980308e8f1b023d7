// include/apps/rapp.hh
#ifndef RAPP_HH
#define RAPP_HH

#include "../policy.hh"
#include "../process.hh"
#include <functional>
#include <map>
#include <memory>
#include <string>

class GlobalController;

// Policy author hosted by a global controller.
class RApp {
protected:
    std::string id;
    GlobalController* controller = nullptr;

    GlobalController& requireController() const;

public:
    explicit RApp(const std::string& i) : id(i) {}
    virtual ~RApp() = default;

    RApp(const RApp&) = delete;
    RApp& operator=(const RApp&) = delete;

    void attach(GlobalController* gc) { controller = gc; }
    virtual void detach() { controller = nullptr; }
    bool isAttached() const { return controller != nullptr; }

    // All throw SimError when not attached.
    std::string createPolicy(PolicyType type, const json& content,
                             ElementClass target = ElementClass::DistributedUnit);
    bool updatePolicy(const std::string& policy_id, const json& content);
    bool deletePolicy(const std::string& policy_id);
    void sendPolicy(const std::string& policy_id, const std::string& lc_id);

    const std::string& getId() const { return id; }
};

/**
 * Threshold load balancer. Every period it samples DU loads; for each DU
 * above the threshold it sends a POLICY-TYPE-2 "steer_traffic" policy
 * toward the least loaded DU to the local controller that manages the
 * overloaded DU. Each DU keeps one steering policy, updated in place on
 * later rounds.
 */
class LoadBalancingRApp : public RApp {
public:
    using LoadSource = std::function<std::map<std::string, double>()>;

private:
    SimTime period;
    double load_threshold;
    LoadSource load_source;
    std::unique_ptr<Process> monitor;
    std::map<std::string, std::string> steering_policies;   // du id -> policy id
    uint64_t rounds = 0;
    uint64_t policies_issued = 0;

    std::map<std::string, double> collectDuLoads() const;

public:
    LoadBalancingRApp(const std::string& i, SimTime monitor_period = 5.0, double threshold = 0.8)
        : RApp(i), period(monitor_period), load_threshold(threshold) {}

    // Default source reads DistributedUnit::load() of managed DUs
    void setLoadSource(LoadSource src) { load_source = std::move(src); }

    void start();
    void stop();
    void detach() override;

    // One monitoring round; returns policies issued.
    size_t monitorLoad();

    double getThreshold() const { return load_threshold; }
    SimTime getPeriod() const { return period; }
    uint64_t getRounds() const { return rounds; }
    uint64_t getPoliciesIssued() const { return policies_issued; }
    // Empty when no steering policy exists for the DU
    std::string getSteeringPolicy(const std::string& du_id) const;
};

#endif // RAPP_HH
