// src/apps/rapp.cc
#include "apps/rapp.hh"
#include "modules/global_controller.hh"
#include "modules/local_controller.hh"
#include "modules/distributed_unit.hh"
#include "sim_errors.hh"

#include <algorithm>

GlobalController& RApp::requireController() const {
    if (!controller) {
        throw SimError("rApp " + id + " is not attached to a controller");
    }
    return *controller;
}

std::string RApp::createPolicy(PolicyType type, const json& content, ElementClass target) {
    return requireController().createPolicy(type, content, target);
}

bool RApp::updatePolicy(const std::string& policy_id, const json& content) {
    return requireController().updatePolicy(policy_id, content);
}

bool RApp::deletePolicy(const std::string& policy_id) {
    return requireController().deletePolicy(policy_id);
}

void RApp::sendPolicy(const std::string& policy_id, const std::string& lc_id) {
    requireController().distributePolicy(policy_id, lc_id);
}

std::map<std::string, double> LoadBalancingRApp::collectDuLoads() const {
    if (load_source) return load_source();

    std::map<std::string, double> loads;
    for (const auto& [lc_id, lc] : controller->getLocalControllers()) {
        for (const auto& eid : lc->getElementIds()) {
            auto* du = dynamic_cast<DistributedUnit*>(lc->findElement(eid));
            if (du) loads[eid] = du->load();
        }
    }
    return loads;
}

std::string LoadBalancingRApp::getSteeringPolicy(const std::string& du_id) const {
    auto it = steering_policies.find(du_id);
    return it != steering_policies.end() ? it->second : "";
}

void LoadBalancingRApp::start() {
    GlobalController& gc = requireController();
    monitor = std::make_unique<Process>(gc.getEventQueue(), period,
        [this](SimTime) { monitorLoad(); }, "rapp:" + id);
    monitor->start();
}

void LoadBalancingRApp::stop() {
    if (monitor) monitor->stop();
}

void LoadBalancingRApp::detach() {
    stop();
    RApp::detach();
}

size_t LoadBalancingRApp::monitorLoad() {
    GlobalController& gc = requireController();
    SimLog& log = gc.getEventQueue()->getLog();
    rounds++;

    std::map<std::string, double> loads = collectDuLoads();
    if (loads.empty()) return 0;

    auto least = std::min_element(loads.begin(), loads.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    size_t issued = 0;
    for (const auto& [du_id, load] : loads) {
        if (load <= load_threshold) continue;
        LocalController* lc = gc.findControllerFor(du_id);
        if (!lc) {
            SLOG_WARN(log, RAPP, "%s: no local controller manages %s", id.c_str(), du_id.c_str());
            continue;
        }
        json content = {
            {"action", "steer_traffic"},
            {"source_du", du_id},
            {"target_du", least->first},
            {"ue_group", "high_load_ues"},
            {"intensity", "high"}
        };
        std::string pid = getSteeringPolicy(du_id);
        if (pid.empty() || !gc.getPolicy(pid)) {
            pid = createPolicy(PolicyType::Type2, content, ElementClass::DistributedUnit);
            steering_policies[du_id] = pid;
        } else {
            updatePolicy(pid, content);
        }
        sendPolicy(pid, lc->getName());
        issued++;
        SLOG_INFO(log, RAPP, "%s: %s load %.2f above %.2f, steering to %s via %s", id.c_str(),
                  du_id.c_str(), load, load_threshold, least->first.c_str(), lc->getName().c_str());
    }
    policies_issued += issued;
    return issued;
}
