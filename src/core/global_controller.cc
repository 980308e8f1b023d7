// src/core/global_controller.cc
#include "modules/global_controller.hh"
#include "modules/local_controller.hh"
#include "apps/rapp.hh"
#include "sim_errors.hh"

GlobalController::GlobalController(const std::string& n, EventQueue* eq, P2PChannel* a1_ch)
    : SimObject(n, ElementClass::GlobalController, eq), a1(a1_ch) {
    if (!a1) {
        throw ValidationError("GlobalController " + n + ": missing A1 channel");
    }
    a1->registerNode(name, this);
}

std::string GlobalController::createPolicy(PolicyType type, const json& content, ElementClass target) {
    if (!content.is_object()) {
        throw ValidationError(name + ": policy content must be an object");
    }
    if (!isManagedClass(target)) {
        throw ValidationError(name + ": policy target " + elementClassName(target) +
                              " is not a managed element class");
    }
    Policy p;
    p.policy_id = "policy-" + std::to_string(next_policy_id++);
    p.policy_type = type;
    p.content = content;
    p.target = target;
    policies[p.policy_id] = p;
    SLOG_INFO(event_queue->getLog(), A1, "%s: created %s (%s -> %s)", name.c_str(),
              p.policy_id.c_str(), policyTypeName(type), elementClassName(target));
    return p.policy_id;
}

bool GlobalController::updatePolicy(const std::string& policy_id, const json& content) {
    auto it = policies.find(policy_id);
    if (it == policies.end()) {
        SLOG_WARN(event_queue->getLog(), A1, "%s: policy %s not found", name.c_str(), policy_id.c_str());
        return false;
    }
    if (!content.is_object()) {
        SLOG_ERROR(event_queue->getLog(), A1, "%s: policy %s content must be an object",
                   name.c_str(), policy_id.c_str());
        return false;
    }
    it->second.content = content;
    it->second.version++;
    SLOG_INFO(event_queue->getLog(), A1, "%s: updated %s to v%u", name.c_str(),
              policy_id.c_str(), it->second.version);
    return true;
}

bool GlobalController::deletePolicy(const std::string& policy_id) {
    if (policies.erase(policy_id) == 0) {
        SLOG_WARN(event_queue->getLog(), A1, "%s: policy %s not found", name.c_str(), policy_id.c_str());
        return false;
    }
    policy_status.erase(policy_id);
    return true;
}

const Policy* GlobalController::getPolicy(const std::string& policy_id) const {
    auto it = policies.find(policy_id);
    return it != policies.end() ? &it->second : nullptr;
}

std::vector<std::string> GlobalController::getPolicyIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : policies) ids.push_back(kv.first);
    return ids;
}

void GlobalController::distributePolicy(const Policy& policy, const std::string& lc_id) {
    if (!local_controllers.count(lc_id)) {
        throw AddressError(name + ": local controller " + lc_id + " not managed");
    }
    a1->send(Message(MSG_A1_POLICY, policy.toJson()), name, lc_id);
    policy_status[policy.policy_id] = "pending";
    policies_distributed++;
    SLOG_INFO(event_queue->getLog(), A1, "%s: sent %s v%u to %s", name.c_str(),
              policy.policy_id.c_str(), policy.version, lc_id.c_str());
}

void GlobalController::distributePolicy(const std::string& policy_id, const std::string& lc_id) {
    const Policy* p = getPolicy(policy_id);
    if (!p) {
        throw AddressError(name + ": unknown policy " + policy_id);
    }
    distributePolicy(*p, lc_id);
}

size_t GlobalController::broadcastPolicy(const std::string& policy_id) {
    size_t sent = 0;
    for (const auto& kv : local_controllers) {
        distributePolicy(policy_id, kv.first);
        sent++;
    }
    return sent;
}

bool GlobalController::addManagedLocalController(LocalController* lc) {
    if (!lc) return false;
    const std::string& id = lc->getName();
    if (local_controllers.count(id)) {
        SLOG_DEBUG(event_queue->getLog(), A1, "%s: %s already managed", name.c_str(), id.c_str());
        return false;
    }
    if (!a1->isRegistered(id)) {
        a1->registerNode(id, lc);
    }
    local_controllers[id] = lc;
    SLOG_INFO(event_queue->getLog(), A1, "%s: managing local controller %s", name.c_str(), id.c_str());
    return true;
}

bool GlobalController::removeManagedLocalController(const std::string& lc_id) {
    return local_controllers.erase(lc_id) > 0;
}

LocalController* GlobalController::getLocalController(const std::string& lc_id) const {
    auto it = local_controllers.find(lc_id);
    return it != local_controllers.end() ? it->second : nullptr;
}

LocalController* GlobalController::findControllerFor(const std::string& element_id) const {
    for (const auto& kv : local_controllers) {
        if (kv.second->hasElement(element_id)) return kv.second;
    }
    return nullptr;
}

bool GlobalController::addRApp(RApp* rapp) {
    if (!rapp) return false;
    const std::string& id = rapp->getId();
    if (rapps.count(id)) {
        SLOG_WARN(event_queue->getLog(), A1, "%s: rApp %s already registered", name.c_str(), id.c_str());
        return false;
    }
    rapp->attach(this);
    rapps[id] = rapp;
    return true;
}

bool GlobalController::removeRApp(const std::string& id) {
    auto it = rapps.find(id);
    if (it == rapps.end()) return false;
    it->second->detach();
    rapps.erase(it);
    return true;
}

std::string GlobalController::getPolicyStatus(const std::string& policy_id) const {
    auto it = policy_status.find(policy_id);
    return it != policy_status.end() ? it->second : "";
}

void GlobalController::handleMessage(const Message& msg, const std::string& src) {
    if (msg.type != MSG_A1_POLICY_FEEDBACK) {
        SimObject::handleMessage(msg, src);
        return;
    }
    feedback_received++;
    std::string id = msg.payload.value("policy_id", "");
    std::string status = msg.payload.value("status", "");
    if (!id.empty() && policies.count(id)) {
        policy_status[id] = status;
    }
    if (status == "rejected") {
        SLOG_WARN(event_queue->getLog(), A1, "%s: %s rejected %s: %s", name.c_str(), src.c_str(),
                  id.c_str(), msg.payload.value("reason", "").c_str());
    }
}

json GlobalController::statsJson() const {
    json status = json::object();
    for (const auto& kv : policy_status) status[kv.first] = kv.second;
    return {
        {"local_controllers", local_controllers.size()},
        {"policies", policies.size()},
        {"rapps", rapps.size()},
        {"policies_distributed", policies_distributed},
        {"feedback_received", feedback_received},
        {"policy_status", status}
    };
}
