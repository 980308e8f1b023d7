// src/core/local_controller.cc
#include "modules/local_controller.hh"
#include "apps/xapp.hh"
#include "sim_errors.hh"

LocalController::LocalController(const std::string& n, EventQueue* eq,
                                 P2PChannel* a1_ch, P2PChannel* e2_ch, PubSubChannel* ind_ch)
    : SimObject(n, ElementClass::LocalController, eq),
      a1(a1_ch), e2(e2_ch), indications(ind_ch) {
    if (!a1 || !e2 || !indications) {
        throw ValidationError("LocalController " + n + ": missing channel");
    }
    if (!a1->registerNode(name, this)) {
        throw ValidationError("LocalController " + n + ": name already taken on " + a1->getName());
    }
    if (!e2->registerNode(name, this)) {
        a1->unregisterNode(name);
        throw ValidationError("LocalController " + n + ": name already taken on " + e2->getName());
    }
}

// Only channel registrations are withdrawn; elements and xApps may
// already be gone.
LocalController::~LocalController() {
    stopPeriodicEnforcement();
    for (const auto& kv : xapps) indications->unsubscribe(kv.first);
    for (const auto& kv : elements) e2->unregisterNode(kv.first);
    e2->unregisterNode(name);
    a1->unregisterNode(name);
}

bool LocalController::registerElement(const std::string& id, SimObject* element) {
    SimLog& log = event_queue->getLog();
    if (!element || id.empty()) {
        SLOG_ERROR(log, RIC, "%s: invalid element registration '%s'", name.c_str(), id.c_str());
        return false;
    }
    if (!isManagedClass(element->getElementClass())) {
        SLOG_ERROR(log, RIC, "%s: %s has class %s, not a managed element", name.c_str(),
                   id.c_str(), element->getClassName());
        return false;
    }
    if (elements.count(id)) {
        SLOG_WARN(log, RIC, "%s: element %s already managed", name.c_str(), id.c_str());
        return false;
    }
    const std::string& owner = element->getPeer("e2");
    if (!owner.empty() && owner != name) {
        SLOG_ERROR(log, RIC, "%s: element %s already managed by %s", name.c_str(),
                   id.c_str(), owner.c_str());
        return false;
    }

    if (!e2->registerNode(id, element)) {
        SLOG_ERROR(log, RIC, "%s: id %s is already taken on %s", name.c_str(), id.c_str(),
                   e2->getName().c_str());
        return false;
    }
    element->bindChannel("e2", e2, name);
    elements[id] = element;
    SLOG_INFO(log, RIC, "%s: managing %s %s", name.c_str(), element->getClassName(), id.c_str());
    return true;
}

bool LocalController::removeElement(const std::string& id) {
    auto it = elements.find(id);
    if (it == elements.end()) {
        SLOG_WARN(event_queue->getLog(), RIC, "%s: element %s not managed", name.c_str(), id.c_str());
        return false;
    }
    it->second->unbindChannel("e2");
    e2->unregisterNode(id);
    elements.erase(it);
    return true;
}

SimObject* LocalController::findElement(const std::string& id) const {
    auto it = elements.find(id);
    return it != elements.end() ? it->second : nullptr;
}

std::vector<std::string> LocalController::getElementIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : elements) ids.push_back(kv.first);
    return ids;
}

void LocalController::sendFeedback(const std::string& to, const std::string& policy_id,
                                   bool accepted, const std::string& reason) {
    if (to.empty() || !a1->isRegistered(to)) return;
    json fb = {
        {"policy_id", policy_id},
        {"status", accepted ? "accepted" : "rejected"},
        {"reason", reason}
    };
    a1->send(Message(MSG_A1_POLICY_FEEDBACK, fb), name, to);
}

bool LocalController::receivePolicy(const json& policy, const std::string& sender) {
    policies_received++;
    std::string id;
    if (policy.is_object() && policy.contains("policy_id") && policy["policy_id"].is_string()) {
        id = policy["policy_id"].get<std::string>();
    }

    Policy parsed;
    try {
        parsed = Policy::fromJson(policy);
    } catch (const ValidationError& e) {
        policies_rejected++;
        SLOG_ERROR(event_queue->getLog(), RIC, "%s: rejected policy '%s': %s",
                   name.c_str(), id.c_str(), e.what());
        sendFeedback(sender, id, false, e.what());
        return false;
    }

    if (policies.count(parsed.policy_id)) {
        SLOG_INFO(event_queue->getLog(), RIC, "%s: replacing policy %s with v%u",
                  name.c_str(), parsed.policy_id.c_str(), parsed.version);
    }
    policies[parsed.policy_id] = parsed;
    SLOG_INFO(event_queue->getLog(), RIC, "%s: stored policy %s (%s -> %s)", name.c_str(),
              parsed.policy_id.c_str(), policyTypeName(parsed.policy_type),
              elementClassName(parsed.target));
    sendFeedback(sender, parsed.policy_id, true, "");
    return true;
}

bool LocalController::removePolicy(const std::string& policy_id) {
    return policies.erase(policy_id) > 0;
}

const Policy* LocalController::getPolicy(const std::string& policy_id) const {
    auto it = policies.find(policy_id);
    return it != policies.end() ? &it->second : nullptr;
}

size_t LocalController::enforcePolicies() {
    size_t sent = 0;
    for (const auto& [pid, policy] : policies) {
        json body = policy.toJson();
        for (const auto& [eid, element] : elements) {
            if (element->getElementClass() != policy.target) continue;
            try {
                e2->send(Message(MSG_A1_POLICY_ENFORCE, body), name, eid);
                sent++;
            } catch (const AddressError& e) {
                SLOG_ERROR(event_queue->getLog(), RIC, "%s: cannot enforce %s on %s: %s",
                           name.c_str(), pid.c_str(), eid.c_str(), e.what());
            }
        }
    }
    enforcements_sent += sent;
    SLOG_DEBUG(event_queue->getLog(), RIC, "%s: enforcement sweep sent %zu", name.c_str(), sent);
    return sent;
}

void LocalController::startPeriodicEnforcement(SimTime period) {
    stopPeriodicEnforcement();
    enforcement = std::make_unique<Process>(event_queue, period,
        [this](SimTime) { enforcePolicies(); }, "enforce:" + name);
    enforcement->start();
}

void LocalController::stopPeriodicEnforcement() {
    if (enforcement) enforcement->stop();
}

bool LocalController::addObserver(const std::string& id, PubSubChannel::Callback cb) {
    return indications->subscribe(id, std::move(cb));
}

bool LocalController::removeObserver(const std::string& id) {
    return indications->unsubscribe(id);
}

bool LocalController::addXApp(XApp* xapp) {
    if (!xapp) return false;
    const std::string& id = xapp->getId();
    if (xapps.count(id)) {
        SLOG_WARN(event_queue->getLog(), RIC, "%s: xApp %s already registered", name.c_str(), id.c_str());
        return false;
    }
    if (!addObserver(id, [xapp](const Message& msg, const std::string& origin) {
            xapp->onIndication(msg, origin);
        })) {
        return false;
    }
    xapp->attach(this);
    xapps[id] = xapp;
    SLOG_INFO(event_queue->getLog(), RIC, "%s: xApp %s registered", name.c_str(), id.c_str());
    return true;
}

bool LocalController::removeXApp(const std::string& id) {
    auto it = xapps.find(id);
    if (it == xapps.end()) return false;
    removeObserver(id);
    it->second->detach();
    xapps.erase(it);
    return true;
}

void LocalController::sendControl(Message msg, const std::string& element_id) {
    if (!elements.count(element_id)) {
        throw AddressError(name + ": element " + element_id + " not managed");
    }
    msg.type = MSG_CONTROL;
    e2->send(std::move(msg), name, element_id);
    controls_sent++;
}

void LocalController::handleMessage(const Message& msg, const std::string& src) {
    if (msg.isPolicy()) {
        receivePolicy(msg.payload, src);
    } else if (msg.isIndication()) {
        indications_routed++;
        indications->publish(msg, src);
    } else {
        SimObject::handleMessage(msg, src);
    }
}

json LocalController::statsJson() const {
    return {
        {"elements", elements.size()},
        {"policies", policies.size()},
        {"xapps", xapps.size()},
        {"policies_received", policies_received},
        {"policies_rejected", policies_rejected},
        {"enforcements_sent", enforcements_sent},
        {"indications_routed", indications_routed},
        {"controls_sent", controls_sent}
    };
}
