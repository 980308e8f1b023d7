// src/core/sim_object.cc
#include "sim_object.hh"
#include "sim_errors.hh"
#include "channels/p2p_channel.hh"

namespace {
struct ClassName {
    ElementClass cls;
    const char* name;
};

const ClassName kClassNames[] = {
    {ElementClass::RadioUnit,        "o_ru"},
    {ElementClass::DistributedUnit,  "o_du"},
    {ElementClass::CuControlPlane,   "o_cu_cp"},
    {ElementClass::CuUserPlane,      "o_cu_up"},
    {ElementClass::UserTerminal,     "ue"},
    {ElementClass::LocalController,  "near_rt_ric"},
    {ElementClass::GlobalController, "non_rt_ric"},
};

const std::string kNoPeer;
}

const char* elementClassName(ElementClass c) {
    for (const auto& e : kClassNames) {
        if (e.cls == c) return e.name;
    }
    return "unknown";
}

bool parseElementClass(const std::string& s, ElementClass& out) {
    for (const auto& e : kClassNames) {
        if (s == e.name) {
            out = e.cls;
            return true;
        }
    }
    return false;
}

bool isManagedClass(ElementClass c) {
    switch (c) {
        case ElementClass::RadioUnit:
        case ElementClass::DistributedUnit:
        case ElementClass::CuControlPlane:
        case ElementClass::CuUserPlane:
            return true;
        default:
            return false;
    }
}

void SimObject::receive(const Message& msg, const std::string& src) {
    received_by_type[msg.type]++;
    if (msg.isEnforcement()) {
        applyPolicy(msg.payload);
    } else if (msg.isConfig()) {
        applyConfig(msg.payload);
    } else {
        handleMessage(msg, src);
    }
}

void SimObject::handleMessage(const Message& msg, const std::string& src) {
    DPRINTF(NODE, "[%s] ignoring %s from %s\n", name.c_str(), msg.type.c_str(), src.c_str());
}

void SimObject::mergeParams(const json& obj, bool allow_new) {
    if (!obj.is_object()) return;
    for (auto& [key, value] : obj.items()) {
        if (allow_new || params.contains(key)) {
            params[key] = value;
        }
    }
}

void SimObject::applyPolicy(const json& policy) {
    std::string id = policy.value("policy_id", "");
    auto& rec = applied_policies[id];
    rec.version = policy.value("version", 1u);
    rec.applied_at = getCurrentTime();
    rec.times++;
    policy_apply_count++;

    // Later applications overwrite earlier ones key by key
    if (policy.contains("policy_content")) {
        mergeParams(policy["policy_content"], false);
    }
    SLOG_DEBUG(event_queue->getLog(), NODE, "%s %s applied policy %s v%u",
               getClassName(), name.c_str(), id.c_str(), rec.version);
}

void SimObject::applyConfig(const json& config) {
    config_apply_count++;
    mergeParams(config, false);
    SLOG_DEBUG(event_queue->getLog(), NODE, "%s %s configured via O1",
               getClassName(), name.c_str());
}

void SimObject::bindChannel(const std::string& label, P2PChannel* ch, const std::string& peer) {
    channels[label] = ch;
    if (!peer.empty()) {
        default_peers[label] = peer;
    } else {
        default_peers.erase(label);
    }
}

void SimObject::unbindChannel(const std::string& label) {
    channels.erase(label);
    default_peers.erase(label);
}

P2PChannel* SimObject::getChannel(const std::string& label) const {
    auto it = channels.find(label);
    return it != channels.end() ? it->second : nullptr;
}

const std::string& SimObject::getPeer(const std::string& label) const {
    auto it = default_peers.find(label);
    return it != default_peers.end() ? it->second : kNoPeer;
}

void SimObject::sendOn(const std::string& label, Message msg, const std::string& dst) {
    P2PChannel* ch = getChannel(label);
    if (!ch) {
        throw AddressError(name + ": no channel bound as '" + label + "'");
    }
    const std::string& target = dst.empty() ? getPeer(label) : dst;
    if (target.empty()) {
        throw AddressError(name + ": no destination for channel '" + label + "'");
    }
    ch->send(std::move(msg), name, target);
}

uint64_t SimObject::getReceivedCount(const std::string& type) const {
    auto it = received_by_type.find(type);
    return it != received_by_type.end() ? it->second : 0;
}

uint64_t SimObject::getReceivedCount() const {
    uint64_t total = 0;
    for (const auto& kv : received_by_type) total += kv.second;
    return total;
}
