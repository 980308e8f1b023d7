// src/core/policy.cc
#include "policy.hh"
#include "sim_errors.hh"

const char* policyTypeName(PolicyType t) {
    switch (t) {
        case PolicyType::Type1: return "POLICY-TYPE-1";
        case PolicyType::Type2: return "POLICY-TYPE-2";
        case PolicyType::Type3: return "POLICY-TYPE-3";
    }
    return "UNKNOWN";
}

bool parsePolicyType(const std::string& s, PolicyType& out) {
    if (s == "POLICY-TYPE-1") out = PolicyType::Type1;
    else if (s == "POLICY-TYPE-2") out = PolicyType::Type2;
    else if (s == "POLICY-TYPE-3") out = PolicyType::Type3;
    else return false;
    return true;
}

json Policy::toJson() const {
    return {
        {"policy_id", policy_id},
        {"policy_type", policyTypeName(policy_type)},
        {"policy_content", content},
        {"version", version},
        {"target", elementClassName(target)}
    };
}

Policy Policy::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("policy must be an object");
    }

    Policy p;
    if (!j.contains("policy_id") || !j["policy_id"].is_string() ||
        j["policy_id"].get<std::string>().empty()) {
        throw ValidationError("policy_id must be a non-empty string");
    }
    p.policy_id = j["policy_id"].get<std::string>();

    if (!j.contains("policy_type") || !j["policy_type"].is_string() ||
        !parsePolicyType(j["policy_type"].get<std::string>(), p.policy_type)) {
        throw ValidationError("policy " + p.policy_id + ": unknown policy_type");
    }

    if (!j.contains("target") || !j["target"].is_string()) {
        throw ValidationError("policy " + p.policy_id + ": missing target");
    }
    std::string target = j["target"].get<std::string>();
    if (!parseElementClass(target, p.target) || !isManagedClass(p.target)) {
        throw ValidationError("policy " + p.policy_id + ": invalid target '" + target +
                              "', must be one of o_ru, o_du, o_cu_cp, o_cu_up");
    }

    if (!j.contains("policy_content") || !j["policy_content"].is_object()) {
        throw ValidationError("policy " + p.policy_id + ": policy_content must be an object");
    }
    p.content = j["policy_content"];

    if (j.contains("version")) {
        if (!j["version"].is_number_integer() || j["version"].get<int64_t>() <= 0) {
            throw ValidationError("policy " + p.policy_id + ": version must be a positive integer");
        }
        p.version = j["version"].get<unsigned>();
    }
    return p;
}
