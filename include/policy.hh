// include/policy.hh
#ifndef POLICY_HH
#define POLICY_HH

#include "sim_object.hh"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

enum class PolicyType {
    Type1,   // "POLICY-TYPE-1"
    Type2,   // "POLICY-TYPE-2"
    Type3    // "POLICY-TYPE-3"
};

const char* policyTypeName(PolicyType t);
bool parsePolicyType(const std::string& s, PolicyType& out);

/**
 * Versioned, targeted directive authored by a global controller.
 *
 * Crosses controller boundaries only as JSON (toJson/fromJson), so every
 * holder owns an independent value.
 */
struct Policy {
    std::string policy_id;
    PolicyType policy_type = PolicyType::Type1;
    json content = json::object();
    unsigned version = 1;
    ElementClass target = ElementClass::DistributedUnit;

    json toJson() const;

    // Throws ValidationError naming the first offending field.
    static Policy fromJson(const json& j);
};

#endif // POLICY_HH
