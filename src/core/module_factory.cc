// src/core/module_factory.cc
#include "module_factory.hh"
#include "modules.hh"
#include "sim_errors.hh"

void ModuleFactory::registerBuiltinTypes() {
    if (isRegistered("o_du")) return;
    REGISTER_ELEMENTS
}

SimObject* ModuleFactory::create(const std::string& name, const std::string& type) {
    if (name.empty()) {
        throw ValidationError("element of type '" + type + "' has no name");
    }
    if (instances.count(name)) {
        throw ValidationError("duplicate element name: " + name);
    }
    auto& registry = getObjectRegistry();
    auto it = registry.find(type);
    if (it == registry.end()) {
        throw ValidationError("unknown or unregistered element type: " + type);
    }
    SimObject* obj = it->second(name, event_queue);
    instances.emplace(name, std::unique_ptr<SimObject>(obj));
    DPRINTF(MODULE, "[MODULE] Created %s (%s)\n", name.c_str(), type.c_str());
    return obj;
}

void ModuleFactory::instantiateAll(const json& elements) {
    if (elements.is_null()) return;
    if (!elements.is_array()) {
        throw ValidationError("\"elements\" must be an array");
    }
    for (const auto& el : elements) {
        if (!el.is_object() || !el.contains("name") || !el.contains("type") ||
            !el["name"].is_string() || !el["type"].is_string()) {
            throw ValidationError("every element needs string \"name\" and \"type\"");
        }
        SimObject* obj = create(el["name"].get<std::string>(), el["type"].get<std::string>());
        if (el.contains("params")) {
            obj->setParams(el["params"]);
        }
    }
}

std::vector<std::string> ModuleFactory::match(const std::string& pattern) const {
    std::vector<std::string> out;
    for (const auto& kv : instances) {
        if (Wildcard::match(pattern, kv.first)) out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> ModuleFactory::getInstanceNames() const {
    std::vector<std::string> out;
    for (const auto& kv : instances) out.push_back(kv.first);
    return out;
}
