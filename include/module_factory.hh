// include/module_factory.hh
#ifndef MODULE_FACTORY_HH
#define MODULE_FACTORY_HH

#include "sim_object.hh"
#include "utils/wildcard.hh"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class EventQueue;

using CreateSimObjectFunc = std::function<SimObject*(const std::string&, EventQueue*)>;

/**
 * Element type registry plus the instances built from one scenario.
 *
 * Types are registered once at startup under their scenario "type" name;
 * each factory owns the elements it creates.
 */
class ModuleFactory {
private:
    EventQueue* event_queue;
    std::map<std::string, std::unique_ptr<SimObject>> instances;

    static std::map<std::string, CreateSimObjectFunc>& getObjectRegistry() {
        static std::map<std::string, CreateSimObjectFunc> registry;
        return registry;
    }

public:
    explicit ModuleFactory(EventQueue* eq) : event_queue(eq) {}

    ModuleFactory(const ModuleFactory&) = delete;
    ModuleFactory& operator=(const ModuleFactory&) = delete;

    template<typename T>
    static void registerObject(const std::string& name) {
        static_assert(std::is_base_of_v<SimObject, T>, "T must derive from SimObject");
        auto& registry = getObjectRegistry();
        if (registry.find(name) != registry.end()) {
            DPRINTF(MODULE, "[ModuleFactory] Warning: Object type '%s' already registered.\n", name.c_str());
        }
        registry[name] = [](const std::string& n, EventQueue* eq) -> SimObject* {
            return new T(n, eq);
        };
    }

    static bool unregisterObject(const std::string& name) {
        if (getObjectRegistry().erase(name) == 0) {
            DPRINTF(MODULE, "[ModuleFactory] Attempted to unregister unknown object type: %s\n", name.c_str());
            return false;
        }
        return true;
    }

    static bool isRegistered(const std::string& name) {
        return getObjectRegistry().count(name) > 0;
    }

    static void clearAllObjects() { getObjectRegistry().clear(); }

    static std::vector<std::string> getRegisteredTypes() {
        std::vector<std::string> names;
        for (const auto& kv : getObjectRegistry()) names.push_back(kv.first);
        return names;
    }

    // Registers the built-in element types; safe to call repeatedly.
    static void registerBuiltinTypes();

    // Throws ValidationError for an unknown type or a taken name.
    SimObject* create(const std::string& name, const std::string& type);
    // Builds every entry of an "elements" array; entries may carry "params".
    void instantiateAll(const json& elements);

    SimObject* getInstance(const std::string& name) const {
        auto it = instances.find(name);
        return it != instances.end() ? it->second.get() : nullptr;
    }

    template<typename T>
    T* getInstanceAs(const std::string& name) const {
        return dynamic_cast<T*>(getInstance(name));
    }

    // Instance names matching a '*'/'?' pattern, in name order
    std::vector<std::string> match(const std::string& pattern) const;
    std::vector<std::string> getInstanceNames() const;
    size_t size() const { return instances.size(); }
};

#endif // MODULE_FACTORY_HH
