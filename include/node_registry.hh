// include/node_registry.hh
#ifndef NODE_REGISTRY_HH
#define NODE_REGISTRY_HH

#include "sim_object.hh"
#include <map>
#include <string>
#include <vector>

// Logical id -> node handle. Ordered so iteration is deterministic.
class NodeRegistry {
private:
    std::map<std::string, SimObject*> nodes;

public:
    // false when the id is taken or the handle is null; never overwrites
    bool add(const std::string& id, SimObject* node) {
        if (!node || id.empty()) return false;
        return nodes.emplace(id, node).second;
    }

    bool remove(const std::string& id) {
        return nodes.erase(id) > 0;
    }

    SimObject* find(const std::string& id) const {
        auto it = nodes.find(id);
        return it != nodes.end() ? it->second : nullptr;
    }

    bool contains(const std::string& id) const {
        return nodes.find(id) != nodes.end();
    }

    // Copy of the current entries, safe to iterate while handlers mutate
    std::vector<std::pair<std::string, SimObject*>> snapshot() const {
        return {nodes.begin(), nodes.end()};
    }

    std::vector<std::string> ids() const {
        std::vector<std::string> out;
        out.reserve(nodes.size());
        for (const auto& kv : nodes) out.push_back(kv.first);
        return out;
    }

    std::vector<SimObject*> ofClass(ElementClass c) const {
        std::vector<SimObject*> out;
        for (const auto& kv : nodes) {
            if (kv.second->getElementClass() == c) out.push_back(kv.second);
        }
        return out;
    }

    size_t size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }
    void clear() { nodes.clear(); }

    const std::map<std::string, SimObject*>& all() const { return nodes; }
};

#endif // NODE_REGISTRY_HH
