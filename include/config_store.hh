// include/config_store.hh
#ifndef CONFIG_STORE_HH
#define CONFIG_STORE_HH

#include "sim_object.hh"
#include <map>
#include <string>
#include <vector>

class P2PChannel;
class NodeRegistry;

enum class ConfigStatus {
    Applied,
    RolledBack,
    Committed
};

const char* configStatusName(ConfigStatus s);

/**
 * O1 configuration store.
 *
 * Every stored node config is validated, merged into the node's current
 * config and appended to its history; versions index that history.
 * Configs reach nodes either directly (applyConfig) or as O1_CONFIG
 * messages over a channel (pushConfig).
 */
class ConfigStore {
public:
    struct NodeStatus {
        ConfigStatus status = ConfigStatus::Applied;
        size_t version = 0;
    };

private:
    SimLog* log;
    std::map<std::string, json> current;
    std::map<std::string, std::vector<json>> history;
    std::map<std::string, NodeStatus> status;
    uint64_t rejected = 0;
    uint64_t apply_errors = 0;

public:
    explicit ConfigStore(SimLog* l) : log(l) {}

    // Throws ValidationError naming the offending field.
    static void validate(const json& config);

    // Invalid entries are logged and skipped; returns the number stored.
    size_t loadNodes(const json& nodes);
    // Throws ValidationError for an invalid config.
    void storeConfig(const json& config);

    bool hasConfig(const std::string& node_id) const { return current.count(node_id) > 0; }
    // Throws AddressError for an unknown node.
    const json& getConfig(const std::string& node_id) const;
    std::vector<std::string> getNodeIds() const;

    // Errors are logged and counted, never thrown.
    bool applyConfig(SimObject* node, const std::string& node_id);
    size_t applyConfigs(const NodeRegistry& nodes);
    // Queues an O1_CONFIG message from src to node_id; throws AddressError.
    void pushConfig(P2PChannel* channel, const std::string& src, const std::string& node_id);

    // Without a version rolls back to the previous one. Throws AddressError
    // for an unknown node and ValidationError for a bad version.
    void rollbackConfig(const std::string& node_id, int version = -1);
    void commitConfig(const std::string& node_id);
    const NodeStatus& getStatus(const std::string& node_id) const;
    size_t historySize(const std::string& node_id) const;

    uint64_t getRejectedCount() const { return rejected; }
    uint64_t getApplyErrorCount() const { return apply_errors; }
};

#endif // CONFIG_STORE_HH
