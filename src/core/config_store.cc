// src/core/config_store.cc
#include "config_store.hh"
#include "node_registry.hh"
#include "channels/p2p_channel.hh"
#include "sim_errors.hh"

#include <limits>

namespace {
const char* const kNodeTypes[] = {
    "o-ru", "o-du", "o-cu-cp", "o-cu-up", "near-rt-ric", "non-rt-ric"
};

void checkRange(const json& config, const char* key, double lo, double hi) {
    if (!config.contains(key)) return;
    const json& v = config[key];
    if (!v.is_number()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    double d = v.get<double>();
    if (d < lo || d > hi) {
        throw ValidationError(std::string(key) + " out of range");
    }
}
}

const char* configStatusName(ConfigStatus s) {
    switch (s) {
        case ConfigStatus::Applied: return "applied";
        case ConfigStatus::RolledBack: return "rolled_back";
        case ConfigStatus::Committed: return "committed";
    }
    return "unknown";
}

void ConfigStore::validate(const json& config) {
    if (!config.is_object()) {
        throw ValidationError("node config must be an object");
    }
    if (!config.contains("node_id") || !config["node_id"].is_string() ||
        config["node_id"].get<std::string>().empty()) {
        throw ValidationError("node_id must be a non-empty string");
    }
    if (config.contains("node_type")) {
        const json& t = config["node_type"];
        bool known = false;
        if (t.is_string()) {
            for (const char* name : kNodeTypes) {
                if (t.get<std::string>() == name) known = true;
            }
        }
        if (!known) throw ValidationError("unknown node_type");
    }
    checkRange(config, "frequency", 0.0, std::numeric_limits<double>::max());
    checkRange(config, "bandwidth", 0.0, std::numeric_limits<double>::max());
    checkRange(config, "tx_power", -30.0, 50.0);
    if (config.contains("max_ues")) {
        const json& m = config["max_ues"];
        if (!m.is_number_integer() || m.get<int64_t>() < 0) {
            throw ValidationError("max_ues must be a non-negative integer");
        }
    }
    if (config.contains("cells")) {
        if (!config["cells"].is_array()) throw ValidationError("cells must be an array");
        for (const auto& cell : config["cells"]) {
            if (!cell.is_object() || !cell.contains("cell_id") || !cell["cell_id"].is_string()) {
                throw ValidationError("every cell needs a cell_id");
            }
        }
    }
}

size_t ConfigStore::loadNodes(const json& nodes) {
    if (!nodes.is_array()) {
        SLOG_ERROR(*log, O1, "node configs must be an array");
        return 0;
    }
    size_t stored = 0;
    for (const auto& cfg : nodes) {
        try {
            storeConfig(cfg);
            stored++;
        } catch (const ValidationError& e) {
            rejected++;
            SLOG_ERROR(*log, O1, "invalid node config: %s", e.what());
        }
    }
    return stored;
}

void ConfigStore::storeConfig(const json& config) {
    validate(config);
    std::string id = config["node_id"].get<std::string>();

    json& cur = current[id];
    if (!cur.is_object()) cur = json::object();
    for (auto& [key, value] : config.items()) {
        cur[key] = value;
    }

    auto& hist = history[id];
    hist.push_back(config);
    status[id] = {ConfigStatus::Applied, hist.size() - 1};
    SLOG_DEBUG(*log, O1, "stored config for %s (version %zu)", id.c_str(), hist.size() - 1);
}

const json& ConfigStore::getConfig(const std::string& node_id) const {
    auto it = current.find(node_id);
    if (it == current.end()) {
        throw AddressError("no configuration for node " + node_id);
    }
    return it->second;
}

std::vector<std::string> ConfigStore::getNodeIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : current) ids.push_back(kv.first);
    return ids;
}

bool ConfigStore::applyConfig(SimObject* node, const std::string& node_id) {
    try {
        if (!node) throw AddressError("node " + node_id + " has no handle");
        node->applyConfig(getConfig(node_id));
        SLOG_INFO(*log, O1, "applied config to %s", node_id.c_str());
        return true;
    } catch (const std::exception& e) {
        apply_errors++;
        SLOG_ERROR(*log, O1, "failed to apply config to %s: %s", node_id.c_str(), e.what());
        return false;
    }
}

size_t ConfigStore::applyConfigs(const NodeRegistry& nodes) {
    size_t applied = 0;
    for (const auto& [id, node] : nodes.snapshot()) {
        if (!hasConfig(id)) continue;
        if (applyConfig(node, id)) applied++;
    }
    return applied;
}

void ConfigStore::pushConfig(P2PChannel* channel, const std::string& src, const std::string& node_id) {
    if (!channel) {
        throw AddressError("no channel to push config for " + node_id);
    }
    channel->send(Message(MSG_O1_CONFIG, getConfig(node_id)), src, node_id);
}

void ConfigStore::rollbackConfig(const std::string& node_id, int version) {
    auto it = history.find(node_id);
    if (it == history.end()) {
        throw AddressError("no configuration history for node " + node_id);
    }
    const auto& hist = it->second;
    if (version < 0) {
        if (hist.size() < 2) {
            throw ValidationError("no previous configuration for node " + node_id);
        }
        version = static_cast<int>(hist.size()) - 2;
    } else if (static_cast<size_t>(version) >= hist.size()) {
        throw ValidationError("invalid version " + std::to_string(version) + " for node " + node_id);
    }
    current[node_id] = hist[version];
    status[node_id] = {ConfigStatus::RolledBack, static_cast<size_t>(version)};
    SLOG_INFO(*log, O1, "config for %s rolled back to version %d", node_id.c_str(), version);
}

void ConfigStore::commitConfig(const std::string& node_id) {
    auto it = status.find(node_id);
    if (it == status.end()) {
        throw AddressError("cannot commit, no configuration for node " + node_id);
    }
    it->second.status = ConfigStatus::Committed;
    SLOG_INFO(*log, O1, "config for %s committed", node_id.c_str());
}

const ConfigStore::NodeStatus& ConfigStore::getStatus(const std::string& node_id) const {
    auto it = status.find(node_id);
    if (it == status.end()) {
        throw AddressError("no configuration status for node " + node_id);
    }
    return it->second;
}

size_t ConfigStore::historySize(const std::string& node_id) const {
    auto it = history.find(node_id);
    return it != history.end() ? it->second.size() : 0;
}
