// include/utils/json_includer.hh
#ifndef JSON_INCLUDER_HH
#define JSON_INCLUDER_HH

#include "../sim_errors.hh"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;

// Expands {"include": "file.json"} objects. Keys already present in the
// including object win over included ones; paths are relative to the
// including file.
class JsonIncluder {
private:
    static constexpr int kMaxDepth = 16;

    static std::string dirOf(const std::string& path) {
        size_t pos = path.find_last_of("/\\");
        return pos == std::string::npos ? "" : path.substr(0, pos + 1);
    }

    static json loadFile(const std::string& filename, int depth) {
        if (depth > kMaxDepth) {
            throw SimError("Include depth exceeded at " + filename);
        }
        std::ifstream f(filename);
        if (!f.is_open()) {
            throw SimError("Cannot open config file: " + filename);
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        json root = json::parse(buffer.str());
        processIncludes(root, dirOf(filename), depth);
        return root;
    }

    static void processIncludes(json& node, const std::string& base_dir, int depth) {
        if (node.is_object()) {
            if (node.contains("include")) {
                if (!node["include"].is_string()) {
                    throw SimError("\"include\" must name a file");
                }
                json included = loadFile(base_dir + node["include"].get<std::string>(), depth + 1);
                if (included.is_object()) {
                    for (auto& [key, value] : included.items()) {
                        if (!node.contains(key)) node[key] = value;
                    }
                }
                node.erase("include");
            }
            for (auto& [key, value] : node.items()) {
                processIncludes(value, base_dir, depth);
            }
        } else if (node.is_array()) {
            for (auto& item : node) {
                processIncludes(item, base_dir, depth);
            }
        }
    }

public:
    static json loadAndInclude(const std::string& filename) {
        return loadFile(filename, 0);
    }

    // For documents already in memory; includes resolve against base_dir.
    static json resolve(json doc, const std::string& base_dir = "") {
        processIncludes(doc, base_dir, 0);
        return doc;
    }
};

#endif // JSON_INCLUDER_HH
