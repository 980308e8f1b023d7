// include/config_loader.hh
#ifndef CONFIG_LOADER_HH
#define CONFIG_LOADER_HH

#include "sim_errors.hh"
#include "utils/json_includer.hh"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

/**
 * Loads a scenario file, resolving "include" directives relative to it.
 * @param filename scenario path
 * @return merged JSON document
 * @throws SimError when the file cannot be read or parsed
 */
inline json loadConfig(const std::string& filename) {
    try {
        return JsonIncluder::loadAndInclude(filename);
    } catch (const json::parse_error& e) {
        throw SimError("JSON parse error in " + filename + " at byte " +
                       std::to_string(e.byte) + ": " + e.what());
    } catch (const json::exception& e) {
        throw SimError("Failed to load config " + filename + ": " + e.what());
    }
}

#endif // CONFIG_LOADER_HH
