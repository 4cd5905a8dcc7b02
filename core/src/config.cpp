#include "config.hpp"

#include <fstream>

namespace core {
namespace config {

    json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException("Failed to open config file: " + path);
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException("Failed to parse config file '" + path + "': " + e.what());
        }
    }

} // namespace config
} // namespace core
