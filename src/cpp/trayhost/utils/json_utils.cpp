#include "trayhost/utils/json_utils.h"
#include "trayhost/error_types.h"
#include <fstream>

namespace trayhost {
namespace utils {

json JsonUtils::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FileException(file_path, "failed to open file");
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw InvalidConfigException("failed to parse JSON from file " + file_path + ": " + e.what());
    }

    return j;
}

json JsonUtils::parse(const std::string& json_str) {
    try {
        return json::parse(json_str);
    } catch (const json::exception& e) {
        throw InvalidConfigException(std::string("failed to parse JSON string: ") + e.what());
    }
}

bool JsonUtils::has_key(const json& j, const std::string& key) {
    return j.is_object() && j.contains(key) && !j[key].is_null();
}

void JsonUtils::throw_type_error(const std::string& key, const std::string& details) {
    throw InvalidConfigException("key '" + key + "' has the wrong type: " + details);
}

} // namespace utils
} // namespace trayhost
