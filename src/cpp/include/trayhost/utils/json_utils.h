#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace trayhost {
namespace utils {

using json = nlohmann::json;

class JsonUtils {
public:
    // Load JSON from file
    static json load_from_file(const std::string& file_path);

    // Parse JSON from string
    static json parse(const std::string& json_str);

    // Check if JSON has key
    static bool has_key(const json& j, const std::string& key);

    // Get value with default, throws InvalidConfigException on a type mismatch
    template<typename T>
    static T get_or_default(const json& j, const std::string& key, const T& default_value) {
        if (!has_key(j, key)) {
            return default_value;
        }
        try {
            return j.at(key).get<T>();
        } catch (const json::exception& e) {
            throw_type_error(key, e.what());
        }
        return default_value;
    }

private:
    [[noreturn]] static void throw_type_error(const std::string& key, const std::string& details);
};

} // namespace utils
} // namespace trayhost
