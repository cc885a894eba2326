#include "trayhost/tray_config.h"
#include "trayhost/error_types.h"
#include "trayhost/utils/json_utils.h"
#include "trayhost/utils/logging.h"
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <set>

namespace fs = std::filesystem;

namespace trayhost {

namespace {
    // WM_COMMAND carries the item id in a 16-bit word
    constexpr uint32_t MAX_MENU_ID = 0xFFFF;

    using utils::JsonUtils;

    std::optional<std::string> optional_string(const json& j, const std::string& key) {
        if (!JsonUtils::has_key(j, key)) {
            return std::nullopt;
        }
        return JsonUtils::get_or_default<std::string>(j, key, "");
    }

    // nlohmann converts booleans and floats to integers, those are type errors here
    int64_t integer_value(const json& j, const std::string& key, const std::string& where) {
        const json& value = j.at(key);
        if (!value.is_number_integer()) {
            throw InvalidConfigException(where + "'" + key + "' must be an integer, got " + value.type_name());
        }
        if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
            throw InvalidConfigException(where + "'" + key + "' is out of range");
        }
        return value.get<int64_t>();
    }

    std::optional<uint32_t> optional_dimension(const json& j, const std::string& key) {
        if (!JsonUtils::has_key(j, key)) {
            return std::nullopt;
        }
        int64_t value = integer_value(j, key, "");
        if (value <= 0 || value > 256) {
            throw InvalidConfigException("'" + key + "' must be between 1 and 256");
        }
        return static_cast<uint32_t>(value);
    }

    TrayMenuItemConfig parse_menu_item(const json& j, size_t index) {
        std::string where = "menu item " + std::to_string(index);
        if (!j.is_object()) {
            throw InvalidConfigException(where + " must be an object");
        }

        TrayMenuItemConfig item;
        item.separator = JsonUtils::get_or_default<bool>(j, "separator", false);
        if (item.separator) {
            return item;
        }

        if (!JsonUtils::has_key(j, "id") || !JsonUtils::has_key(j, "label")) {
            throw InvalidConfigException(where + " needs an 'id' and a 'label'");
        }
        int64_t id = integer_value(j, "id", where + " ");
        if (id < 1 || id > MAX_MENU_ID) {
            throw InvalidConfigException(where + " has id " + std::to_string(id) +
                                         ", expected 1 to " + std::to_string(MAX_MENU_ID));
        }

        item.id = static_cast<uint32_t>(id);
        item.label = JsonUtils::get_or_default<std::string>(j, "label", "");
        item.event = JsonUtils::get_or_default<std::string>(j, "event", "");
        item.checkable = JsonUtils::get_or_default<bool>(j, "checkable", false);
        item.checked = JsonUtils::get_or_default<bool>(j, "checked", false);
        item.enabled = JsonUtils::get_or_default<bool>(j, "enabled", true);

        if (item.checked && !item.checkable) {
            item.checkable = true;
        }

        return item;
    }
}

TrayConfig TrayConfig::from_json(const json& j, const std::string& base_dir) {
    if (!j.is_object()) {
        throw InvalidConfigException("tray configuration must be a JSON object");
    }

    TrayConfig config;
    config.tooltip = JsonUtils::get_or_default<std::string>(j, "tooltip", "");
    config.icon_path = JsonUtils::get_or_default<std::string>(j, "icon", "");
    if (!config.icon_path.empty() && !base_dir.empty() && fs::path(config.icon_path).is_relative()) {
        config.icon_path = (fs::path(base_dir) / config.icon_path).string();
    }
    config.icon_width = optional_dimension(j, "icon_width");
    config.icon_height = optional_dimension(j, "icon_height");

    config.click_event = optional_string(j, "click");
    config.double_click_event = optional_string(j, "double_click");
    config.right_click_event = optional_string(j, "right_click");

    if (JsonUtils::has_key(j, "menu")) {
        const json& menu = j.at("menu");
        if (!menu.is_array()) {
            throw InvalidConfigException("'menu' must be an array");
        }

        std::set<uint32_t> ids;
        for (size_t i = 0; i < menu.size(); i++) {
            TrayMenuItemConfig item = parse_menu_item(menu[i], i);
            if (!item.separator && !ids.insert(item.id).second) {
                throw InvalidConfigException("menu item id " + std::to_string(item.id) + " is used twice");
            }
            config.menu.push_back(item);
        }
    }

    return config;
}

TrayConfig TrayConfig::load(const std::string& file_path) {
    json j = JsonUtils::load_from_file(file_path);
    return from_json(j, fs::path(file_path).parent_path().string());
}

json TrayConfig::to_json() const {
    json j = {
        {"tooltip", tooltip},
        {"icon", icon_path}
    };
    if (icon_width) j["icon_width"] = *icon_width;
    if (icon_height) j["icon_height"] = *icon_height;
    if (click_event) j["click"] = *click_event;
    if (double_click_event) j["double_click"] = *double_click_event;
    if (right_click_event) j["right_click"] = *right_click_event;

    json items = json::array();
    for (const TrayMenuItemConfig& item : menu) {
        if (item.separator) {
            items.push_back(json{{"separator", true}});
            continue;
        }
        json entry = {
            {"id", item.id},
            {"label", item.label},
            {"enabled", item.enabled}
        };
        if (!item.event.empty()) entry["event"] = item.event;
        if (item.checkable) {
            entry["checkable"] = true;
            entry["checked"] = item.checked;
        }
        items.push_back(entry);
    }
    j["menu"] = items;

    return j;
}

TrayMenu build_menu(std::shared_ptr<NativeWindowSystem> system, const TrayConfig& config) {
    TrayMenu result;
    if (config.menu.empty()) {
        return result;
    }

    result.menu = PopupMenu::create(std::move(system));
    for (const TrayMenuItemConfig& item : config.menu) {
        if (item.separator) {
            result.menu->add_separator();
        } else if (item.checkable) {
            result.menu->add_checkable_item(item.id, item.label, item.checked, item.enabled);
        } else {
            result.menu->add_item(item.id, item.label, item.enabled);
        }

        if (!item.separator && !item.event.empty()) {
            result.events[item.id] = item.event;
        }
    }

    TRAYHOST_LOG_DEBUG("Built menu with " << result.menu->item_count() << " items");
    return result;
}

std::vector<uint8_t> read_file_bytes(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw FileException(file_path, "failed to open file");
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FileException(file_path, "read error");
    }
    return bytes;
}

} // namespace trayhost
