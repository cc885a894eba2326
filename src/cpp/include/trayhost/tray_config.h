#pragma once

#include "trayhost/popup_menu.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trayhost {

using json = nlohmann::json;

class NativeWindowSystem;

struct TrayMenuItemConfig {
    uint32_t id = 0;
    std::string label;
    std::string event;  // Event emitted when the item is picked, none if empty
    bool separator = false;
    bool checkable = false;
    bool checked = false;
    bool enabled = true;
};

// Tray icon described in JSON, events are plain strings
struct TrayConfig {
    std::string tooltip;
    std::string icon_path;
    std::optional<uint32_t> icon_width;
    std::optional<uint32_t> icon_height;

    std::optional<std::string> click_event;
    std::optional<std::string> double_click_event;
    std::optional<std::string> right_click_event;

    std::vector<TrayMenuItemConfig> menu;

    /**
     * Read a configuration object.
     * @param base_dir directory relative icon paths are resolved against
     * @throws InvalidConfigException on wrong types or invalid menu items
     */
    static TrayConfig from_json(const json& j, const std::string& base_dir = "");

    // @throws FileException, InvalidConfigException
    static TrayConfig load(const std::string& file_path);

    json to_json() const;
};

struct TrayMenu {
    std::unique_ptr<PopupMenu> menu;
    std::map<uint32_t, std::string> events;
};

// Build the native menu of a configuration, null menu if it has no item
TrayMenu build_menu(std::shared_ptr<NativeWindowSystem> system, const TrayConfig& config);

// @throws FileException
std::vector<uint8_t> read_file_bytes(const std::string& file_path);

} // namespace trayhost
