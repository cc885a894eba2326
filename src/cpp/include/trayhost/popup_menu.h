#pragma once

#include "trayhost/platform/native_types.h"
#include <memory>
#include <string>
#include <vector>

namespace trayhost {

class NativeWindowSystem;

/**
 * Owns a native popup menu. Item ids are what WM_COMMAND reports back
 * to the tray window when the user picks an item.
 */
class PopupMenu {
public:
    // @throws OsErrorException if the menu cannot be created
    static std::unique_ptr<PopupMenu> create(std::shared_ptr<NativeWindowSystem> system);

    ~PopupMenu();

    PopupMenu(const PopupMenu&) = delete;
    PopupMenu& operator=(const PopupMenu&) = delete;

    void add_item(uint32_t id, const std::string& label, bool enabled = true);
    void add_checkable_item(uint32_t id, const std::string& label, bool checked, bool enabled = true);
    void add_separator();
    void set_checked(uint32_t id, bool checked);

    bool track(WindowHandle owner, Point position);

    MenuHandle handle() const { return handle_; }
    size_t item_count() const { return items_.size(); }
    const std::vector<MenuItemSpec>& items() const { return items_; }

private:
    PopupMenu(std::shared_ptr<NativeWindowSystem> system, MenuHandle handle);

    void append(const MenuItemSpec& item);

    std::shared_ptr<NativeWindowSystem> system_;
    MenuHandle handle_;
    std::vector<MenuItemSpec> items_;
};

} // namespace trayhost
