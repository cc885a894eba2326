#include "trayhost/popup_menu.h"
#include "trayhost/error_types.h"
#include "trayhost/platform/native_window_system.h"
#include "trayhost/utils/logging.h"

namespace trayhost {

std::unique_ptr<PopupMenu> PopupMenu::create(std::shared_ptr<NativeWindowSystem> system) {
    MenuHandle handle = system->create_popup_menu();
    if (!handle) {
        throw OsErrorException("CreatePopupMenu", system->last_error());
    }

    return std::unique_ptr<PopupMenu>(new PopupMenu(std::move(system), handle));
}

PopupMenu::PopupMenu(std::shared_ptr<NativeWindowSystem> system, MenuHandle handle)
    : system_(std::move(system))
    , handle_(handle)
{
}

PopupMenu::~PopupMenu() {
    if (handle_) {
        system_->destroy_menu(handle_);
    }
}

void PopupMenu::add_item(uint32_t id, const std::string& label, bool enabled) {
    MenuItemSpec item;
    item.id = id;
    item.label = label;
    item.enabled = enabled;
    append(item);
}

void PopupMenu::add_checkable_item(uint32_t id, const std::string& label, bool checked, bool enabled) {
    MenuItemSpec item;
    item.id = id;
    item.label = label;
    item.enabled = enabled;
    item.checkable = true;
    item.checked = checked;
    append(item);
}

void PopupMenu::add_separator() {
    MenuItemSpec item;
    item.separator = true;
    append(item);
}

void PopupMenu::set_checked(uint32_t id, bool checked) {
    for (MenuItemSpec& item : items_) {
        if (item.id == id && !item.separator) {
            if (!system_->set_menu_item_checked(handle_, id, checked)) {
                throw OsErrorException("CheckMenuItem", system_->last_error());
            }
            item.checked = checked;
            return;
        }
    }

    TRAYHOST_LOG_WARNING("Cannot check unknown menu item " << id);
}

bool PopupMenu::track(WindowHandle owner, Point position) {
    if (!system_->track_popup_menu(handle_, owner, position)) {
        TRAYHOST_LOG_DEBUG("TrackPopupMenu failed with error: " << system_->last_error());
        return false;
    }
    return true;
}

void PopupMenu::append(const MenuItemSpec& item) {
    if (!system_->append_menu_item(handle_, item)) {
        throw OsErrorException("AppendMenu", system_->last_error());
    }
    items_.push_back(item);
}

} // namespace trayhost
