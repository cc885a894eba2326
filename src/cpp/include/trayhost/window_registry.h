#pragma once

#include "trayhost/platform/native_types.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace trayhost {

// Receives the messages of one native window
class MessageHandler {
public:
    virtual ~MessageHandler() = default;

    virtual MessageResult handle_message(WindowHandle hwnd, MessageId msg,
                                         MessageWParam wparam, MessageLParam lparam) = 0;
};

/**
 * Identifies a registry slot. It is what the native subclass callback
 * receives as reference data, so it must round-trip through an integer.
 */
struct RegistryKey {
    uint32_t index = 0;
    uint32_t generation = 0;

    // Packs index and generation into a pointer-sized integer (16/16 bits on 32-bit targets)
    std::uintptr_t to_bits() const;
    static RegistryKey from_bits(std::uintptr_t bits);

    bool operator==(const RegistryKey& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const RegistryKey& other) const { return !(*this == other); }
};

/**
 * Arena of message handlers owned on behalf of native windows.
 * Stale keys (removed or reused slots) resolve to nothing.
 */
class WindowRegistry {
public:
    WindowRegistry() = default;

    WindowRegistry(const WindowRegistry&) = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    RegistryKey insert(std::shared_ptr<MessageHandler> handler);
    std::shared_ptr<MessageHandler> find(RegistryKey key) const;
    bool remove(RegistryKey key);

    size_t size() const;

private:
    struct Slot {
        std::shared_ptr<MessageHandler> handler;
        // Starts at 1 so that a zeroed key never matches
        uint32_t generation = 1;
    };

    static uint32_t max_generation();

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
    size_t count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace trayhost
