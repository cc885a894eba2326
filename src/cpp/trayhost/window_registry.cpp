#include "trayhost/window_registry.h"

namespace trayhost {

namespace {
    constexpr unsigned HALF_BITS = sizeof(std::uintptr_t) * 4;
    constexpr std::uintptr_t HALF_MASK = (std::uintptr_t(1) << HALF_BITS) - 1;
}

std::uintptr_t RegistryKey::to_bits() const {
    return (static_cast<std::uintptr_t>(generation) << HALF_BITS) |
           (static_cast<std::uintptr_t>(index) & HALF_MASK);
}

RegistryKey RegistryKey::from_bits(std::uintptr_t bits) {
    RegistryKey key;
    key.index = static_cast<uint32_t>(bits & HALF_MASK);
    key.generation = static_cast<uint32_t>((bits >> HALF_BITS) & HALF_MASK);
    return key;
}

uint32_t WindowRegistry::max_generation() {
    return static_cast<uint32_t>(HALF_MASK);
}

RegistryKey WindowRegistry::insert(std::shared_ptr<MessageHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.handler = std::move(handler);
    count_++;

    return RegistryKey{index, slot.generation};
}

std::shared_ptr<MessageHandler> WindowRegistry::find(RegistryKey key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (key.index >= slots_.size()) {
        return nullptr;
    }
    const Slot& slot = slots_[key.index];
    if (slot.generation != key.generation) {
        return nullptr;
    }
    return slot.handler;
}

bool WindowRegistry::remove(RegistryKey key) {
    std::shared_ptr<MessageHandler> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (key.index >= slots_.size()) {
            return false;
        }
        Slot& slot = slots_[key.index];
        if (slot.generation != key.generation || !slot.handler) {
            return false;
        }

        released = std::move(slot.handler);
        slot.handler.reset();
        slot.generation = slot.generation == max_generation() ? 1 : slot.generation + 1;
        free_slots_.push_back(key.index);
        count_--;
    }

    // Handler destructor runs outside the lock, it may release native resources
    return true;
}

size_t WindowRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace trayhost
