/**
 * @file exemplar_pool.cpp
 * @brief Implementation of the exemplar pool
 */

#include "application/exemplar_pool.h"
#include "peripheral/logger.h"

#include <utility>

ExemplarPool::ExemplarPool(size_t capacity) : maxExemplars(capacity) {}

EngineFault ExemplarPool::insert(Window&& window, uint32_t& slotIndex, EvictionEvent* eviction) {
    if (maxExemplars == 0) {
        return EngineFault::make(FaultKind::POOL_INSERT_FAILURE, window.deviceId, window.index,
                                 "exemplar pool capacity is zero");
    }

    EvictionEvent event;
    if (liveCount >= maxExemplars) {
        uint32_t victim = selectVictim();
        Slot& slot = slots[victim];
        event.evicted = true;
        event.slotIndex = victim;
        event.insertionOrder = slot.exemplar.insertionOrder;
        event.useCount = slot.exemplar.useCount;

        LOG_DEBUG(LOG_TAG_POOL, "[%s] evict slot %u (inserted #%llu, %llu hits)",
                  window.deviceId.c_str(), victim,
                  (unsigned long long)event.insertionOrder,
                  (unsigned long long)event.useCount);

        slot.occupied = false;
        slot.exemplar = Exemplar();
        liveCount--;
        evictionCount++;
    }

    uint32_t index = lowestFreeSlot();
    Slot& slot = slots[index];
    slot.occupied = true;
    slot.exemplar.slotIndex = index;
    slot.exemplar.startTimestamp = window.startTimestamp;
    slot.exemplar.sampleCount = window.sampleCount;
    slot.exemplar.arity = window.arity;
    slot.exemplar.values = std::move(window.values);
    slot.exemplar.lastUsedTimestamp = window.startTimestamp;
    slot.exemplar.useCount = 0;
    slot.exemplar.insertionOrder = nextInsertionOrder++;
    liveCount++;

    slotIndex = index;
    if (eviction != nullptr) {
        *eviction = event;
    }
    return EngineFault::none();
}

bool ExemplarPool::touch(uint32_t slotIndex, int64_t timestamp) {
    if (slotIndex >= slots.size() || !slots[slotIndex].occupied) {
        return false;
    }
    Exemplar& exemplar = slots[slotIndex].exemplar;
    exemplar.lastUsedTimestamp = timestamp;
    exemplar.useCount++;
    return true;
}

const Exemplar* ExemplarPool::get(uint32_t slotIndex) const {
    if (slotIndex >= slots.size() || !slots[slotIndex].occupied) {
        return nullptr;
    }
    return &slots[slotIndex].exemplar;
}

std::vector<const Exemplar*> ExemplarPool::live() const {
    std::vector<const Exemplar*> out;
    out.reserve(liveCount);
    for (const Slot& slot : slots) {
        if (slot.occupied) {
            out.push_back(&slot.exemplar);
        }
    }
    return out;
}

uint32_t ExemplarPool::selectVictim() const {
    uint32_t victim = 0;
    bool found = false;
    for (uint32_t i = 0; i < slots.size(); i++) {
        const Slot& slot = slots[i];
        if (!slot.occupied) {
            continue;
        }
        if (!found) {
            victim = i;
            found = true;
            continue;
        }
        const Exemplar& best = slots[victim].exemplar;
        const Exemplar& candidate = slot.exemplar;
        if (candidate.lastUsedTimestamp < best.lastUsedTimestamp ||
            (candidate.lastUsedTimestamp == best.lastUsedTimestamp &&
             candidate.insertionOrder < best.insertionOrder)) {
            victim = i;
        }
    }
    return victim;
}

uint32_t ExemplarPool::lowestFreeSlot() {
    for (uint32_t i = 0; i < slots.size(); i++) {
        if (!slots[i].occupied) {
            return i;
        }
    }
    slots.emplace_back();
    return (uint32_t)(slots.size() - 1);
}
