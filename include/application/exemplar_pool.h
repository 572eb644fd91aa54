/**
 * @file exemplar_pool.h
 * @brief Bounded per-device pool of exemplar windows with LRU eviction
 *
 * Slot indices lie in [0, capacity). A new exemplar takes the lowest free
 * slot; when the pool is full the least recently used exemplar (oldest
 * lastUsedTimestamp, ties to the smallest insertionOrder) is evicted first
 * and its slot is reused. Nothing here reads a clock or a random source:
 * replaying the same insert/touch sequence always yields the same slots.
 */

#ifndef EXEMPLAR_POOL_H
#define EXEMPLAR_POOL_H

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "application/engine_fault.h"
#include "application/telemetry.h"

/**
 * @struct Exemplar
 * @brief A window retained in a pool slot
 */
struct Exemplar {
    uint32_t slotIndex = 0;
    int64_t startTimestamp = 0;
    size_t sampleCount = 0;
    size_t arity = 0;
    std::vector<double> values;
    int64_t lastUsedTimestamp = 0;  ///< Start timestamp of the last inserting/referencing window
    uint64_t useCount = 0;          ///< Reference hits
    uint64_t insertionOrder = 0;    ///< Monotonic per pool
};

/**
 * @struct EvictionEvent
 * @brief What an insertion displaced, if anything
 */
struct EvictionEvent {
    bool evicted = false;
    uint32_t slotIndex = 0;
    uint64_t insertionOrder = 0;
    uint64_t useCount = 0;
};

class ExemplarPool {
public:
    explicit ExemplarPool(size_t capacity);

    /**
     * @brief Insert a window, evicting the LRU exemplar if the pool is full
     *
     * @param window Window to retain (moved into the pool)
     * @param slotIndex Output: slot assigned to the new exemplar
     * @param eviction Optional output: eviction performed by this call
     * @return POOL_INSERT_FAILURE if the capacity is zero
     */
    EngineFault insert(Window&& window, uint32_t& slotIndex, EvictionEvent* eviction = nullptr);

    /**
     * @brief Mark a live exemplar as used by the window starting at `timestamp`
     * @return false if the slot is not live
     */
    bool touch(uint32_t slotIndex, int64_t timestamp);

    /**
     * @brief Live exemplar in a slot, or nullptr (NotFound)
     */
    const Exemplar* get(uint32_t slotIndex) const;

    /**
     * @brief Live exemplars in slot order
     */
    std::vector<const Exemplar*> live() const;

    size_t size() const { return liveCount; }
    size_t capacity() const { return maxExemplars; }
    bool empty() const { return liveCount == 0; }
    bool full() const { return liveCount >= maxExemplars; }
    uint64_t evictions() const { return evictionCount; }

private:
    struct Slot {
        bool occupied = false;
        Exemplar exemplar;
    };

    uint32_t selectVictim() const;
    uint32_t lowestFreeSlot();

    size_t maxExemplars;
    size_t liveCount = 0;
    uint64_t nextInsertionOrder = 0;
    uint64_t evictionCount = 0;
    std::vector<Slot> slots;    // grows lazily up to maxExemplars
};

#endif // EXEMPLAR_POOL_H
