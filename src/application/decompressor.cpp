/**
 * @file decompressor.cpp
 * @brief Implementation of record replay
 */

#include "application/decompressor.h"
#include "application/engine_config.h"
#include "peripheral/logger.h"

Decompressor::Decompressor(const std::string& deviceId, size_t poolCapacity, SessionRegistry& registry)
    : device(deviceId), registry(registry), exemplars(poolCapacity) {}

EngineFault Decompressor::open() {
    if (current != SessionState::IDLE) {
        EngineFault result = EngineFault::make(FaultKind::INVALID_SESSION_STATE, device, applied,
                                               std::string("open not allowed in state ") +
                                               sessionStateName(current));
        logFault(LOG_TAG_DECOMP, result);
        return result;
    }
    if (exemplars.capacity() == 0) {
        return fail(EngineFault::make(FaultKind::POOL_INSERT_FAILURE, device, 0,
                                      "exemplar pool capacity is zero"));
    }
    if (exemplars.capacity() > ENGINE_MAX_POOL_CAPACITY) {
        return fail(EngineFault::make(FaultKind::INVALID_CONFIG, device, 0,
                                      "pool capacity " + std::to_string(exemplars.capacity()) +
                                      " exceeds " + std::to_string(ENGINE_MAX_POOL_CAPACITY)));
    }

    EngineFault claim = registry.acquire(SessionRole::DECOMPRESSION, device, lease);
    if (!claim.ok()) {
        fault = claim;
        return claim;
    }

    current = SessionState::PRIMING;
    LOG_INFO(LOG_TAG_DECOMP, "[%s] session open (capacity=%zu)", device.c_str(), exemplars.capacity());
    return EngineFault::none();
}

EngineFault Decompressor::apply(const CompressedRecord& record, std::vector<ReconstructedSample>& out) {
    if (current != SessionState::PRIMING && current != SessionState::STEADY) {
        EngineFault result = EngineFault::make(FaultKind::INVALID_SESSION_STATE, device, applied,
                                               std::string("apply not allowed in state ") +
                                               sessionStateName(current));
        logFault(LOG_TAG_DECOMP, result);
        return result;
    }

    EngineFault result = std::visit(RecordVisitor{
        [&](const ReferenceRecord& r) { return applyReference(r, out); },
        [&](const NewExemplarRecord& r) { return applyNewExemplar(r, out); }
    }, record);
    if (!result.ok()) {
        return fail(result);
    }

    applied++;
    current = SessionState::STEADY;
    return EngineFault::none();
}

EngineFault Decompressor::applyAll(const std::vector<CompressedRecord>& records,
                                   std::vector<ReconstructedSample>& out) {
    for (const CompressedRecord& record : records) {
        EngineFault result = apply(record, out);
        if (!result.ok()) {
            return result;
        }
    }
    return EngineFault::none();
}

EngineFault Decompressor::close() {
    if (current != SessionState::PRIMING && current != SessionState::STEADY) {
        EngineFault result = EngineFault::make(FaultKind::INVALID_SESSION_STATE, device, applied,
                                               std::string("close not allowed in state ") +
                                               sessionStateName(current));
        logFault(LOG_TAG_DECOMP, result);
        return result;
    }
    current = SessionState::CLOSED;
    lease.release();
    LOG_SUCCESS(LOG_TAG_DECOMP, "[%s] replayed %llu records (%llu references, %llu evictions)",
                device.c_str(), (unsigned long long)applied,
                (unsigned long long)references, (unsigned long long)exemplars.evictions());
    return EngineFault::none();
}

EngineFault Decompressor::applyReference(const ReferenceRecord& record,
                                         std::vector<ReconstructedSample>& out) {
    EngineFault order = checkOrder(record.windowStartTimestamp, record.windowEndTimestamp);
    if (!order.ok()) {
        return order;
    }

    const Exemplar* exemplar = exemplars.get(record.slotIndex);
    if (exemplar == nullptr) {
        return EngineFault::make(FaultKind::DANGLING_REFERENCE, device, applied,
                                 "slot " + std::to_string(record.slotIndex) + " holds no exemplar");
    }

    if (!exemplars.touch(record.slotIndex, record.windowStartTimestamp)) {
        return EngineFault::make(FaultKind::DANGLING_REFERENCE, device, applied,
                                 "slot " + std::to_string(record.slotIndex) + " could not be touched");
    }
    emitWindow(record.windowStartTimestamp, record.windowEndTimestamp,
               exemplar->sampleCount, exemplar->arity, exemplar->values, out);
    references++;
    haveLastEnd = true;
    lastEnd = record.windowEndTimestamp;
    return EngineFault::none();
}

EngineFault Decompressor::applyNewExemplar(const NewExemplarRecord& record,
                                           std::vector<ReconstructedSample>& out) {
    EngineFault order = checkOrder(record.windowStartTimestamp, record.windowEndTimestamp);
    if (!order.ok()) {
        return order;
    }
    if (record.sampleCount == 0 || record.arity == 0 ||
        record.rawValues.size() != (size_t)record.sampleCount * record.arity) {
        return EngineFault::make(FaultKind::CODEC_ERROR, device, applied,
                                 "payload of " + std::to_string(record.rawValues.size()) +
                                 " values does not match " + std::to_string(record.sampleCount) +
                                 "x" + std::to_string(record.arity));
    }

    Window window;
    window.deviceId = device;
    window.index = applied;
    window.startTimestamp = record.windowStartTimestamp;
    window.endTimestamp = record.windowEndTimestamp;
    window.sampleCount = record.sampleCount;
    window.arity = record.arity;
    window.values = record.rawValues;

    uint32_t slot = 0;
    EvictionEvent eviction;
    EngineFault inserted = exemplars.insert(std::move(window), slot, &eviction);
    if (!inserted.ok()) {
        return inserted;
    }
    if (slot != record.slotIndex) {
        return EngineFault::make(FaultKind::SLOT_MISMATCH, device, applied,
                                 "record declares slot " + std::to_string(record.slotIndex) +
                                 ", replay assigned slot " + std::to_string(slot));
    }
    if (eviction.evicted) {
        LOG_DEBUG(LOG_TAG_DECOMP, "[%s] record %llu evicted slot %u",
                  device.c_str(), (unsigned long long)applied, eviction.slotIndex);
    }

    emitWindow(record.windowStartTimestamp, record.windowEndTimestamp,
               record.sampleCount, record.arity, record.rawValues, out);
    haveLastEnd = true;
    lastEnd = record.windowEndTimestamp;
    return EngineFault::none();
}

EngineFault Decompressor::checkOrder(int64_t start, int64_t end) {
    if (end < start) {
        return EngineFault::make(FaultKind::MALFORMED_INPUT_ORDER, device, applied,
                                 "window ends at " + std::to_string(end) +
                                 " before it starts at " + std::to_string(start));
    }
    if (haveLastEnd && start <= lastEnd) {
        return EngineFault::make(FaultKind::MALFORMED_INPUT_ORDER, device, applied,
                                 "window start " + std::to_string(start) +
                                 " does not follow previous window end " + std::to_string(lastEnd));
    }
    return EngineFault::none();
}

void Decompressor::emitWindow(int64_t start, int64_t end, size_t sampleCount, size_t arity,
                              const std::vector<double>& values,
                              std::vector<ReconstructedSample>& out) const {
    // end >= start, so the span fits in uint64_t even across the whole int64 range.
    // The offset never exceeds the span, which keeps every timestamp in [start, end].
    const uint64_t span = (uint64_t)end - (uint64_t)start;
    const uint64_t steps = sampleCount > 1 ? (uint64_t)(sampleCount - 1) : 1;
    const uint64_t stride = span / steps;
    const uint64_t remainder = span % steps;
    for (size_t i = 0; i < sampleCount; i++) {
        ReconstructedSample sample;
        uint64_t offset = stride * (uint64_t)i + remainder * (uint64_t)i / steps;
        sample.timestamp = (int64_t)((uint64_t)start + offset);
        sample.values.assign(values.begin() + i * arity, values.begin() + (i + 1) * arity);
        out.push_back(std::move(sample));
    }
}

EngineFault Decompressor::fail(const EngineFault& cause) {
    fault = cause;
    current = SessionState::FAULTED;
    lease.release();
    logFault(LOG_TAG_DECOMP, cause);
    return cause;
}
