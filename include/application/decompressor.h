/**
 * @file decompressor.h
 * @brief Replays one device's record stream into an approximate series
 *
 * The decompressor keeps its own ExemplarPool and mutates it exactly as the
 * compressor did: a NewExemplar is inserted (evicting the LRU exemplar when
 * full) and must land on the slot it declares, a Reference touches its slot.
 * No distance is ever recomputed, so the pool trajectory depends on the
 * record stream alone.
 *
 * Sample timestamps inside a window are spread evenly between the window's
 * start and end timestamps.
 */

#ifndef DECOMPRESSOR_H
#define DECOMPRESSOR_H

#include <string>
#include <vector>

#include "application/compressed_record.h"
#include "application/engine_fault.h"
#include "application/exemplar_pool.h"
#include "application/session_registry.h"
#include "application/telemetry.h"

class Decompressor {
public:
    /**
     * @param deviceId Device whose records are replayed
     * @param poolCapacity Capacity the compressor used
     * @param registry Registry used to claim the device
     */
    Decompressor(const std::string& deviceId, size_t poolCapacity,
                 SessionRegistry& registry = SessionRegistry::global());

    /**
     * @brief Claim the device for decompression
     * @return POOL_INSERT_FAILURE (zero capacity), SESSION_CONFLICT or INVALID_SESSION_STATE
     */
    EngineFault open();

    /**
     * @brief Apply one record and append the window it stands for to `out`
     *
     * @return DANGLING_REFERENCE, SLOT_MISMATCH, MALFORMED_INPUT_ORDER or
     *         CODEC_ERROR (payload does not match its shape); fatal for the session
     */
    EngineFault apply(const CompressedRecord& record, std::vector<ReconstructedSample>& out);

    /**
     * @brief Apply an ordered record sequence; stops at the first fault
     */
    EngineFault applyAll(const std::vector<CompressedRecord>& records,
                         std::vector<ReconstructedSample>& out);

    EngineFault close();

    SessionState state() const { return current; }
    const EngineFault& lastFault() const { return fault; }
    const ExemplarPool& pool() const { return exemplars; }
    uint64_t recordsApplied() const { return applied; }
    uint64_t referencesResolved() const { return references; }

private:
    EngineFault applyReference(const ReferenceRecord& record, std::vector<ReconstructedSample>& out);
    EngineFault applyNewExemplar(const NewExemplarRecord& record, std::vector<ReconstructedSample>& out);
    EngineFault checkOrder(int64_t start, int64_t end);
    void emitWindow(int64_t start, int64_t end, size_t sampleCount, size_t arity,
                    const std::vector<double>& values, std::vector<ReconstructedSample>& out) const;
    EngineFault fail(const EngineFault& cause);

    std::string device;
    SessionRegistry& registry;
    SessionLease lease;
    SessionState current = SessionState::IDLE;
    EngineFault fault;

    ExemplarPool exemplars;
    uint64_t applied = 0;
    uint64_t references = 0;
    bool haveLastEnd = false;
    int64_t lastEnd = 0;
};

#endif // DECOMPRESSOR_H
