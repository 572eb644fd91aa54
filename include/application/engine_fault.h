/**
 * @file engine_fault.h
 * @brief Fault reporting for the compression engine
 *
 * Every engine operation returns an EngineFault. A fault with kind NONE means
 * success; anything else names the device and the window or record index
 * that failed, so callers can report it upward without guessing.
 *
 * Fatal kinds (everything except SESSION_CONFLICT) stop the affected session
 * only; other devices are never touched.
 *
 * @version 1.0.0
 * @date 2025-10-19
 */

#ifndef ENGINE_FAULT_H
#define ENGINE_FAULT_H

#include <stdint.h>
#include <string>

/**
 * @brief Engine fault classification
 */
enum class FaultKind {
    NONE,                   ///< Operation succeeded
    MALFORMED_INPUT_ORDER,  ///< Non-monotonic or duplicate timestamps
    DEVICE_MISMATCH,        ///< Sample or record belongs to another device
    ARITY_MISMATCH,         ///< Sample width differs from the session arity
    POOL_INSERT_FAILURE,    ///< Exemplar pool has zero capacity
    SESSION_CONFLICT,       ///< Device already has an active session
    INVALID_SESSION_STATE,  ///< Operation not allowed in the current state
    DANGLING_REFERENCE,     ///< Reference to a slot that is not live
    SLOT_MISMATCH,          ///< Replayed insertion landed on another slot
    INVALID_CONFIG,         ///< Configuration rejected by validation
    CODEC_ERROR             ///< Malformed or tampered record document
};

/**
 * @brief Fault details returned by engine operations
 */
struct EngineFault {
    FaultKind kind = FaultKind::NONE;
    std::string deviceId;
    uint64_t index = 0;         ///< Window index (compression) or record index (decompression)
    std::string description;

    bool ok() const { return kind == FaultKind::NONE; }

    /**
     * @brief Recoverable faults leave the session usable after a retry
     */
    bool isRecoverable() const { return kind == FaultKind::SESSION_CONFLICT; }

    static EngineFault none() { return EngineFault(); }

    static EngineFault make(FaultKind kind, const std::string& deviceId,
                            uint64_t index, const std::string& description);
};

/**
 * @brief Stable upper-case name of a fault kind, used in logs and documents
 */
const char* faultKindName(FaultKind kind);

/**
 * @brief Log a fault through the ERROR channel under the given tag
 * @param tag Logger module tag
 * @param fault Fault to report (ignored when ok())
 */
void logFault(const char* tag, const EngineFault& fault);

#endif // ENGINE_FAULT_H
