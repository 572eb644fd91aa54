/**
 * @file session_registry.h
 * @brief Exclusive ownership of per-device sessions
 *
 * A device can have at most one active compression session and one active
 * decompression session at a time. A second acquire for the same device and
 * role fails with SESSION_CONFLICT instead of waiting; the caller retries
 * once the first session has closed.
 */

#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H

#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "application/engine_fault.h"

enum class SessionState {
    IDLE,
    PRIMING,    ///< Pool empty, the next window is stored as an exemplar
    STEADY,
    DRAINING,   ///< End of input, flushing the trailing window
    CLOSED,
    FAULTED
};

const char* sessionStateName(SessionState state);

enum class SessionRole {
    COMPRESSION,
    DECOMPRESSION
};

class SessionRegistry;

/**
 * @class SessionLease
 * @brief Move-only ownership token; releases the device when destroyed
 */
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    bool held() const { return registry != nullptr; }
    void release();

private:
    friend class SessionRegistry;
    SessionLease(SessionRegistry* registry, SessionRole role, const std::string& deviceId);

    SessionRegistry* registry = nullptr;
    SessionRole role = SessionRole::COMPRESSION;
    std::string deviceId;
};

class SessionRegistry {
public:
    /**
     * @brief Registry shared by every session of the process
     */
    static SessionRegistry& global();

    /**
     * @brief Claim a device for one role
     *
     * @param role Compression or decompression
     * @param deviceId Device to claim
     * @param lease Output: held lease on success
     * @return SESSION_CONFLICT if the device already has an active session in that role
     */
    EngineFault acquire(SessionRole role, const std::string& deviceId, SessionLease& lease);

    bool isActive(SessionRole role, const std::string& deviceId) const;
    size_t activeCount() const;

private:
    friend class SessionLease;
    void release(SessionRole role, const std::string& deviceId);

    mutable std::mutex mu;
    std::set<std::pair<int, std::string>> active;
};

const char* sessionRoleName(SessionRole role);

#endif // SESSION_REGISTRY_H
