/**
 * @file session_registry.cpp
 * @brief Implementation of the session registry and leases
 */

#include "application/session_registry.h"
#include "peripheral/logger.h"

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::IDLE:     return "IDLE";
        case SessionState::PRIMING:  return "PRIMING";
        case SessionState::STEADY:   return "STEADY";
        case SessionState::DRAINING: return "DRAINING";
        case SessionState::CLOSED:   return "CLOSED";
        case SessionState::FAULTED:  return "FAULTED";
    }
    return "UNKNOWN";
}

SessionLease::SessionLease(SessionRegistry* registry, SessionRole role, const std::string& deviceId)
    : registry(registry), role(role), deviceId(deviceId) {}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : registry(other.registry), role(other.role), deviceId(std::move(other.deviceId)) {
    other.registry = nullptr;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        registry = other.registry;
        role = other.role;
        deviceId = std::move(other.deviceId);
        other.registry = nullptr;
    }
    return *this;
}

void SessionLease::release() {
    if (registry != nullptr) {
        registry->release(role, deviceId);
        registry = nullptr;
    }
}

SessionRegistry& SessionRegistry::global() {
    static SessionRegistry registry;
    return registry;
}

EngineFault SessionRegistry::acquire(SessionRole role, const std::string& deviceId, SessionLease& lease) {
    {
        std::lock_guard<std::mutex> lk(mu);
        if (!active.insert(std::make_pair((int)role, deviceId)).second) {
            EngineFault fault = EngineFault::make(FaultKind::SESSION_CONFLICT, deviceId, 0,
                                                  std::string(sessionRoleName(role)) +
                                                  " session already active");
            LOG_WARN(LOG_TAG_SESSION, "[%s] %s", deviceId.c_str(), fault.description.c_str());
            return fault;
        }
    }
    lease = SessionLease(this, role, deviceId);
    LOG_DEBUG(LOG_TAG_SESSION, "[%s] %s session acquired", deviceId.c_str(), sessionRoleName(role));
    return EngineFault::none();
}

bool SessionRegistry::isActive(SessionRole role, const std::string& deviceId) const {
    std::lock_guard<std::mutex> lk(mu);
    return active.count(std::make_pair((int)role, deviceId)) > 0;
}

size_t SessionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lk(mu);
    return active.size();
}

void SessionRegistry::release(SessionRole role, const std::string& deviceId) {
    std::lock_guard<std::mutex> lk(mu);
    active.erase(std::make_pair((int)role, deviceId));
    LOG_DEBUG(LOG_TAG_SESSION, "[%s] %s session released", deviceId.c_str(), sessionRoleName(role));
}

const char* sessionRoleName(SessionRole role) {
    switch (role) {
        case SessionRole::COMPRESSION:   return "compression";
        case SessionRole::DECOMPRESSION: return "decompression";
    }
    return "unknown";
}
