/**
 * @file engine_fault.cpp
 * @brief Fault construction and reporting helpers
 */

#include "application/engine_fault.h"
#include "peripheral/logger.h"

EngineFault EngineFault::make(FaultKind kind, const std::string& deviceId,
                              uint64_t index, const std::string& description) {
    EngineFault fault;
    fault.kind = kind;
    fault.deviceId = deviceId;
    fault.index = index;
    fault.description = description;
    return fault;
}

const char* faultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::NONE:                  return "NONE";
        case FaultKind::MALFORMED_INPUT_ORDER: return "MALFORMED_INPUT_ORDER";
        case FaultKind::DEVICE_MISMATCH:       return "DEVICE_MISMATCH";
        case FaultKind::ARITY_MISMATCH:        return "ARITY_MISMATCH";
        case FaultKind::POOL_INSERT_FAILURE:   return "POOL_INSERT_FAILURE";
        case FaultKind::SESSION_CONFLICT:      return "SESSION_CONFLICT";
        case FaultKind::INVALID_SESSION_STATE: return "INVALID_SESSION_STATE";
        case FaultKind::DANGLING_REFERENCE:    return "DANGLING_REFERENCE";
        case FaultKind::SLOT_MISMATCH:         return "SLOT_MISMATCH";
        case FaultKind::INVALID_CONFIG:        return "INVALID_CONFIG";
        case FaultKind::CODEC_ERROR:           return "CODEC_ERROR";
    }
    return "UNKNOWN";
}

void logFault(const char* tag, const EngineFault& fault) {
    if (fault.ok()) {
        return;
    }
    LOG_ERROR(tag, "%s on device '%s' at index %llu: %s",
              faultKindName(fault.kind),
              fault.deviceId.c_str(),
              (unsigned long long)fault.index,
              fault.description.c_str());
}
