/**
 * @file window_segmenter.cpp
 * @brief Implementation of the window segmenter
 */

#include "application/window_segmenter.h"
#include "peripheral/logger.h"

WindowSegmenter::WindowSegmenter(const std::string& deviceId, size_t windowLength,
                                 size_t arity, TrailingWindowMode mode)
    : device(deviceId), windowLength(windowLength), sessionArity(arity), mode(mode) {}

EngineFault WindowSegmenter::push(const Sample& sample, bool& windowReady, Window& window) {
    windowReady = false;

    if (sample.deviceId != device) {
        return EngineFault::make(FaultKind::DEVICE_MISMATCH, device, nextWindowIndex,
                                 "sample belongs to device '" + sample.deviceId + "'");
    }
    if (haveLastTimestamp && sample.timestamp <= lastTimestamp) {
        return EngineFault::make(FaultKind::MALFORMED_INPUT_ORDER, device, nextWindowIndex,
                                 "timestamp " + std::to_string(sample.timestamp) +
                                 " does not follow " + std::to_string(lastTimestamp));
    }
    if (sessionArity == 0) {
        if (sample.values.empty()) {
            return EngineFault::make(FaultKind::ARITY_MISMATCH, device, nextWindowIndex,
                                     "sample carries no values");
        }
        sessionArity = sample.values.size();
        LOG_DEBUG(LOG_TAG_SEGMENT, "[%s] arity fixed at %zu", device.c_str(), sessionArity);
    } else if (sample.values.size() != sessionArity) {
        return EngineFault::make(FaultKind::ARITY_MISMATCH, device, nextWindowIndex,
                                 "sample has " + std::to_string(sample.values.size()) +
                                 " values, session arity is " + std::to_string(sessionArity));
    }

    haveLastTimestamp = true;
    lastTimestamp = sample.timestamp;
    pending.push_back(sample);

    if (pending.size() >= windowLength) {
        window = buildWindow();
        windowReady = true;
    }
    return EngineFault::none();
}

bool WindowSegmenter::finish(Window& window) {
    if (pending.empty()) {
        return false;
    }
    if (mode == TrailingWindowMode::BUFFER) {
        LOG_DEBUG(LOG_TAG_SEGMENT, "[%s] keeping %zu pending samples", device.c_str(), pending.size());
        return false;
    }
    LOG_DEBUG(LOG_TAG_SEGMENT, "[%s] flushing short window of %zu samples",
              device.c_str(), pending.size());
    window = buildWindow();
    return true;
}

std::vector<Sample> WindowSegmenter::takePending() {
    std::vector<Sample> out;
    out.swap(pending);
    return out;
}

Window WindowSegmenter::buildWindow() {
    Window window;
    window.deviceId = device;
    window.index = nextWindowIndex++;
    window.startTimestamp = pending.front().timestamp;
    window.endTimestamp = pending.back().timestamp;
    window.sampleCount = pending.size();
    window.arity = sessionArity;
    window.values.reserve(pending.size() * sessionArity);
    for (const Sample& sample : pending) {
        window.values.insert(window.values.end(), sample.values.begin(), sample.values.end());
    }
    pending.clear();
    return window;
}
