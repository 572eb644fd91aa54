/**
 * @file compressor.cpp
 * @brief Implementation of the per-device compression session
 */

#include "application/compressor.h"
#include "application/config_manager.h"
#include "peripheral/logger.h"

#include <utility>

Compressor::Compressor(const std::string& deviceId, const EngineConfig& config, RecordSink& sink,
                       SessionRegistry& registry)
    : device(deviceId),
      settings(config),
      sink(sink),
      registry(registry),
      segmenter(deviceId, config.windowLength, config.arity, config.trailingMode),
      evaluator(config.similarity),
      exemplars(config.poolCapacity),
      thresholds(config.controller),
      stats(deviceId, config.statistics) {}

EngineFault Compressor::open() {
    if (current != SessionState::IDLE) {
        return rejectState("open");
    }

    EngineFault check = ConfigManager::validate(settings);
    if (!check.ok()) {
        check.deviceId = device;
        return fail(check);
    }
    if (settings.poolCapacity == 0) {
        return fail(EngineFault::make(FaultKind::POOL_INSERT_FAILURE, device, 0,
                                      "exemplar pool capacity is zero"));
    }

    // A conflict leaves this session IDLE so the caller can retry later
    EngineFault claim = registry.acquire(SessionRole::COMPRESSION, device, lease);
    if (!claim.ok()) {
        fault = claim;
        return claim;
    }

    current = SessionState::PRIMING;
    LOG_INFO(LOG_TAG_COMPRESS, "[%s] session open (W=%zu, capacity=%zu, threshold=%.4f, %s)",
             device.c_str(), settings.windowLength, settings.poolCapacity,
             thresholds.threshold(), settings.controller.adaptive ? "adaptive" : "fixed");
    return EngineFault::none();
}

EngineFault Compressor::push(const Sample& sample) {
    if (current != SessionState::PRIMING && current != SessionState::STEADY) {
        return rejectState("push");
    }

    bool windowReady = false;
    Window window;
    EngineFault result = segmenter.push(sample, windowReady, window);
    if (!result.ok()) {
        return fail(result);
    }
    if (windowReady) {
        return processWindow(std::move(window));
    }
    return EngineFault::none();
}

EngineFault Compressor::pushBatch(const std::vector<Sample>& samples) {
    for (const Sample& sample : samples) {
        EngineFault result = push(sample);
        if (!result.ok()) {
            return result;
        }
    }
    return EngineFault::none();
}

EngineFault Compressor::close() {
    if (current != SessionState::PRIMING && current != SessionState::STEADY) {
        return rejectState("close");
    }
    current = SessionState::DRAINING;

    Window window;
    if (segmenter.finish(window)) {
        EngineFault result = processWindow(std::move(window));
        if (!result.ok()) {
            return result;
        }
    } else if (segmenter.pendingCount() > 0) {
        carried = segmenter.takePending();
        LOG_INFO(LOG_TAG_COMPRESS, "[%s] carrying %zu samples to the next session",
                 device.c_str(), carried.size());
    }

    current = SessionState::CLOSED;
    lease.release();
    LOG_SUCCESS(LOG_TAG_COMPRESS, "[%s] session closed after %llu records",
                device.c_str(), (unsigned long long)emitted);
    stats.printCompactSummary();
    return EngineFault::none();
}

std::vector<Sample> Compressor::takeCarriedSamples() {
    std::vector<Sample> out;
    out.swap(carried);
    return out;
}

EngineFault Compressor::processWindow(Window&& window) {
    const uint64_t windowIndex = window.index;
    const double threshold = thresholds.threshold();
    const size_t rawBytes = rawWindowBytes(window.sampleCount, window.arity);

    MatchResult match = evaluator.nearest(window, exemplars);
    const bool matched = match.found && match.distance <= threshold;

    CompressedRecord record;
    if (matched) {
        ReferenceRecord reference;
        reference.slotIndex = match.slotIndex;
        reference.windowStartTimestamp = window.startTimestamp;
        reference.windowEndTimestamp = window.endTimestamp;
        if (!exemplars.touch(match.slotIndex, window.startTimestamp)) {
            return fail(EngineFault::make(FaultKind::DANGLING_REFERENCE, device, windowIndex,
                                          "matched slot " + std::to_string(match.slotIndex) + " is not live"));
        }
        record = reference;

        LOG_DEBUG(LOG_TAG_COMPRESS, "[%s] window %llu -> reference slot %u (d=%.5f <= %.5f)",
                  device.c_str(), (unsigned long long)windowIndex, match.slotIndex,
                  match.distance, threshold);
    } else {
        NewExemplarRecord exemplar;
        exemplar.windowStartTimestamp = window.startTimestamp;
        exemplar.windowEndTimestamp = window.endTimestamp;
        exemplar.sampleCount = (uint32_t)window.sampleCount;
        exemplar.arity = (uint32_t)window.arity;
        exemplar.rawValues = window.values;

        EvictionEvent eviction;
        EngineFault inserted = exemplars.insert(std::move(window), exemplar.slotIndex, &eviction);
        if (!inserted.ok()) {
            return fail(inserted);
        }
        if (eviction.evicted) {
            stats.recordEviction();
            LOG_DEBUG(LOG_TAG_POOL, "[%s] window %llu reuses slot %u",
                      device.c_str(), (unsigned long long)windowIndex, eviction.slotIndex);
        }
        LOG_DEBUG(LOG_TAG_COMPRESS, "[%s] window %llu -> new exemplar slot %u (d=%.5f)",
                  device.c_str(), (unsigned long long)windowIndex, exemplar.slotIndex,
                  match.distance);
        record = std::move(exemplar);
    }

    sink.append(record);
    emitted++;

    stats.recordWindow(matched, match.distance, rawBytes, recordEncodedBytes(record), threshold);

    ThresholdObservation observation;
    observation.matched = matched;
    observation.distance = matched ? match.distance : 0.0;
    observation.ratio = stats.spaceSavingRatio();
    thresholds.observe(observation);
    stats.recordThreshold(thresholds.threshold());

    if (current == SessionState::PRIMING) {
        current = SessionState::STEADY;
    }
    return EngineFault::none();
}

EngineFault Compressor::fail(const EngineFault& cause) {
    fault = cause;
    current = SessionState::FAULTED;
    lease.release();
    logFault(LOG_TAG_COMPRESS, cause);
    return cause;
}

EngineFault Compressor::rejectState(const char* operation) {
    EngineFault result = EngineFault::make(FaultKind::INVALID_SESSION_STATE, device,
                                           segmenter.windowsEmitted(),
                                           std::string(operation) + " not allowed in state " +
                                           sessionStateName(current));
    logFault(LOG_TAG_COMPRESS, result);
    return result;
}
