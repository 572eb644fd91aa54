/**
 * @file compressor.h
 * @brief Per-device streaming compression session
 *
 * The compressor ties the engine together for one device:
 *
 *   samples -> WindowSegmenter -> SimilarityEvaluator (against the pool)
 *           -> Reference | NewExemplar -> ExemplarPool -> ThresholdController
 *
 * Each completed window is encoded immediately and appended to the
 * RecordSink, so a session never holds more than one partial window plus its
 * pool. Windows are processed strictly in order; a fatal fault moves the
 * session to FAULTED and the records already appended stay a valid prefix.
 *
 * State machine:
 *   IDLE --open()--> PRIMING --first window--> STEADY --close()--> DRAINING --> CLOSED
 *   any fatal fault -> FAULTED
 */

#ifndef COMPRESSOR_H
#define COMPRESSOR_H

#include <string>
#include <vector>

#include "application/compressed_record.h"
#include "application/engine_config.h"
#include "application/engine_fault.h"
#include "application/exemplar_pool.h"
#include "application/session_registry.h"
#include "application/similarity.h"
#include "application/statistics_manager.h"
#include "application/threshold_controller.h"
#include "application/window_segmenter.h"

class Compressor {
public:
    /**
     * @param deviceId Device this session compresses
     * @param config Engine configuration (copied)
     * @param sink Destination of the records, must outlive the compressor
     * @param registry Registry used to claim the device
     */
    Compressor(const std::string& deviceId, const EngineConfig& config, RecordSink& sink,
               SessionRegistry& registry = SessionRegistry::global());

    /**
     * @brief Claim the device and start the session
     * @return INVALID_CONFIG, POOL_INSERT_FAILURE (zero capacity),
     *         SESSION_CONFLICT or INVALID_SESSION_STATE
     */
    EngineFault open();

    /**
     * @brief Feed the next sample of the device
     */
    EngineFault push(const Sample& sample);

    /**
     * @brief Feed an ordered batch; stops at the first fault
     */
    EngineFault pushBatch(const std::vector<Sample>& samples);

    /**
     * @brief End of input: drain the trailing window and release the device
     */
    EngineFault close();

    /**
     * @brief Samples held back by BUFFER mode at close()
     */
    std::vector<Sample> takeCarriedSamples();

    SessionState state() const { return current; }
    const EngineFault& lastFault() const { return fault; }
    const std::string& deviceId() const { return device; }
    const EngineConfig& config() const { return settings; }

    const ExemplarPool& pool() const { return exemplars; }
    const ThresholdController& controller() const { return thresholds; }
    const StatisticsManager& statistics() const { return stats; }
    uint64_t recordsEmitted() const { return emitted; }

private:
    EngineFault processWindow(Window&& window);
    EngineFault fail(const EngineFault& cause);
    EngineFault rejectState(const char* operation);

    std::string device;
    EngineConfig settings;
    RecordSink& sink;
    SessionRegistry& registry;
    SessionLease lease;

    SessionState current = SessionState::IDLE;
    EngineFault fault;

    WindowSegmenter segmenter;
    SimilarityEvaluator evaluator;
    ExemplarPool exemplars;
    ThresholdController thresholds;
    StatisticsManager stats;

    uint64_t emitted = 0;
    std::vector<Sample> carried;
};

#endif // COMPRESSOR_H
