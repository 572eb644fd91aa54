/**
 * @file threshold_controller.h
 * @brief Online feedback loop for the acceptance threshold
 *
 * The controller trades compression ratio against fidelity while a session
 * runs. Its whole behaviour is the pure transition advanceThreshold(); the
 * ThresholdController class only owns one device's state and config.
 *
 * After warm-up, per observation:
 *   rolling error > error budget          -> threshold -= step
 *   rolling ratio < target * (1 - tol)    -> threshold += step
 *   rolling ratio > target * (1 + tol)    -> threshold -= step
 * then clamp to [min_threshold, max_threshold].
 *
 * Ratios are space-saving ratios (raw / compressed): a higher threshold
 * accepts more references and raises the ratio.
 */

#ifndef THRESHOLD_CONTROLLER_H
#define THRESHOLD_CONTROLLER_H

#include <stdint.h>
#include <deque>

#include "application/engine_config.h"

/**
 * @struct ThresholdObservation
 * @brief Outcome of one processed window
 */
struct ThresholdObservation {
    bool matched = false;   ///< Window was encoded as a reference
    double distance = 0.0;  ///< Distance to the nearest exemplar (ignored unless matched)
    double ratio = 1.0;     ///< Session space-saving ratio after the window
};

/**
 * @brief Direction of the last adjustment
 */
enum class ThresholdAdjustment {
    HOLD,           ///< Warm-up, fixed mode, or inside the dead band
    RAISE_FOR_RATIO,
    LOWER_FOR_RATIO,
    LOWER_FOR_ERROR
};

/**
 * @struct ThresholdState
 * @brief Per-device controller state
 */
struct ThresholdState {
    double threshold = 0.0;
    double targetRatio = 1.0;
    double errorAccumulator = 0.0;  ///< Sum of window errors over the session
    std::deque<double> recentRatios;    ///< Last K observed ratios
    std::deque<double> recentErrors;    ///< Last K window errors
    uint64_t observations = 0;
    ThresholdAdjustment lastAdjustment = ThresholdAdjustment::HOLD;

    double rollingRatio() const;
    double rollingError() const;
};

/**
 * @brief Fresh state for a session
 */
ThresholdState initialThresholdState(const ControllerConfig& config);

/**
 * @brief Pure state transition (ThresholdState, Observation) -> ThresholdState
 */
ThresholdState advanceThreshold(const ThresholdState& state,
                                const ThresholdObservation& observation,
                                const ControllerConfig& config);

const char* thresholdAdjustmentName(ThresholdAdjustment adjustment);

/**
 * @class ThresholdController
 * @brief Owns one device's ThresholdState
 */
class ThresholdController {
public:
    explicit ThresholdController(const ControllerConfig& config);

    /**
     * @brief Feed the outcome of a window; the new threshold applies to the next one
     */
    void observe(const ThresholdObservation& observation);

    double threshold() const { return current.threshold; }
    const ThresholdState& state() const { return current; }
    const ControllerConfig& config() const { return settings; }

private:
    ControllerConfig settings;
    ThresholdState current;
};

#endif // THRESHOLD_CONTROLLER_H
