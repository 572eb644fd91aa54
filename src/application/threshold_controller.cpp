/**
 * @file threshold_controller.cpp
 * @brief Implementation of the adaptive threshold controller
 */

#include "application/threshold_controller.h"
#include "peripheral/logger.h"

#include <algorithm>

namespace {

double meanOf(const std::deque<double>& values, double fallback) {
    if (values.empty()) {
        return fallback;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / (double)values.size();
}

void pushBounded(std::deque<double>& values, double value, size_t limit) {
    values.push_back(value);
    while (values.size() > limit) {
        values.pop_front();
    }
}

} // namespace

double ThresholdState::rollingRatio() const {
    return meanOf(recentRatios, targetRatio);
}

double ThresholdState::rollingError() const {
    return meanOf(recentErrors, 0.0);
}

ThresholdState initialThresholdState(const ControllerConfig& config) {
    ThresholdState state;
    state.threshold = std::min(config.maxThreshold,
                               std::max(config.minThreshold, config.initialThreshold));
    state.targetRatio = config.targetRatio;
    return state;
}

ThresholdState advanceThreshold(const ThresholdState& state,
                                const ThresholdObservation& observation,
                                const ControllerConfig& config) {
    ThresholdState next = state;
    size_t limit = std::max<size_t>(1, config.historyLength);

    // Raw payload is stored for unmatched windows, so they add no error
    double windowError = observation.matched ? observation.distance : 0.0;

    pushBounded(next.recentRatios, observation.ratio, limit);
    pushBounded(next.recentErrors, windowError, limit);
    next.errorAccumulator += windowError;
    next.observations++;
    next.lastAdjustment = ThresholdAdjustment::HOLD;

    if (!config.adaptive || next.observations <= config.warmupWindows) {
        return next;
    }

    double rollingError = next.rollingError();
    double rollingRatio = next.rollingRatio();
    double lowerBand = next.targetRatio * (1.0 - config.ratioTolerance);
    double upperBand = next.targetRatio * (1.0 + config.ratioTolerance);

    if (rollingError > config.errorBudget) {
        next.threshold -= config.thresholdStep;
        next.lastAdjustment = ThresholdAdjustment::LOWER_FOR_ERROR;
    } else if (rollingRatio < lowerBand) {
        next.threshold += config.thresholdStep;
        next.lastAdjustment = ThresholdAdjustment::RAISE_FOR_RATIO;
    } else if (rollingRatio > upperBand) {
        next.threshold -= config.thresholdStep;
        next.lastAdjustment = ThresholdAdjustment::LOWER_FOR_RATIO;
    }

    next.threshold = std::min(config.maxThreshold, std::max(config.minThreshold, next.threshold));
    return next;
}

const char* thresholdAdjustmentName(ThresholdAdjustment adjustment) {
    switch (adjustment) {
        case ThresholdAdjustment::HOLD:            return "hold";
        case ThresholdAdjustment::RAISE_FOR_RATIO: return "raise_for_ratio";
        case ThresholdAdjustment::LOWER_FOR_RATIO: return "lower_for_ratio";
        case ThresholdAdjustment::LOWER_FOR_ERROR: return "lower_for_error";
    }
    return "unknown";
}

ThresholdController::ThresholdController(const ControllerConfig& config)
    : settings(config), current(initialThresholdState(config)) {}

void ThresholdController::observe(const ThresholdObservation& observation) {
    double before = current.threshold;
    current = advanceThreshold(current, observation, settings);
    if (current.threshold != before) {
        LOG_DEBUG(LOG_TAG_THRESH, "threshold %.5f -> %.5f (%s, ratio %.3f, error %.5f)",
                  before, current.threshold,
                  thresholdAdjustmentName(current.lastAdjustment),
                  current.rollingRatio(), current.rollingError());
    }
}
