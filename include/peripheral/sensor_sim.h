/**
 * @file sensor_sim.h
 * @brief Deterministic multi-dimensional sensor signal for demos and tests
 *
 * The simulator emits the signal one window at a time. With probability
 * duplicateFraction a window repeats one of a small library of base
 * patterns plus bounded noise (a near-duplicate); otherwise it is a fresh
 * random shape that matches nothing seen before. The noise amplitude of each
 * near-duplicate is drawn from [0, noiseAmplitude], so distances to the
 * matching exemplar are spread over a continuous range and the acceptance
 * threshold controls the hit ratio smoothly.
 *
 * Identical seeds give identical sequences.
 */

#ifndef SENSOR_SIM_H
#define SENSOR_SIM_H

#include <stdint.h>
#include <random>
#include <string>
#include <vector>

#include "application/telemetry.h"

/**
 * @struct SensorSimConfig
 * @brief Shape of the simulated signal
 */
struct SensorSimConfig {
    size_t windowLength = 16;       ///< Samples per generated window
    size_t arity = 1;               ///< Values per sample
    int64_t startTimestamp = 0;     ///< Timestamp of the first sample (ms)
    int64_t periodMs = 1000;        ///< Regular sampling period
    size_t patternCount = 8;        ///< Size of the base pattern library
    double duplicateFraction = 0.8; ///< Share of near-duplicate windows
    double noiseAmplitude = 0.2;    ///< Upper bound of the per-window noise amplitude
    double baseline = 0.0;          ///< Offset added to every value
    uint64_t seed = 1;
};

class SensorSim {
public:
    SensorSim(const std::string& deviceId, const SensorSimConfig& config);

    /**
     * @brief Samples of the next window
     */
    std::vector<Sample> nextWindow();

    /**
     * @brief Samples of the next `windowCount` windows, in order
     */
    std::vector<Sample> generate(size_t windowCount);

    uint64_t windowsGenerated() const { return windows; }
    uint64_t duplicatesGenerated() const { return duplicates; }
    const std::string& deviceId() const { return device; }

private:
    double uniform(double a, double b);

    std::string device;
    SensorSimConfig settings;
    std::mt19937_64 rng;
    std::vector<std::vector<double>> patterns;  // row-major windowLength x arity
    int64_t nextTimestamp;
    uint64_t windows = 0;
    uint64_t duplicates = 0;
};

#endif // SENSOR_SIM_H
