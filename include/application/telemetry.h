/**
 * @file telemetry.h
 * @brief Sample and window types shared by the engine modules
 *
 * Values of a window are stored row-major: sample i, dimension d lives at
 * values[i * arity + d].
 */

#ifndef TELEMETRY_H
#define TELEMETRY_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

/**
 * @struct Sample
 * @brief One sensor reading of a device
 */
struct Sample {
    std::string deviceId;
    int64_t timestamp = 0;          ///< Milliseconds, strictly increasing per device
    std::vector<double> values;     ///< One value per dimension (fixed arity per session)
};

/**
 * @struct Window
 * @brief Fixed-length slice of one device's samples
 */
struct Window {
    std::string deviceId;
    uint64_t index = 0;             ///< Position of the window in its session
    int64_t startTimestamp = 0;     ///< Timestamp of the first sample
    int64_t endTimestamp = 0;       ///< Timestamp of the last sample
    size_t sampleCount = 0;
    size_t arity = 0;
    std::vector<double> values;

    double at(size_t sample, size_t dimension) const {
        return values[sample * arity + dimension];
    }
};

/**
 * @struct ReconstructedSample
 * @brief One sample of a decompressed series
 */
struct ReconstructedSample {
    int64_t timestamp = 0;
    std::vector<double> values;
};

/**
 * @brief Raw storage cost of a window in bytes (timestamp + values per sample)
 */
inline size_t rawWindowBytes(size_t sampleCount, size_t arity) {
    return sampleCount * (sizeof(int64_t) + arity * sizeof(double));
}

#endif // TELEMETRY_H
