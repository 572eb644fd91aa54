/**
 * @file statistics_manager.h
 * @brief Per-session compression statistics and reporting
 *
 * Tracks hit ratio, byte totals, reconstruction error and the threshold
 * trajectory of one device session. Ratios are kept both ways:
 * academic (compressed / raw, lower is better) and space-saving
 * (raw / compressed, higher is better).
 *
 * @author Team PowerPort
 * @date 2025-10-22
 */

#ifndef STATISTICS_MANAGER_H
#define STATISTICS_MANAGER_H

#include <stdint.h>
#include <stddef.h>
#include <deque>
#include <string>

#include "application/engine_config.h"

/**
 * @struct CompressionStats
 * @brief Counters of one compression session
 */
struct CompressionStats {
    uint64_t windowsProcessed = 0;
    uint64_t referenceCount = 0;
    uint64_t newExemplarCount = 0;
    uint64_t evictions = 0;

    uint64_t rawBytes = 0;          ///< Size model of the raw windows
    uint64_t compressedBytes = 0;   ///< Size model of the emitted records

    double matchedErrorSum = 0.0;   ///< Sum of distances of referenced windows
    double worstMatchedError = 0.0;

    double minThreshold = 0.0;      ///< Threshold range seen over the session
    double maxThreshold = 0.0;
    double finalThreshold = 0.0;

    std::deque<double> hitRatioHistory;     ///< Hit ratio of the latest completed buckets, oldest first
    uint64_t bucketHits = 0;
    uint64_t bucketWindows = 0;
};

/**
 * @class StatisticsManager
 * @brief Accumulates CompressionStats for one device session
 */
class StatisticsManager {
public:
    StatisticsManager(const std::string& deviceId, const StatisticsConfig& config);

    /**
     * @brief Wrap counters collected elsewhere (e.g. a finished session) for reporting
     */
    StatisticsManager(const std::string& deviceId, const StatisticsConfig& config,
                      const CompressionStats& snapshot);

    /**
     * @brief Record the outcome of one window
     *
     * @param matched Window was encoded as a reference
     * @param distance Distance to the referenced exemplar (ignored unless matched)
     * @param rawBytes Raw size of the window
     * @param recordBytes Size of the emitted record
     * @param threshold Threshold in effect for this window
     */
    void recordWindow(bool matched, double distance, size_t rawBytes,
                      size_t recordBytes, double threshold);

    void recordEviction();

    /**
     * @brief Threshold after the controller has seen the latest window
     */
    void recordThreshold(double threshold);

    double hitRatio() const;
    double academicRatio() const;
    double spaceSavingRatio() const;
    double meanError() const;

    /**
     * @brief Cost score w1 * min(1, err / maxErr) - w2 * (1 - min(1, 1 / ratio))
     *
     * Lower is better; -w2 is the best reachable score.
     */
    double costScore() const;

    const CompressionStats& getStats() const { return stats; }
    const std::string& deviceId() const { return device; }

    /**
     * @brief Log the full session report under the STATS tag
     */
    void printPerformanceReport() const;

    /**
     * @brief Log a one-line session summary
     */
    void printCompactSummary() const;

private:
    std::string device;
    StatisticsConfig settings;
    CompressionStats stats;
};

#endif // STATISTICS_MANAGER_H
