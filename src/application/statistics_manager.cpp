/**
 * @file statistics_manager.cpp
 * @brief Implementation of per-session statistics
 *
 * @author Team PowerPort
 * @date 2025-10-22
 */

#include "application/statistics_manager.h"
#include "peripheral/logger.h"

#include <stdio.h>

#include <algorithm>

StatisticsManager::StatisticsManager(const std::string& deviceId, const StatisticsConfig& config)
    : device(deviceId), settings(config) {}

StatisticsManager::StatisticsManager(const std::string& deviceId, const StatisticsConfig& config,
                                     const CompressionStats& snapshot)
    : device(deviceId), settings(config), stats(snapshot) {}

void StatisticsManager::recordWindow(bool matched, double distance, size_t rawBytes,
                                     size_t recordBytes, double threshold) {
    if (stats.windowsProcessed == 0) {
        stats.minThreshold = threshold;
        stats.maxThreshold = threshold;
    }
    stats.minThreshold = std::min(stats.minThreshold, threshold);
    stats.maxThreshold = std::max(stats.maxThreshold, threshold);
    stats.finalThreshold = threshold;

    stats.windowsProcessed++;
    stats.rawBytes += rawBytes;
    stats.compressedBytes += recordBytes;

    if (matched) {
        stats.referenceCount++;
        stats.matchedErrorSum += distance;
        stats.worstMatchedError = std::max(stats.worstMatchedError, distance);
        stats.bucketHits++;
    } else {
        stats.newExemplarCount++;
    }

    // Close the hit-ratio bucket every hitRatioWindow windows
    stats.bucketWindows++;
    if (settings.hitRatioWindow > 0 && stats.bucketWindows >= settings.hitRatioWindow) {
        stats.hitRatioHistory.push_back((double)stats.bucketHits / (double)stats.bucketWindows);
        while (stats.hitRatioHistory.size() > std::max<size_t>(1, settings.hitRatioHistoryLength)) {
            stats.hitRatioHistory.pop_front();
        }
        stats.bucketHits = 0;
        stats.bucketWindows = 0;
    }
}

void StatisticsManager::recordEviction() {
    stats.evictions++;
}

void StatisticsManager::recordThreshold(double threshold) {
    if (stats.windowsProcessed == 0) {
        stats.minThreshold = threshold;
        stats.maxThreshold = threshold;
    }
    stats.minThreshold = std::min(stats.minThreshold, threshold);
    stats.maxThreshold = std::max(stats.maxThreshold, threshold);
    stats.finalThreshold = threshold;
}

double StatisticsManager::hitRatio() const {
    if (stats.windowsProcessed == 0) {
        return 0.0;
    }
    return (double)stats.referenceCount / (double)stats.windowsProcessed;
}

double StatisticsManager::academicRatio() const {
    if (stats.rawBytes == 0) {
        return 1.0;
    }
    return (double)stats.compressedBytes / (double)stats.rawBytes;
}

double StatisticsManager::spaceSavingRatio() const {
    if (stats.compressedBytes == 0) {
        return 1.0;
    }
    return (double)stats.rawBytes / (double)stats.compressedBytes;
}

double StatisticsManager::meanError() const {
    if (stats.referenceCount == 0) {
        return 0.0;
    }
    return stats.matchedErrorSum / (double)stats.referenceCount;
}

double StatisticsManager::costScore() const {
    double errorTerm = std::min(1.0, meanError() / settings.maxAcceptableError);
    double ratio = spaceSavingRatio();
    double ratioTerm = ratio > 0.0 ? 1.0 - std::min(1.0, 1.0 / ratio) : 0.0;
    return settings.costWeightError * errorTerm - settings.costWeightRatio * ratioTerm;
}

void StatisticsManager::printPerformanceReport() const {
    LOG_INFO(LOG_TAG_STATS, "========================================");
    LOG_INFO(LOG_TAG_STATS, "  COMPRESSION STATISTICS [%s]", device.c_str());
    LOG_INFO(LOG_TAG_STATS, "========================================");

    LOG_INFO(LOG_TAG_STATS, "  Windows:            %llu", (unsigned long long)stats.windowsProcessed);
    LOG_INFO(LOG_TAG_STATS, "  References:         %llu", (unsigned long long)stats.referenceCount);
    LOG_INFO(LOG_TAG_STATS, "  New exemplars:      %llu", (unsigned long long)stats.newExemplarCount);
    LOG_INFO(LOG_TAG_STATS, "  Evictions:          %llu", (unsigned long long)stats.evictions);
    LOG_INFO(LOG_TAG_STATS, "  Hit ratio:          %.1f%%", hitRatio() * 100.0);

    LOG_INFO(LOG_TAG_STATS, "  Raw bytes:          %llu", (unsigned long long)stats.rawBytes);
    LOG_INFO(LOG_TAG_STATS, "  Compressed bytes:   %llu", (unsigned long long)stats.compressedBytes);
    LOG_INFO(LOG_TAG_STATS, "  Academic ratio:     %.4f (%.1f%% savings)",
             academicRatio(), (1.0 - academicRatio()) * 100.0);
    LOG_INFO(LOG_TAG_STATS, "  Space-saving ratio: %.2f:1", spaceSavingRatio());

    LOG_INFO(LOG_TAG_STATS, "  Mean error:         %.5f (worst %.5f)", meanError(), stats.worstMatchedError);
    LOG_INFO(LOG_TAG_STATS, "  Threshold:          %.5f (range %.5f .. %.5f)",
             stats.finalThreshold, stats.minThreshold, stats.maxThreshold);
    LOG_INFO(LOG_TAG_STATS, "  Cost score:         %.4f", costScore());

    if (!stats.hitRatioHistory.empty()) {
        std::string line;
        for (double ratio : stats.hitRatioHistory) {
            char cell[16];
            snprintf(cell, sizeof(cell), " %.2f", ratio);
            line += cell;
        }
        LOG_INFO(LOG_TAG_STATS, "  Hit ratio per %zu windows (last %zu):%s",
                 settings.hitRatioWindow, stats.hitRatioHistory.size(), line.c_str());
    }
    LOG_INFO(LOG_TAG_STATS, "========================================");
}

void StatisticsManager::printCompactSummary() const {
    LOG_INFO(LOG_TAG_STATS, "[%s] %llu windows | hits %.1f%% | ratio %.2f:1 | err %.5f | thr %.4f",
             device.c_str(),
             (unsigned long long)stats.windowsProcessed,
             hitRatio() * 100.0,
             spaceSavingRatio(),
             meanError(),
             stats.finalThreshold);
}
