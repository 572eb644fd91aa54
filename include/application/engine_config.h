/**
 * @file engine_config.h
 * @brief Configuration surface of the compression engine
 *
 * Plain option structs with working defaults. How the values were obtained
 * (JSON file, code) does not matter to the engine; ConfigManager loads and
 * validates them from JSON.
 *
 * @author Team PowerPort
 * @date 2025-10-22
 */

#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <stddef.h>
#include <vector>

// Upper bounds accepted by validation
#define ENGINE_MAX_WINDOW_LENGTH        65536       // samples per window
#define ENGINE_MAX_ARITY                1024        // values per sample
#define ENGINE_MAX_POOL_CAPACITY        1048576     // exemplars (slot indices are 32-bit)
#define ENGINE_MAX_HISTORY_LENGTH       65536       // controller and statistics histories
#define ENGINE_MAX_COUNT                4294967295.0

/**
 * @brief What happens to a partial window at the end of the input
 */
enum class TrailingWindowMode {
    BUFFER,     ///< Keep pending samples for a later call (streaming)
    FLUSH       ///< Emit them as a short final window (backlog)
};

/**
 * @brief Dissimilarity used to compare a window with an exemplar
 */
enum class DistanceMetric {
    MEAN_ABSOLUTE,      ///< Weighted mean absolute deviation per sample position
    ROOT_MEAN_SQUARE    ///< Weighted root mean square deviation per sample position
};

/**
 * @struct SimilarityConfig
 * @brief Parameters of the similarity evaluator
 */
struct SimilarityConfig {
    DistanceMetric metric = DistanceMetric::MEAN_ABSOLUTE;
    double valueScale = 1.0;                ///< Divides every deviation
    std::vector<double> dimensionWeights;   ///< Empty = weight 1.0 for every dimension
};

/**
 * @struct ControllerConfig
 * @brief Parameters of the adaptive threshold controller
 */
struct ControllerConfig {
    double initialThreshold = 0.05;
    double minThreshold = 0.0;
    double maxThreshold = 1.0;
    double targetRatio = 4.0;       ///< Space-saving ratio (raw / compressed) to track
    double errorBudget = 0.1;       ///< Upper bound on the rolling mean window error
    double thresholdStep = 0.005;   ///< Bounded step applied per window
    double ratioTolerance = 0.05;   ///< Dead band around the target, fraction of target
    size_t historyLength = 8;       ///< K: observations kept for the rolling means
    size_t warmupWindows = 4;       ///< Observations before the first adjustment
    bool adaptive = true;           ///< false holds the threshold at its initial value
};

/**
 * @struct StatisticsConfig
 * @brief Reporting parameters (do not influence compression)
 */
struct StatisticsConfig {
    size_t hitRatioWindow = 10;         ///< Windows per hit-ratio history entry
    size_t hitRatioHistoryLength = 32;  ///< Most recent hit-ratio entries kept
    double costWeightError = 0.6;       ///< w1 of the cost score
    double costWeightRatio = 0.4;       ///< w2 of the cost score
    double maxAcceptableError = 0.15;   ///< Error that saturates the cost score
};

/**
 * @struct EngineConfig
 * @brief Complete per-session configuration
 */
struct EngineConfig {
    size_t windowLength = 16;       ///< W: samples per window
    size_t arity = 0;               ///< Values per sample, 0 = taken from the first sample
    size_t poolCapacity = 64;       ///< Maximum live exemplars per device
    TrailingWindowMode trailingMode = TrailingWindowMode::FLUSH;
    SimilarityConfig similarity;
    ControllerConfig controller;
    StatisticsConfig statistics;
};

#endif // ENGINE_CONFIG_H
