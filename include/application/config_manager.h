/**
 * @file config_manager.h
 * @brief Engine configuration loading, validation and reporting
 *
 * Configuration documents are JSON objects; every key is optional and a
 * missing key keeps the EngineConfig default:
 *
 * {
 *   "window_length": 16, "arity": 0, "pool_capacity": 64,
 *   "trailing_mode": "flush" | "buffer",
 *   "similarity": { "metric": "mean_absolute" | "root_mean_square",
 *                   "value_scale": 1.0, "dimension_weights": [1.0, ...] },
 *   "controller": { "initial_threshold", "min_threshold", "max_threshold",
 *                   "target_ratio", "error_budget", "threshold_step",
 *                   "ratio_tolerance", "history_length", "warmup_windows",
 *                   "adaptive" },
 *   "statistics": { "hit_ratio_window", "hit_ratio_history", "cost_weight_error",
 *                   "cost_weight_ratio", "max_acceptable_error" }
 * }
 *
 * @author Team PowerPort
 * @date 2025-10-22
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <string>

#include "application/engine_config.h"
#include "application/engine_fault.h"

/**
 * @class ConfigManager
 * @brief Static helpers for EngineConfig documents
 */
class ConfigManager {
public:
    /**
     * @brief Parse a JSON configuration document
     *
     * @param json Document text
     * @param config Output: defaults overridden by the document (untouched on failure)
     * @return INVALID_CONFIG on syntax, type or range errors
     */
    static EngineFault loadFromJson(const std::string& json, EngineConfig& config);

    /**
     * @brief Read and parse a JSON configuration file
     *
     * @param path File path
     * @param config Output configuration (untouched on failure)
     * @return INVALID_CONFIG if the file cannot be read or parsed
     */
    static EngineFault loadFromFile(const std::string& path, EngineConfig& config);

    /**
     * @brief Check value ranges and cross-field constraints
     *
     * Zero pool capacity is accepted here; sessions report it as
     * POOL_INSERT_FAILURE when they open.
     */
    static EngineFault validate(const EngineConfig& config);

    /**
     * @brief Serialize a configuration to the same JSON schema
     */
    static std::string toJson(const EngineConfig& config);

    /**
     * @brief Log the configuration line by line under the CONFIG tag
     */
    static void printConfig(const EngineConfig& config);

    static const char* trailingModeName(TrailingWindowMode mode);
    static const char* metricName(DistanceMetric metric);

private:
    // Prevent instantiation
    ConfigManager() = delete;
    ~ConfigManager() = delete;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
};

#endif // CONFIG_MANAGER_H
