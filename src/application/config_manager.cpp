/**
 * @file config_manager.cpp
 * @brief Implementation of engine configuration management
 *
 * @author Team PowerPort
 * @date 2025-10-22
 */

#include "application/config_manager.h"
#include "peripheral/logger.h"

#include <ArduinoJson.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace {

EngineFault configFault(const std::string& description) {
    return EngineFault::make(FaultKind::INVALID_CONFIG, "", 0, description);
}

// Optional numeric field: absent keeps `out`, present must be a number
EngineFault readNumber(JsonObjectConst obj, const char* key, double& out) {
    if (!obj.containsKey(key)) {
        return EngineFault::none();
    }
    JsonVariantConst value = obj[key];
    if (!value.is<double>()) {
        return configFault(std::string("'") + key + "' must be a number");
    }
    out = value.as<double>();
    if (!std::isfinite(out)) {
        return configFault(std::string("'") + key + "' must be finite");
    }
    return EngineFault::none();
}

// Optional count field: integer in [0, maxValue]; the range check precedes the cast
EngineFault readCount(JsonObjectConst obj, const char* key, size_t& out, double maxValue) {
    double value = (double)out;
    EngineFault fault = readNumber(obj, key, value);
    if (!fault.ok()) {
        return fault;
    }
    if (value < 0.0 || std::floor(value) != value) {
        return configFault(std::string("'") + key + "' must be a non-negative integer");
    }
    if (value > maxValue) {
        return configFault(std::string("'") + key + "' exceeds " + std::to_string((uint64_t)maxValue));
    }
    out = (size_t)value;
    return EngineFault::none();
}

EngineFault readFlag(JsonObjectConst obj, const char* key, bool& out) {
    if (!obj.containsKey(key)) {
        return EngineFault::none();
    }
    if (!obj[key].is<bool>()) {
        return configFault(std::string("'") + key + "' must be true or false");
    }
    out = obj[key].as<bool>();
    return EngineFault::none();
}

EngineFault readSection(JsonObjectConst root, const char* key, JsonObjectConst& out) {
    if (!root.containsKey(key)) {
        return EngineFault::none();
    }
    if (!root[key].is<JsonObjectConst>()) {
        return configFault(std::string("'") + key + "' must be an object");
    }
    out = root[key].as<JsonObjectConst>();
    return EngineFault::none();
}

#define RETURN_IF_FAULT(expr) \
    do { \
        EngineFault _fault = (expr); \
        if (!_fault.ok()) return _fault; \
    } while (0)

EngineFault parseSimilarity(JsonObjectConst obj, SimilarityConfig& similarity) {
    if (obj.containsKey("metric")) {
        const char* metric = obj["metric"].as<const char*>();
        if (metric == nullptr) {
            return configFault("'metric' must be a string");
        }
        std::string name(metric);
        if (name == "mean_absolute") {
            similarity.metric = DistanceMetric::MEAN_ABSOLUTE;
        } else if (name == "root_mean_square") {
            similarity.metric = DistanceMetric::ROOT_MEAN_SQUARE;
        } else {
            return configFault("unknown metric '" + name + "'");
        }
    }
    RETURN_IF_FAULT(readNumber(obj, "value_scale", similarity.valueScale));

    if (obj.containsKey("dimension_weights")) {
        if (!obj["dimension_weights"].is<JsonArrayConst>()) {
            return configFault("'dimension_weights' must be an array");
        }
        std::vector<double> weights;
        for (JsonVariantConst weight : obj["dimension_weights"].as<JsonArrayConst>()) {
            if (!weight.is<double>()) {
                return configFault("'dimension_weights' entries must be numbers");
            }
            weights.push_back(weight.as<double>());
        }
        similarity.dimensionWeights = weights;
    }
    return EngineFault::none();
}

EngineFault parseController(JsonObjectConst obj, ControllerConfig& controller) {
    RETURN_IF_FAULT(readNumber(obj, "initial_threshold", controller.initialThreshold));
    RETURN_IF_FAULT(readNumber(obj, "min_threshold", controller.minThreshold));
    RETURN_IF_FAULT(readNumber(obj, "max_threshold", controller.maxThreshold));
    RETURN_IF_FAULT(readNumber(obj, "target_ratio", controller.targetRatio));
    RETURN_IF_FAULT(readNumber(obj, "error_budget", controller.errorBudget));
    RETURN_IF_FAULT(readNumber(obj, "threshold_step", controller.thresholdStep));
    RETURN_IF_FAULT(readNumber(obj, "ratio_tolerance", controller.ratioTolerance));
    RETURN_IF_FAULT(readCount(obj, "history_length", controller.historyLength, ENGINE_MAX_HISTORY_LENGTH));
    RETURN_IF_FAULT(readCount(obj, "warmup_windows", controller.warmupWindows, ENGINE_MAX_COUNT));
    RETURN_IF_FAULT(readFlag(obj, "adaptive", controller.adaptive));
    return EngineFault::none();
}

EngineFault parseStatistics(JsonObjectConst obj, StatisticsConfig& statistics) {
    RETURN_IF_FAULT(readCount(obj, "hit_ratio_window", statistics.hitRatioWindow, ENGINE_MAX_COUNT));
    RETURN_IF_FAULT(readCount(obj, "hit_ratio_history", statistics.hitRatioHistoryLength,
                              ENGINE_MAX_HISTORY_LENGTH));
    RETURN_IF_FAULT(readNumber(obj, "cost_weight_error", statistics.costWeightError));
    RETURN_IF_FAULT(readNumber(obj, "cost_weight_ratio", statistics.costWeightRatio));
    RETURN_IF_FAULT(readNumber(obj, "max_acceptable_error", statistics.maxAcceptableError));
    return EngineFault::none();
}

EngineFault parseDocument(JsonObjectConst root, EngineConfig& parsed) {
    RETURN_IF_FAULT(readCount(root, "window_length", parsed.windowLength, ENGINE_MAX_WINDOW_LENGTH));
    RETURN_IF_FAULT(readCount(root, "arity", parsed.arity, ENGINE_MAX_ARITY));
    RETURN_IF_FAULT(readCount(root, "pool_capacity", parsed.poolCapacity, ENGINE_MAX_POOL_CAPACITY));

    if (root.containsKey("trailing_mode")) {
        const char* mode = root["trailing_mode"].as<const char*>();
        std::string name = mode ? mode : "";
        if (name == "flush") {
            parsed.trailingMode = TrailingWindowMode::FLUSH;
        } else if (name == "buffer") {
            parsed.trailingMode = TrailingWindowMode::BUFFER;
        } else {
            return configFault("'trailing_mode' must be \"flush\" or \"buffer\"");
        }
    }

    JsonObjectConst section;
    RETURN_IF_FAULT(readSection(root, "similarity", section));
    if (!section.isNull()) {
        RETURN_IF_FAULT(parseSimilarity(section, parsed.similarity));
    }

    section = JsonObjectConst();
    RETURN_IF_FAULT(readSection(root, "controller", section));
    if (!section.isNull()) {
        RETURN_IF_FAULT(parseController(section, parsed.controller));
    }

    section = JsonObjectConst();
    RETURN_IF_FAULT(readSection(root, "statistics", section));
    if (!section.isNull()) {
        RETURN_IF_FAULT(parseStatistics(section, parsed.statistics));
    }

    return ConfigManager::validate(parsed);
}

} // namespace

EngineFault ConfigManager::loadFromJson(const std::string& json, EngineConfig& config) {
    DynamicJsonDocument doc(8192);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        EngineFault fault = configFault(std::string("JSON parse error: ") + error.c_str());
        logFault(LOG_TAG_CONFIG, fault);
        return fault;
    }
    if (!doc.is<JsonObject>()) {
        EngineFault fault = configFault("configuration must be a JSON object");
        logFault(LOG_TAG_CONFIG, fault);
        return fault;
    }

    // Work on a copy so a rejected document leaves the caller's config intact
    EngineConfig parsed = config;
    EngineFault fault = parseDocument(doc.as<JsonObjectConst>(), parsed);
    if (!fault.ok()) {
        logFault(LOG_TAG_CONFIG, fault);
        return fault;
    }

    config = parsed;
    LOG_SUCCESS(LOG_TAG_CONFIG, "Configuration loaded (W=%zu, capacity=%zu)",
                config.windowLength, config.poolCapacity);
    return EngineFault::none();
}

EngineFault ConfigManager::loadFromFile(const std::string& path, EngineConfig& config) {
    std::ifstream in(path);
    if (!in) {
        EngineFault fault = configFault("cannot open configuration file '" + path + "'");
        logFault(LOG_TAG_CONFIG, fault);
        return fault;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    LOG_INFO(LOG_TAG_CONFIG, "Reading configuration from %s", path.c_str());
    return loadFromJson(buffer.str(), config);
}

EngineFault ConfigManager::validate(const EngineConfig& config) {
    const ControllerConfig& ctl = config.controller;
    const SimilarityConfig& sim = config.similarity;

    if (config.windowLength == 0 || config.windowLength > ENGINE_MAX_WINDOW_LENGTH) {
        return configFault("window_length must lie within [1, " +
                           std::to_string(ENGINE_MAX_WINDOW_LENGTH) + "]");
    }
    if (config.arity > ENGINE_MAX_ARITY) {
        return configFault("arity must not exceed " + std::to_string(ENGINE_MAX_ARITY));
    }
    if (config.poolCapacity > ENGINE_MAX_POOL_CAPACITY) {
        return configFault("pool_capacity must not exceed " + std::to_string(ENGINE_MAX_POOL_CAPACITY));
    }
    if (!(sim.valueScale > 0.0)) {
        return configFault("value_scale must be positive");
    }
    if (config.arity != 0 && !sim.dimensionWeights.empty() &&
        sim.dimensionWeights.size() != config.arity) {
        return configFault("dimension_weights must have one entry per dimension");
    }
    bool anyWeight = sim.dimensionWeights.empty();
    for (double weight : sim.dimensionWeights) {
        if (weight < 0.0) {
            return configFault("dimension_weights must be non-negative");
        }
        if (weight > 0.0) {
            anyWeight = true;
        }
    }
    if (!anyWeight) {
        return configFault("at least one dimension weight must be positive");
    }
    if (ctl.minThreshold < 0.0) {
        return configFault("min_threshold must be non-negative");
    }
    if (ctl.minThreshold > ctl.maxThreshold) {
        return configFault("min_threshold must not exceed max_threshold");
    }
    if (ctl.initialThreshold < ctl.minThreshold || ctl.initialThreshold > ctl.maxThreshold) {
        return configFault("initial_threshold must lie within [min_threshold, max_threshold]");
    }
    if (!(ctl.targetRatio > 0.0)) {
        return configFault("target_ratio must be positive");
    }
    if (ctl.errorBudget < 0.0) {
        return configFault("error_budget must be non-negative");
    }
    if (ctl.thresholdStep < 0.0) {
        return configFault("threshold_step must be non-negative");
    }
    if (ctl.ratioTolerance < 0.0 || ctl.ratioTolerance >= 1.0) {
        return configFault("ratio_tolerance must lie within [0, 1)");
    }
    if (ctl.historyLength == 0 || ctl.historyLength > ENGINE_MAX_HISTORY_LENGTH) {
        return configFault("history_length must lie within [1, " +
                           std::to_string(ENGINE_MAX_HISTORY_LENGTH) + "]");
    }
    if (config.statistics.hitRatioWindow == 0) {
        return configFault("hit_ratio_window must be at least 1");
    }
    if (config.statistics.hitRatioHistoryLength == 0 ||
        config.statistics.hitRatioHistoryLength > ENGINE_MAX_HISTORY_LENGTH) {
        return configFault("hit_ratio_history must lie within [1, " +
                           std::to_string(ENGINE_MAX_HISTORY_LENGTH) + "]");
    }
    if (!(config.statistics.maxAcceptableError > 0.0)) {
        return configFault("max_acceptable_error must be positive");
    }
    return EngineFault::none();
}

std::string ConfigManager::toJson(const EngineConfig& config) {
    DynamicJsonDocument doc(4096);

    doc["window_length"] = (uint32_t)config.windowLength;
    doc["arity"] = (uint32_t)config.arity;
    doc["pool_capacity"] = (uint32_t)config.poolCapacity;
    doc["trailing_mode"] = config.trailingMode == TrailingWindowMode::FLUSH ? "flush" : "buffer";

    JsonObject similarity = doc.createNestedObject("similarity");
    similarity["metric"] = config.similarity.metric == DistanceMetric::MEAN_ABSOLUTE
                               ? "mean_absolute" : "root_mean_square";
    similarity["value_scale"] = config.similarity.valueScale;
    JsonArray weights = similarity.createNestedArray("dimension_weights");
    for (double weight : config.similarity.dimensionWeights) {
        weights.add(weight);
    }

    JsonObject controller = doc.createNestedObject("controller");
    controller["initial_threshold"] = config.controller.initialThreshold;
    controller["min_threshold"] = config.controller.minThreshold;
    controller["max_threshold"] = config.controller.maxThreshold;
    controller["target_ratio"] = config.controller.targetRatio;
    controller["error_budget"] = config.controller.errorBudget;
    controller["threshold_step"] = config.controller.thresholdStep;
    controller["ratio_tolerance"] = config.controller.ratioTolerance;
    controller["history_length"] = (uint32_t)config.controller.historyLength;
    controller["warmup_windows"] = (uint32_t)config.controller.warmupWindows;
    controller["adaptive"] = config.controller.adaptive;

    JsonObject statistics = doc.createNestedObject("statistics");
    statistics["hit_ratio_window"] = (uint32_t)config.statistics.hitRatioWindow;
    statistics["hit_ratio_history"] = (uint32_t)config.statistics.hitRatioHistoryLength;
    statistics["cost_weight_error"] = config.statistics.costWeightError;
    statistics["cost_weight_ratio"] = config.statistics.costWeightRatio;
    statistics["max_acceptable_error"] = config.statistics.maxAcceptableError;

    std::string payload;
    serializeJson(doc, payload);
    return payload;
}

void ConfigManager::printConfig(const EngineConfig& config) {
    const ControllerConfig& ctl = config.controller;

    LOG_SECTION("ENGINE CONFIGURATION");
    LOG_INFO(LOG_TAG_CONFIG, "Window length:     %zu samples", config.windowLength);
    LOG_INFO(LOG_TAG_CONFIG, "Arity:             %zu%s", config.arity,
             config.arity == 0 ? " (from first sample)" : "");
    LOG_INFO(LOG_TAG_CONFIG, "Pool capacity:     %zu exemplars", config.poolCapacity);
    LOG_INFO(LOG_TAG_CONFIG, "Trailing window:   %s", trailingModeName(config.trailingMode));
    LOG_INFO(LOG_TAG_CONFIG, "Metric:            %s (scale %.4f)",
             metricName(config.similarity.metric), config.similarity.valueScale);
    LOG_INFO(LOG_TAG_CONFIG, "Threshold:         %.4f in [%.4f, %.4f], step %.4f",
             ctl.initialThreshold, ctl.minThreshold, ctl.maxThreshold, ctl.thresholdStep);
    LOG_INFO(LOG_TAG_CONFIG, "Target ratio:      %.2fx (tolerance %.0f%%)",
             ctl.targetRatio, ctl.ratioTolerance * 100.0);
    LOG_INFO(LOG_TAG_CONFIG, "Error budget:      %.4f over last %zu windows",
             ctl.errorBudget, ctl.historyLength);
    LOG_INFO(LOG_TAG_CONFIG, "Adaptive:          %s (warm-up %zu windows)",
             ctl.adaptive ? "yes" : "no", ctl.warmupWindows);
}

const char* ConfigManager::trailingModeName(TrailingWindowMode mode) {
    switch (mode) {
        case TrailingWindowMode::BUFFER: return "BUFFER";
        case TrailingWindowMode::FLUSH:  return "FLUSH";
    }
    return "UNKNOWN";
}

const char* ConfigManager::metricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::MEAN_ABSOLUTE:    return "MEAN_ABSOLUTE";
        case DistanceMetric::ROOT_MEAN_SQUARE: return "ROOT_MEAN_SQUARE";
    }
    return "UNKNOWN";
}
