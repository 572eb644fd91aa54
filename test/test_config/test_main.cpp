/**
 * @file test_main.cpp
 * @brief Unit tests for engine configuration loading and validation
 *
 * Test Coverage:
 * 1. Defaults and fully specified documents
 * 2. Partial documents keep defaults
 * 3. Syntax, type and range errors
 * 4. toJson / loadFromJson equivalence
 * 5. Rejected documents leave the configuration untouched
 * 6. Size limits on windows, pools and histories
 */

#include <unity.h>

#include <stdio.h>
#include <string>

#include "application/compressor.h"
#include "application/config_manager.h"
#include "application/engine_config.h"
#include "peripheral/logger.h"

#define ASSERT_FAULT(expected, fault) \
    TEST_ASSERT_EQUAL_STRING(faultKindName(expected), faultKindName((fault).kind))

void setUp(void) {
    setLogLevel(LOG_LEVEL_ERROR);
}

void tearDown(void) {}

// ==================== TEST CASES ====================

void test_defaults_are_valid(void) {
    EngineConfig config;
    TEST_ASSERT_TRUE(ConfigManager::validate(config).ok());
    TEST_ASSERT_EQUAL(16, config.windowLength);
    TEST_ASSERT_EQUAL(64, config.poolCapacity);
    TEST_ASSERT_EQUAL_STRING("FLUSH", ConfigManager::trailingModeName(config.trailingMode));
    TEST_ASSERT_EQUAL_STRING("MEAN_ABSOLUTE", ConfigManager::metricName(config.similarity.metric));
}

void test_full_document(void) {
    const char* json =
        "{\"window_length\": 32, \"arity\": 2, \"pool_capacity\": 128,"
        " \"trailing_mode\": \"buffer\","
        " \"similarity\": {\"metric\": \"root_mean_square\", \"value_scale\": 10,"
        "                  \"dimension_weights\": [1.0, 0.5]},"
        " \"controller\": {\"initial_threshold\": 0.2, \"min_threshold\": 0.1,"
        "                  \"max_threshold\": 0.9, \"target_ratio\": 5,"
        "                  \"error_budget\": 0.05, \"threshold_step\": 0.01,"
        "                  \"ratio_tolerance\": 0.1, \"history_length\": 12,"
        "                  \"warmup_windows\": 2, \"adaptive\": false},"
        " \"statistics\": {\"hit_ratio_window\": 20, \"cost_weight_error\": 0.5,"
        "                  \"cost_weight_ratio\": 0.5, \"max_acceptable_error\": 0.3}}";

    EngineConfig config;
    TEST_ASSERT_TRUE(ConfigManager::loadFromJson(json, config).ok());

    TEST_ASSERT_EQUAL(32, config.windowLength);
    TEST_ASSERT_EQUAL(2, config.arity);
    TEST_ASSERT_EQUAL(128, config.poolCapacity);
    TEST_ASSERT_EQUAL_STRING("BUFFER", ConfigManager::trailingModeName(config.trailingMode));
    TEST_ASSERT_EQUAL_STRING("ROOT_MEAN_SQUARE", ConfigManager::metricName(config.similarity.metric));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 10.0, config.similarity.valueScale);
    TEST_ASSERT_EQUAL(2, config.similarity.dimensionWeights.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.5, config.similarity.dimensionWeights[1]);

    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.2, config.controller.initialThreshold);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.1, config.controller.minThreshold);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.9, config.controller.maxThreshold);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 5.0, config.controller.targetRatio);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.05, config.controller.errorBudget);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.01, config.controller.thresholdStep);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.1, config.controller.ratioTolerance);
    TEST_ASSERT_EQUAL(12, config.controller.historyLength);
    TEST_ASSERT_EQUAL(2, config.controller.warmupWindows);
    TEST_ASSERT_FALSE(config.controller.adaptive);

    TEST_ASSERT_EQUAL(20, config.statistics.hitRatioWindow);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.3, config.statistics.maxAcceptableError);
}

void test_partial_document_keeps_defaults(void) {
    EngineConfig config;
    TEST_ASSERT_TRUE(ConfigManager::loadFromJson(
        "{\"pool_capacity\": 8, \"controller\": {\"target_ratio\": 2.5}}", config).ok());

    EngineConfig defaults;
    TEST_ASSERT_EQUAL(8, config.poolCapacity);
    TEST_ASSERT_EQUAL(defaults.windowLength, config.windowLength);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 2.5, config.controller.targetRatio);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, defaults.controller.initialThreshold,
                             config.controller.initialThreshold);
    TEST_ASSERT_EQUAL(defaults.controller.historyLength, config.controller.historyLength);
}

void test_syntax_error_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"window_length\": 16,", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG, ConfigManager::loadFromJson("[1, 2, 3]", config));
}

void test_wrong_types_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"window_length\": \"sixteen\"}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"pool_capacity\": 4.5}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"controller\": 3}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"controller\": {\"adaptive\": 1}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"similarity\": {\"metric\": \"cosine\"}}", config));
}

void test_range_errors_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"window_length\": 0}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson(
                     "{\"controller\": {\"min_threshold\": 0.5, \"max_threshold\": 0.2}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson(
                     "{\"controller\": {\"initial_threshold\": 2.0}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"controller\": {\"target_ratio\": 0}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"controller\": {\"history_length\": 0}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"similarity\": {\"value_scale\": -1}}", config));
}

void test_weights_must_match_arity(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson(
                     "{\"arity\": 3, \"similarity\": {\"dimension_weights\": [1, 1]}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson(
                     "{\"similarity\": {\"dimension_weights\": [0, 0]}}", config));
    TEST_ASSERT_TRUE(ConfigManager::loadFromJson(
        "{\"arity\": 2, \"similarity\": {\"dimension_weights\": [0, 2]}}", config).ok());
}

void test_unknown_trailing_mode_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"trailing_mode\": \"drop\"}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"trailing_mode\": 1}", config));
}

void test_rejected_document_leaves_config_untouched(void) {
    EngineConfig config;
    config.windowLength = 24;
    config.controller.targetRatio = 6.0;

    EngineFault fault = ConfigManager::loadFromJson(
        "{\"window_length\": 8, \"controller\": {\"target_ratio\": -1}}", config);

    ASSERT_FAULT(FaultKind::INVALID_CONFIG, fault);
    TEST_ASSERT_EQUAL(24, config.windowLength);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 6.0, config.controller.targetRatio);
}

void test_to_json_round_trip(void) {
    EngineConfig original;
    original.windowLength = 12;
    original.arity = 2;
    original.poolCapacity = 40;
    original.trailingMode = TrailingWindowMode::BUFFER;
    original.similarity.metric = DistanceMetric::ROOT_MEAN_SQUARE;
    original.similarity.dimensionWeights = {2.0, 0.25};
    original.controller.initialThreshold = 0.125;
    original.controller.targetRatio = 3.5;
    original.controller.adaptive = false;
    original.statistics.hitRatioWindow = 7;

    EngineConfig loaded;
    TEST_ASSERT_TRUE(ConfigManager::loadFromJson(ConfigManager::toJson(original), loaded).ok());

    TEST_ASSERT_EQUAL(12, loaded.windowLength);
    TEST_ASSERT_EQUAL(2, loaded.arity);
    TEST_ASSERT_EQUAL(40, loaded.poolCapacity);
    TEST_ASSERT_EQUAL_STRING("BUFFER", ConfigManager::trailingModeName(loaded.trailingMode));
    TEST_ASSERT_EQUAL_STRING("ROOT_MEAN_SQUARE", ConfigManager::metricName(loaded.similarity.metric));
    TEST_ASSERT_EQUAL(2, loaded.similarity.dimensionWeights.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.25, loaded.similarity.dimensionWeights[1]);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.125, loaded.controller.initialThreshold);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 3.5, loaded.controller.targetRatio);
    TEST_ASSERT_FALSE(loaded.controller.adaptive);
    TEST_ASSERT_EQUAL(7, loaded.statistics.hitRatioWindow);
}

void test_load_from_file(void) {
    const char* path = "telesqueeze_test_config.json";
    FILE* file = fopen(path, "w");
    TEST_ASSERT_NOT_NULL(file);
    fputs("{\"window_length\": 20, \"pool_capacity\": 5}", file);
    fclose(file);

    EngineConfig config;
    EngineFault fault = ConfigManager::loadFromFile(path, config);
    remove(path);

    TEST_ASSERT_TRUE(fault.ok());
    TEST_ASSERT_EQUAL(20, config.windowLength);
    TEST_ASSERT_EQUAL(5, config.poolCapacity);
}

void test_missing_file_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromFile("does/not/exist/engine.json", config));
    TEST_ASSERT_EQUAL(16, config.windowLength);
}

void test_oversized_counts_rejected(void) {
    EngineConfig config;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"window_length\": 1e15}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"window_length\": 1e20}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"pool_capacity\": 5000000000}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"arity\": 100000}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"controller\": {\"history_length\": 1e9}}", config));
    ASSERT_FAULT(FaultKind::INVALID_CONFIG,
                 ConfigManager::loadFromJson("{\"statistics\": {\"hit_ratio_history\": 0}}", config));
    TEST_ASSERT_EQUAL(16, config.windowLength);

    TEST_ASSERT_TRUE(ConfigManager::loadFromJson(
        "{\"window_length\": 65536, \"pool_capacity\": 1048576}", config).ok());
}

void test_validate_enforces_limits_set_in_code(void) {
    EngineConfig config;
    config.windowLength = (size_t)1000000000000000ULL;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG, ConfigManager::validate(config));

    config = EngineConfig();
    config.poolCapacity = ENGINE_MAX_POOL_CAPACITY + 1;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG, ConfigManager::validate(config));

    config = EngineConfig();
    config.controller.historyLength = ENGINE_MAX_HISTORY_LENGTH + 1;
    ASSERT_FAULT(FaultKind::INVALID_CONFIG, ConfigManager::validate(config));
}

void test_huge_window_fails_at_open_without_allocating(void) {
    EngineConfig config;
    config.windowLength = (size_t)1000000000000000ULL;

    VectorRecordSink sink;
    Compressor compressor("huge", config, sink);
    EngineFault fault = compressor.open();

    ASSERT_FAULT(FaultKind::INVALID_CONFIG, fault);
    TEST_ASSERT_EQUAL_STRING("huge", fault.deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING("FAULTED", sessionStateName(compressor.state()));
}

// ==================== MAIN ====================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_defaults_are_valid);
    RUN_TEST(test_full_document);
    RUN_TEST(test_partial_document_keeps_defaults);

    RUN_TEST(test_syntax_error_rejected);
    RUN_TEST(test_wrong_types_rejected);
    RUN_TEST(test_range_errors_rejected);
    RUN_TEST(test_weights_must_match_arity);
    RUN_TEST(test_unknown_trailing_mode_rejected);
    RUN_TEST(test_rejected_document_leaves_config_untouched);
    RUN_TEST(test_oversized_counts_rejected);
    RUN_TEST(test_validate_enforces_limits_set_in_code);
    RUN_TEST(test_huge_window_fails_at_open_without_allocating);

    RUN_TEST(test_to_json_round_trip);
    RUN_TEST(test_load_from_file);
    RUN_TEST(test_missing_file_rejected);

    return UNITY_END();
}
