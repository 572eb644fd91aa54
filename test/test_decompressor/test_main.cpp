/**
 * @file test_main.cpp
 * @brief Unit tests for record replay
 *
 * Test Coverage:
 * 1. Reference resolution and timestamp spreading
 * 2. Dangling references, slot mismatches and ordering faults
 * 3. Payload shape checks
 * 4. Compression/decompression pool trajectories match
 */

#include <unity.h>

#include <stdint.h>

#include "application/compressor.h"
#include "application/decompressor.h"
#include "peripheral/logger.h"
#include "peripheral/sensor_sim.h"

#define ASSERT_FAULT(expected, fault) \
    TEST_ASSERT_EQUAL_STRING(faultKindName(expected), faultKindName((fault).kind))

static NewExemplarRecord exemplarRecord(uint32_t slot, int64_t start, int64_t end,
                                        const std::vector<double>& values) {
    NewExemplarRecord record;
    record.slotIndex = slot;
    record.windowStartTimestamp = start;
    record.windowEndTimestamp = end;
    record.sampleCount = (uint32_t)values.size();
    record.arity = 1;
    record.rawValues = values;
    return record;
}

static ReferenceRecord referenceRecord(uint32_t slot, int64_t start, int64_t end) {
    ReferenceRecord record;
    record.slotIndex = slot;
    record.windowStartTimestamp = start;
    record.windowEndTimestamp = end;
    return record;
}

void setUp(void) {
    setLogLevel(LOG_LEVEL_WARN);
}

void tearDown(void) {}

// ==================== TEST CASES ====================

void test_reference_repeats_exemplar_values(void) {
    Decompressor decompressor("replay", 2);
    std::vector<CompressedRecord> records;
    records.push_back(exemplarRecord(0, 0, 30, {1.0, 2.0, 3.0, 4.0}));
    records.push_back(referenceRecord(0, 100, 130));

    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.applyAll(records, out).ok());
    TEST_ASSERT_TRUE(decompressor.close().ok());

    TEST_ASSERT_EQUAL(8, out.size());
    TEST_ASSERT_EQUAL(100, (int)out[4].timestamp);
    TEST_ASSERT_EQUAL(110, (int)out[5].timestamp);
    TEST_ASSERT_EQUAL(130, (int)out[7].timestamp);
    TEST_ASSERT_TRUE(out[6].values[0] == 3.0);
    TEST_ASSERT_EQUAL(1, (int)decompressor.referencesResolved());
    TEST_ASSERT_EQUAL(1, (int)decompressor.pool().get(0)->useCount);
}

void test_single_sample_window_uses_start_timestamp(void) {
    Decompressor decompressor("single", 2);
    std::vector<ReconstructedSample> out;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.apply(exemplarRecord(0, 500, 500, {7.0}), out).ok());
    TEST_ASSERT_EQUAL(1, out.size());
    TEST_ASSERT_EQUAL(500, (int)out[0].timestamp);
}

void test_uneven_span_is_spread_evenly(void) {
    Decompressor decompressor("spread", 2);
    std::vector<ReconstructedSample> out;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.apply(exemplarRecord(0, 0, 100, {0.0, 0.0, 0.0}), out).ok());
    TEST_ASSERT_EQUAL(0, (int)out[0].timestamp);
    TEST_ASSERT_EQUAL(50, (int)out[1].timestamp);
    TEST_ASSERT_EQUAL(100, (int)out[2].timestamp);
}

void test_full_int64_span_is_spread_without_overflow(void) {
    Decompressor decompressor("extremes", 2);
    std::vector<ReconstructedSample> out;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.apply(
        exemplarRecord(0, INT64_MIN, INT64_MAX, {1.0, 2.0, 3.0, 4.0}), out).ok());

    // (2^64 - 1) / 3 per step
    TEST_ASSERT_EQUAL(4, out.size());
    TEST_ASSERT_TRUE(out[0].timestamp == INT64_MIN);
    TEST_ASSERT_TRUE(out[1].timestamp == INT64_MIN + (int64_t)6148914691236517205LL);
    TEST_ASSERT_TRUE(out[2].timestamp == INT64_MAX - (int64_t)6148914691236517205LL);
    TEST_ASSERT_TRUE(out[3].timestamp == INT64_MAX);
}

void test_extreme_timestamps_round_trip(void) {
    EngineConfig config;
    config.windowLength = 3;
    config.poolCapacity = 4;

    std::vector<Sample> samples(3);
    const int64_t stamps[3] = {INT64_MIN + 1, 0, INT64_MAX};
    for (size_t i = 0; i < samples.size(); i++) {
        samples[i].deviceId = "edge";
        samples[i].timestamp = stamps[i];
        samples[i].values = {(double)i};
    }

    VectorRecordSink sink;
    Compressor compressor("edge", config, sink);
    TEST_ASSERT_TRUE(compressor.open().ok());
    TEST_ASSERT_TRUE(compressor.pushBatch(samples).ok());
    TEST_ASSERT_TRUE(compressor.close().ok());
    TEST_ASSERT_EQUAL(1, sink.size());

    Decompressor decompressor("edge", config.poolCapacity);
    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.applyAll(sink.all(), out).ok());
    TEST_ASSERT_TRUE(decompressor.close().ok());

    TEST_ASSERT_EQUAL(3, out.size());
    for (size_t i = 0; i < out.size(); i++) {
        TEST_ASSERT_TRUE(out[i].timestamp == stamps[i]);
        TEST_ASSERT_TRUE(out[i].values[0] == (double)i);
    }
}

void test_reference_to_empty_slot_is_dangling(void) {
    Decompressor decompressor("dangling", 2);
    std::vector<CompressedRecord> records;
    records.push_back(exemplarRecord(0, 0, 30, {1.0, 2.0, 3.0, 4.0}));
    records.push_back(referenceRecord(1, 100, 130));

    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    EngineFault fault = decompressor.applyAll(records, out);

    ASSERT_FAULT(FaultKind::DANGLING_REFERENCE, fault);
    TEST_ASSERT_EQUAL_STRING("dangling", fault.deviceId.c_str());
    TEST_ASSERT_EQUAL(1, (int)fault.index);
    TEST_ASSERT_EQUAL(4, out.size());
    TEST_ASSERT_EQUAL_STRING(sessionStateName(SessionState::FAULTED),
                             sessionStateName(decompressor.state()));

    // Nothing further is accepted
    ASSERT_FAULT(FaultKind::INVALID_SESSION_STATE,
                 decompressor.apply(referenceRecord(0, 200, 230), out));
}

void test_reference_to_evicted_exemplar_is_dangling(void) {
    Decompressor decompressor("evicted", 1);
    std::vector<CompressedRecord> records;
    records.push_back(exemplarRecord(0, 0, 30, {1.0, 2.0, 3.0, 4.0}));
    records.push_back(exemplarRecord(0, 100, 130, {5.0, 6.0, 7.0, 8.0}));
    records.push_back(referenceRecord(0, 200, 230));
    records.push_back(referenceRecord(1, 300, 330));

    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    EngineFault fault = decompressor.applyAll(records, out);
    ASSERT_FAULT(FaultKind::DANGLING_REFERENCE, fault);
    TEST_ASSERT_EQUAL(3, (int)fault.index);
    // The reference at 200 resolved to the second exemplar
    TEST_ASSERT_TRUE(out[8].values[0] == 5.0);
}

void test_insertion_on_wrong_slot_is_rejected(void) {
    Decompressor decompressor("mismatch", 4);
    std::vector<ReconstructedSample> out;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    EngineFault fault = decompressor.apply(exemplarRecord(2, 0, 30, {1.0, 2.0, 3.0, 4.0}), out);
    ASSERT_FAULT(FaultKind::SLOT_MISMATCH, fault);
    TEST_ASSERT_TRUE(out.empty());
}

void test_overlapping_windows_rejected(void) {
    Decompressor decompressor("overlap", 4);
    std::vector<CompressedRecord> records;
    records.push_back(exemplarRecord(0, 0, 30, {1.0, 2.0, 3.0, 4.0}));
    records.push_back(referenceRecord(0, 30, 60));

    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    ASSERT_FAULT(FaultKind::MALFORMED_INPUT_ORDER, decompressor.applyAll(records, out));
}

void test_inverted_window_rejected(void) {
    Decompressor decompressor("inverted", 4);
    std::vector<ReconstructedSample> out;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    ASSERT_FAULT(FaultKind::MALFORMED_INPUT_ORDER,
                 decompressor.apply(exemplarRecord(0, 30, 0, {1.0, 2.0}), out));
}

void test_payload_shape_checked(void) {
    Decompressor decompressor("shape", 4);
    std::vector<ReconstructedSample> out;

    NewExemplarRecord record = exemplarRecord(0, 0, 30, {1.0, 2.0, 3.0, 4.0});
    record.arity = 2;
    record.sampleCount = 4;

    TEST_ASSERT_TRUE(decompressor.open().ok());
    ASSERT_FAULT(FaultKind::CODEC_ERROR, decompressor.apply(record, out));
}

void test_zero_capacity_fails_at_open(void) {
    Decompressor decompressor("no-pool", 0);
    ASSERT_FAULT(FaultKind::POOL_INSERT_FAILURE, decompressor.open());
}

void test_oversized_capacity_fails_at_open(void) {
    Decompressor decompressor("big-pool", (size_t)ENGINE_MAX_POOL_CAPACITY + 1);
    ASSERT_FAULT(FaultKind::INVALID_CONFIG, decompressor.open());
    TEST_ASSERT_EQUAL_STRING("FAULTED", sessionStateName(decompressor.state()));
}

void test_apply_before_open_rejected(void) {
    Decompressor decompressor("closed", 2);
    std::vector<ReconstructedSample> out;
    ASSERT_FAULT(FaultKind::INVALID_SESSION_STATE,
                 decompressor.apply(exemplarRecord(0, 0, 0, {1.0}), out));
}

void test_pool_trajectories_match(void) {
    EngineConfig config;
    config.windowLength = 6;
    config.poolCapacity = 4;
    config.controller.initialThreshold = 0.04;

    SensorSimConfig simConfig;
    simConfig.windowLength = 6;
    simConfig.arity = 2;
    simConfig.duplicateFraction = 0.6;
    simConfig.seed = 2024;
    std::vector<Sample> samples = SensorSim("trajectory", simConfig).generate(500);

    VectorRecordSink sink;
    Compressor compressor("trajectory", config, sink);
    TEST_ASSERT_TRUE(compressor.open().ok());
    TEST_ASSERT_TRUE(compressor.pushBatch(samples).ok());

    Decompressor decompressor("trajectory", config.poolCapacity);
    std::vector<ReconstructedSample> out;
    TEST_ASSERT_TRUE(decompressor.open().ok());
    TEST_ASSERT_TRUE(decompressor.applyAll(sink.all(), out).ok());

    TEST_ASSERT_GREATER_THAN(0, (int)compressor.pool().evictions());
    TEST_ASSERT_EQUAL((int)compressor.pool().evictions(), (int)decompressor.pool().evictions());
    TEST_ASSERT_EQUAL(compressor.pool().size(), decompressor.pool().size());

    std::vector<const Exemplar*> left = compressor.pool().live();
    std::vector<const Exemplar*> right = decompressor.pool().live();
    for (size_t i = 0; i < left.size(); i++) {
        TEST_ASSERT_EQUAL_UINT32(left[i]->slotIndex, right[i]->slotIndex);
        TEST_ASSERT_EQUAL((int)left[i]->startTimestamp, (int)right[i]->startTimestamp);
        TEST_ASSERT_EQUAL((int)left[i]->lastUsedTimestamp, (int)right[i]->lastUsedTimestamp);
        TEST_ASSERT_EQUAL((int)left[i]->useCount, (int)right[i]->useCount);
        TEST_ASSERT_TRUE(left[i]->values == right[i]->values);
    }

    TEST_ASSERT_EQUAL(samples.size(), out.size());
    for (size_t i = 0; i < samples.size(); i++) {
        TEST_ASSERT_TRUE(samples[i].timestamp == out[i].timestamp);
    }

    TEST_ASSERT_TRUE(compressor.close().ok());
    TEST_ASSERT_TRUE(decompressor.close().ok());
}

// ==================== MAIN ====================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_reference_repeats_exemplar_values);
    RUN_TEST(test_single_sample_window_uses_start_timestamp);
    RUN_TEST(test_uneven_span_is_spread_evenly);
    RUN_TEST(test_full_int64_span_is_spread_without_overflow);
    RUN_TEST(test_extreme_timestamps_round_trip);

    RUN_TEST(test_reference_to_empty_slot_is_dangling);
    RUN_TEST(test_reference_to_evicted_exemplar_is_dangling);
    RUN_TEST(test_insertion_on_wrong_slot_is_rejected);
    RUN_TEST(test_overlapping_windows_rejected);
    RUN_TEST(test_inverted_window_rejected);
    RUN_TEST(test_payload_shape_checked);
    RUN_TEST(test_zero_capacity_fails_at_open);
    RUN_TEST(test_oversized_capacity_fails_at_open);
    RUN_TEST(test_apply_before_open_rejected);

    RUN_TEST(test_pool_trajectories_match);

    return UNITY_END();
}
