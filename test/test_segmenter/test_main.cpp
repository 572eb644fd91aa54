/**
 * @file test_main.cpp
 * @brief Unit tests for the window segmenter
 *
 * Test Coverage:
 * 1. Window emission at W samples
 * 2. Strict timestamp ordering (duplicates, regressions)
 * 3. Device and arity checks
 * 4. Trailing partial window in FLUSH and BUFFER mode
 */

#include <unity.h>

#include "application/window_segmenter.h"

#define ASSERT_FAULT(expected, fault) \
    TEST_ASSERT_EQUAL_STRING(faultKindName(expected), faultKindName((fault).kind))

static Sample makeSample(const char* device, int64_t timestamp, double value) {
    Sample sample;
    sample.deviceId = device;
    sample.timestamp = timestamp;
    sample.values.push_back(value);
    return sample;
}

void setUp(void) {}

void tearDown(void) {}

// ==================== TEST CASES ====================

void test_window_emitted_after_w_samples(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    for (int i = 0; i < 3; i++) {
        EngineFault fault = segmenter.push(makeSample("dev", 100 + i * 10, i), ready, window);
        TEST_ASSERT_TRUE(fault.ok());
        TEST_ASSERT_FALSE(ready);
    }
    TEST_ASSERT_EQUAL(3, segmenter.pendingCount());

    TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", 130, 3.0), ready, window).ok());
    TEST_ASSERT_TRUE(ready);
    TEST_ASSERT_EQUAL(0, segmenter.pendingCount());

    TEST_ASSERT_EQUAL_STRING("dev", window.deviceId.c_str());
    TEST_ASSERT_EQUAL(0, window.index);
    TEST_ASSERT_EQUAL(100, (int)window.startTimestamp);
    TEST_ASSERT_EQUAL(130, (int)window.endTimestamp);
    TEST_ASSERT_EQUAL(4, window.sampleCount);
    TEST_ASSERT_EQUAL(1, window.arity);
    TEST_ASSERT_EQUAL(4, window.values.size());
    TEST_ASSERT_TRUE(window.at(2, 0) == 2.0);
}

void test_window_index_increments(void) {
    WindowSegmenter segmenter("dev", 2, 1, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;
    int emitted = 0;

    for (int i = 0; i < 6; i++) {
        TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", i, i), ready, window).ok());
        if (ready) {
            TEST_ASSERT_EQUAL(emitted, (int)window.index);
            emitted++;
        }
    }
    TEST_ASSERT_EQUAL(3, emitted);
    TEST_ASSERT_EQUAL(3, segmenter.windowsEmitted());
}

void test_multidimensional_values_row_major(void) {
    WindowSegmenter segmenter("dev", 2, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    Sample first;
    first.deviceId = "dev";
    first.timestamp = 1;
    first.values = {1.0, 2.0, 3.0};
    Sample second = first;
    second.timestamp = 2;
    second.values = {4.0, 5.0, 6.0};

    TEST_ASSERT_TRUE(segmenter.push(first, ready, window).ok());
    TEST_ASSERT_TRUE(segmenter.push(second, ready, window).ok());
    TEST_ASSERT_TRUE(ready);
    TEST_ASSERT_EQUAL(3, window.arity);
    TEST_ASSERT_TRUE(window.at(1, 0) == 4.0);
    TEST_ASSERT_TRUE(window.at(0, 2) == 3.0);
}

void test_duplicate_timestamp_rejected(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", 10, 1.0), ready, window).ok());
    EngineFault fault = segmenter.push(makeSample("dev", 10, 2.0), ready, window);

    ASSERT_FAULT(FaultKind::MALFORMED_INPUT_ORDER, fault);
    TEST_ASSERT_EQUAL_STRING("dev", fault.deviceId.c_str());
    TEST_ASSERT_FALSE(ready);
    TEST_ASSERT_EQUAL(1, segmenter.pendingCount());
}

void test_ordering_checked_across_window_boundary(void) {
    WindowSegmenter segmenter("dev", 2, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", 10, 1.0), ready, window).ok());
    TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", 20, 1.0), ready, window).ok());
    TEST_ASSERT_TRUE(ready);

    EngineFault fault = segmenter.push(makeSample("dev", 15, 1.0), ready, window);
    ASSERT_FAULT(FaultKind::MALFORMED_INPUT_ORDER, fault);
    TEST_ASSERT_EQUAL(1, (int)fault.index);
}

void test_foreign_device_rejected(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    EngineFault fault = segmenter.push(makeSample("other", 10, 1.0), ready, window);
    ASSERT_FAULT(FaultKind::DEVICE_MISMATCH, fault);
    TEST_ASSERT_EQUAL(0, segmenter.pendingCount());
}

void test_arity_fixed_by_first_sample(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    Sample wide;
    wide.deviceId = "dev";
    wide.timestamp = 20;
    wide.values = {1.0, 2.0};

    TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", 10, 1.0), ready, window).ok());
    TEST_ASSERT_EQUAL(1, segmenter.arity());
    ASSERT_FAULT(FaultKind::ARITY_MISMATCH, segmenter.push(wide, ready, window));
}

void test_configured_arity_enforced(void) {
    WindowSegmenter segmenter("dev", 4, 2, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    ASSERT_FAULT(FaultKind::ARITY_MISMATCH, segmenter.push(makeSample("dev", 10, 1.0), ready, window));
}

void test_empty_sample_rejected(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    Sample empty;
    empty.deviceId = "dev";
    empty.timestamp = 5;
    ASSERT_FAULT(FaultKind::ARITY_MISMATCH, segmenter.push(empty, ready, window));
}

void test_flush_mode_emits_short_window(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    bool ready = false;
    Window window;

    for (int i = 0; i < 6; i++) {
        TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", i * 10, i), ready, window).ok());
    }

    Window tail;
    TEST_ASSERT_TRUE(segmenter.finish(tail));
    TEST_ASSERT_EQUAL(2, tail.sampleCount);
    TEST_ASSERT_EQUAL(40, (int)tail.startTimestamp);
    TEST_ASSERT_EQUAL(50, (int)tail.endTimestamp);
    TEST_ASSERT_EQUAL(1, (int)tail.index);
    TEST_ASSERT_EQUAL(0, segmenter.pendingCount());

    TEST_ASSERT_FALSE(segmenter.finish(tail));
}

void test_buffer_mode_keeps_pending_samples(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::BUFFER);
    bool ready = false;
    Window window;

    for (int i = 0; i < 6; i++) {
        TEST_ASSERT_TRUE(segmenter.push(makeSample("dev", i * 10, i), ready, window).ok());
    }

    Window tail;
    TEST_ASSERT_FALSE(segmenter.finish(tail));
    TEST_ASSERT_EQUAL(2, segmenter.pendingCount());

    std::vector<Sample> pending = segmenter.takePending();
    TEST_ASSERT_EQUAL(2, pending.size());
    TEST_ASSERT_EQUAL(40, (int)pending[0].timestamp);
    TEST_ASSERT_EQUAL(50, (int)pending[1].timestamp);
    TEST_ASSERT_EQUAL(0, segmenter.pendingCount());
}

void test_finish_without_pending_samples(void) {
    WindowSegmenter segmenter("dev", 4, 0, TrailingWindowMode::FLUSH);
    Window tail;
    TEST_ASSERT_FALSE(segmenter.finish(tail));
}

// ==================== MAIN ====================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_window_emitted_after_w_samples);
    RUN_TEST(test_window_index_increments);
    RUN_TEST(test_multidimensional_values_row_major);

    RUN_TEST(test_duplicate_timestamp_rejected);
    RUN_TEST(test_ordering_checked_across_window_boundary);
    RUN_TEST(test_foreign_device_rejected);
    RUN_TEST(test_arity_fixed_by_first_sample);
    RUN_TEST(test_configured_arity_enforced);
    RUN_TEST(test_empty_sample_rejected);

    RUN_TEST(test_flush_mode_emits_short_window);
    RUN_TEST(test_buffer_mode_keeps_pending_samples);
    RUN_TEST(test_finish_without_pending_samples);

    return UNITY_END();
}
