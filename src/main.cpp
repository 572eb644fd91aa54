/**
 * @file main.cpp
 * @brief TeleSqueeze demo: simulated devices through compression and back
 *
 * Usage: telesqueeze_demo [config.json [output_dir]]
 *
 * Simulates several devices, compresses each one in its own session on the
 * worker pool, round-trips the record batches through the JSON codec,
 * decompresses them in parallel and reports per-device statistics and the
 * worst reconstruction error. With an output directory, every device's
 * reconstructed series is written there as <device>.json.
 *
 * @author Team PowerPort
 * @date 2025-11-28
 */

#include "peripheral/logger.h"
#include "peripheral/sensor_sim.h"

#include "application/config_manager.h"
#include "application/reconstruction_document.h"
#include "application/record_codec.h"
#include "application/session_runner.h"
#include "application/statistics_manager.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <thread>
#include <vector>

#define DEMO_DEVICE_COUNT   4
#define DEMO_WINDOWS        400
#define DEMO_ARITY          3

// ============================================
// Helper Functions
// ============================================

/**
 * @brief Largest absolute difference between the original and reconstructed series
 */
static double worstDeviation(const std::vector<Sample>& original,
                             const std::vector<ReconstructedSample>& restored,
                             bool& timestampsMatch) {
    timestampsMatch = original.size() == restored.size();
    double worst = 0.0;
    size_t count = std::min(original.size(), restored.size());
    for (size_t i = 0; i < count; i++) {
        if (original[i].timestamp != restored[i].timestamp) {
            timestampsMatch = false;
        }
        size_t arity = std::min(original[i].values.size(), restored[i].values.size());
        for (size_t d = 0; d < arity; d++) {
            worst = std::max(worst, std::fabs(original[i].values[d] - restored[i].values[d]));
        }
    }
    return worst;
}

int main(int argc, char** argv) {
    initLogger();
    LOG_SECTION("TeleSqueeze streaming compression demo");

    EngineConfig config;
    config.windowLength = 16;
    config.poolCapacity = 32;
    config.controller.initialThreshold = 0.02;
    config.controller.targetRatio = 3.0;

    if (argc > 1) {
        if (!ConfigManager::loadFromFile(argv[1], config).ok()) {
            return 1;
        }
        LOG_SUCCESS(LOG_TAG_CONFIG, "Loaded %s", argv[1]);
    }
    ConfigManager::printConfig(config);
    std::string outputDir = argc > 2 ? argv[2] : "";

    // Simulated backlog per device
    std::map<std::string, std::vector<Sample>> backlog;
    for (int i = 0; i < DEMO_DEVICE_COUNT; i++) {
        SensorSimConfig simConfig;
        simConfig.windowLength = config.windowLength;
        simConfig.arity = config.arity != 0 ? config.arity : DEMO_ARITY;
        simConfig.startTimestamp = 1700000000000LL;
        simConfig.duplicateFraction = 0.6 + 0.1 * i;
        simConfig.seed = 1000 + i;

        std::string deviceId = "sensor-0" + std::to_string(i + 1);
        SensorSim sim(deviceId, simConfig);
        backlog[deviceId] = sim.generate(DEMO_WINDOWS);
        LOG_INFO(LOG_TAG_SIM, "[%s] %zu samples, %llu near-duplicate windows",
                 deviceId.c_str(), backlog[deviceId].size(),
                 (unsigned long long)sim.duplicatesGenerated());
    }

    size_t workers = std::max<unsigned>(2, std::thread::hardware_concurrency());
    SessionRunner runner(config, std::min<size_t>(workers, DEMO_DEVICE_COUNT));
    runner.start();

    LOG_SECTION("Compression");
    for (const auto& entry : backlog) {
        runner.submitCompression(entry.first, entry.second);
    }
    std::vector<DeviceResult> compressed = runner.waitAll();

    int failures = 0;
    std::map<std::string, std::string> documents;
    for (DeviceResult& result : compressed) {
        // Session faults were logged by the session itself
        if (!result.fault.ok()) {
            failures++;
            continue;
        }
        StatisticsManager(result.deviceId, config.statistics, result.stats).printPerformanceReport();
        LOG_INFO(LOG_TAG_COMPRESS, "[%s] %zu records | hits %.1f%% | ratio %.2f:1 (academic %.3f) | err %.5f | thr %.4f | cost %.3f",
                 result.deviceId.c_str(), result.records.size(), result.hitRatio * 100.0,
                 result.spaceSavingRatio, result.academicRatio, result.meanError,
                 result.finalThreshold, result.costScore);

        RecordBatch batch;
        batch.deviceId = result.deviceId;
        batch.windowLength = config.windowLength;
        batch.poolCapacity = config.poolCapacity;
        batch.records = std::move(result.records);

        EngineFault encoded = RecordCodec::encode(batch, documents[result.deviceId]);
        if (!encoded.ok()) {
            logFault(LOG_TAG_CODEC, encoded);
            failures++;
            documents.erase(result.deviceId);
        }
    }

    LOG_SECTION("Decompression");
    for (const auto& entry : documents) {
        RecordBatch batch;
        EngineFault decoded = RecordCodec::decode(entry.second, batch);
        if (!decoded.ok()) {
            logFault(LOG_TAG_CODEC, decoded);
            failures++;
            continue;
        }
        LOG_INFO(LOG_TAG_CODEC, "[%s] document %zu bytes, %zu records",
                 entry.first.c_str(), entry.second.size(), batch.records.size());
        runner.submitDecompression(std::move(batch));
    }
    std::vector<DeviceResult> restored = runner.waitAll();
    runner.stop();

    for (const DeviceResult& result : restored) {
        if (!result.fault.ok()) {
            failures++;
            continue;
        }
        bool timestampsMatch = false;
        double worst = worstDeviation(backlog[result.deviceId], result.samples, timestampsMatch);
        LOG_INFO(LOG_TAG_DECOMP, "[%s] %zu samples restored | worst deviation %.5f | timestamps %s",
                 result.deviceId.c_str(), result.samples.size(), worst,
                 timestampsMatch ? "exact" : "DIFFER");
        if (!timestampsMatch) {
            failures++;
        }

        if (!outputDir.empty()) {
            EngineFault written = ReconstructionDocument::writeFile(
                outputDir + "/" + result.deviceId + ".json", result.deviceId, result.samples);
            if (!written.ok()) {
                logFault(LOG_TAG_CODEC, written);
                failures++;
            }
        }
    }

    LOG_DIVIDER();
    if (failures > 0) {
        LOG_ERROR(LOG_TAG_BOOT, "%d device(s) failed", failures);
        return 1;
    }
    LOG_SUCCESS(LOG_TAG_BOOT, "All %d devices round-tripped", DEMO_DEVICE_COUNT);
    return 0;
}
