/**
 * @file session_runner.h
 * @brief Runs independent per-device sessions on a fixed set of worker threads
 *
 * Each job is one complete compression or decompression session of one
 * device. Jobs for different devices run in parallel and share nothing but
 * the session registry; a job never touches another device's pool or
 * controller. Results are collected per job and returned by waitAll().
 */

#ifndef SESSION_RUNNER_H
#define SESSION_RUNNER_H

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "application/blocking_queue.h"
#include "application/compressed_record.h"
#include "application/engine_config.h"
#include "application/engine_fault.h"
#include "application/record_codec.h"
#include "application/session_registry.h"
#include "application/statistics_manager.h"
#include "application/telemetry.h"

enum class JobKind {
    COMPRESS,
    DECOMPRESS
};

/**
 * @struct DeviceJob
 * @brief Work item for one device session
 */
struct DeviceJob {
    JobKind kind = JobKind::COMPRESS;
    std::string deviceId;
    std::vector<Sample> samples;    ///< COMPRESS input, ordered
    RecordBatch batch;              ///< DECOMPRESS input
};

/**
 * @struct DeviceResult
 * @brief Outcome of one device session
 */
struct DeviceResult {
    JobKind kind = JobKind::COMPRESS;
    std::string deviceId;
    EngineFault fault;

    // COMPRESS
    std::vector<CompressedRecord> records;  ///< Valid prefix even when the session faulted
    std::vector<Sample> carried;            ///< Trailing samples held back in BUFFER mode
    CompressionStats stats;
    double hitRatio = 0.0;
    double academicRatio = 1.0;
    double spaceSavingRatio = 1.0;
    double meanError = 0.0;
    double costScore = 0.0;
    double finalThreshold = 0.0;

    // DECOMPRESS
    std::vector<ReconstructedSample> samples;
};

class SessionRunner {
public:
    /**
     * @param config Configuration used by every compression session
     * @param workerCount Number of worker threads (at least one is started)
     * @param registry Registry the sessions claim their devices from
     */
    SessionRunner(const EngineConfig& config, size_t workerCount,
                  SessionRegistry& registry = SessionRegistry::global());
    ~SessionRunner();

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    void start();

    void submitCompression(const std::string& deviceId, std::vector<Sample> samples);
    void submitDecompression(RecordBatch batch);

    /**
     * @brief Block until every submitted job has finished
     * @return Results ordered by device id, compression before decompression
     */
    std::vector<DeviceResult> waitAll();

    /**
     * @brief Close the job queue and join the workers; queued jobs are finished first
     */
    void stop();

    size_t workerCount() const { return workers.size(); }

private:
    void workerLoop(size_t workerIndex);
    DeviceResult runCompression(const DeviceJob& job);
    DeviceResult runDecompression(const DeviceJob& job);
    void submit(DeviceJob job);

    EngineConfig settings;
    size_t requestedWorkers;
    SessionRegistry& registry;

    BlockingQueue<DeviceJob> jobs;
    std::vector<std::thread> workers;
    std::atomic<bool> running{false};

    std::mutex resultMu;
    std::condition_variable resultCv;
    std::vector<DeviceResult> results;
    uint64_t submitted = 0;
    uint64_t finished = 0;
};

#endif // SESSION_RUNNER_H
