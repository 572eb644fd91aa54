/**
 * @file session_runner.cpp
 * @brief Implementation of the parallel per-device session runner
 */

#include "application/session_runner.h"
#include "application/compressor.h"
#include "application/decompressor.h"
#include "peripheral/logger.h"

#include <algorithm>
#include <utility>

SessionRunner::SessionRunner(const EngineConfig& config, size_t workerCount, SessionRegistry& registry)
    : settings(config), requestedWorkers(std::max<size_t>(1, workerCount)), registry(registry) {}

SessionRunner::~SessionRunner() {
    stop();
}

void SessionRunner::start() {
    if (running.exchange(true)) {
        return;
    }
    jobs.reopen();
    for (size_t i = 0; i < requestedWorkers; i++) {
        workers.emplace_back(&SessionRunner::workerLoop, this, i);
    }
    LOG_INFO(LOG_TAG_SESSION, "Started %zu session workers", workers.size());
}

void SessionRunner::submitCompression(const std::string& deviceId, std::vector<Sample> samples) {
    DeviceJob job;
    job.kind = JobKind::COMPRESS;
    job.deviceId = deviceId;
    job.samples = std::move(samples);
    submit(std::move(job));
}

void SessionRunner::submitDecompression(RecordBatch batch) {
    DeviceJob job;
    job.kind = JobKind::DECOMPRESS;
    job.deviceId = batch.deviceId;
    job.batch = std::move(batch);
    submit(std::move(job));
}

void SessionRunner::submit(DeviceJob job) {
    {
        std::lock_guard<std::mutex> lk(resultMu);
        submitted++;
    }

    DeviceResult rejected;
    rejected.kind = job.kind;
    rejected.deviceId = job.deviceId;
    if (jobs.push(std::move(job))) {
        return;
    }

    // Runner stopped: answer the job here so waitAll() still returns
    rejected.fault = EngineFault::make(FaultKind::INVALID_SESSION_STATE, rejected.deviceId, 0,
                                       "session runner is stopped");
    logFault(LOG_TAG_SESSION, rejected.fault);
    {
        std::lock_guard<std::mutex> lk(resultMu);
        results.push_back(std::move(rejected));
        finished++;
    }
    resultCv.notify_all();
}

std::vector<DeviceResult> SessionRunner::waitAll() {
    std::unique_lock<std::mutex> lk(resultMu);
    resultCv.wait(lk, [&]{ return finished >= submitted; });

    std::vector<DeviceResult> out;
    out.swap(results);
    std::sort(out.begin(), out.end(), [](const DeviceResult& a, const DeviceResult& b) {
        if (a.deviceId != b.deviceId) {
            return a.deviceId < b.deviceId;
        }
        return (int)a.kind < (int)b.kind;
    });
    return out;
}

void SessionRunner::stop() {
    if (!running.exchange(false)) {
        return;
    }
    jobs.close();
    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    LOG_DEBUG(LOG_TAG_SESSION, "Session workers stopped");
}

void SessionRunner::workerLoop(size_t workerIndex) {
    DeviceJob job;
    while (jobs.pop(job)) {
        LOG_DEBUG(LOG_TAG_SESSION, "worker %zu: %s job for '%s'", workerIndex,
                  job.kind == JobKind::COMPRESS ? "compression" : "decompression",
                  job.deviceId.c_str());

        DeviceResult result = job.kind == JobKind::COMPRESS ? runCompression(job)
                                                            : runDecompression(job);
        {
            std::lock_guard<std::mutex> lk(resultMu);
            results.push_back(std::move(result));
            finished++;
        }
        resultCv.notify_all();
    }
}

DeviceResult SessionRunner::runCompression(const DeviceJob& job) {
    DeviceResult result;
    result.kind = JobKind::COMPRESS;
    result.deviceId = job.deviceId;

    VectorRecordSink sink;
    Compressor compressor(job.deviceId, settings, sink, registry);

    result.fault = compressor.open();
    if (result.fault.ok()) {
        result.fault = compressor.pushBatch(job.samples);
    }
    if (result.fault.ok()) {
        result.fault = compressor.close();
    }

    result.records = sink.take();
    result.carried = compressor.takeCarriedSamples();

    const StatisticsManager& stats = compressor.statistics();
    result.stats = stats.getStats();
    result.hitRatio = stats.hitRatio();
    result.academicRatio = stats.academicRatio();
    result.spaceSavingRatio = stats.spaceSavingRatio();
    result.meanError = stats.meanError();
    result.costScore = stats.costScore();
    result.finalThreshold = compressor.controller().threshold();
    return result;
}

DeviceResult SessionRunner::runDecompression(const DeviceJob& job) {
    DeviceResult result;
    result.kind = JobKind::DECOMPRESS;
    result.deviceId = job.deviceId;

    Decompressor decompressor(job.deviceId, job.batch.poolCapacity, registry);
    result.fault = decompressor.open();
    if (result.fault.ok()) {
        result.fault = decompressor.applyAll(job.batch.records, result.samples);
    }
    if (result.fault.ok()) {
        result.fault = decompressor.close();
    }
    return result;
}
