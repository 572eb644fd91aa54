/**
 * @file reconstruction_document.cpp
 * @brief Serialization of reconstructed series (ArduinoJson)
 */

#include "application/reconstruction_document.h"
#include "peripheral/logger.h"

#include <ArduinoJson.h>

#include <fstream>

EngineFault ReconstructionDocument::toJson(const std::string& deviceId,
                                           const std::vector<ReconstructedSample>& samples,
                                           std::string& document) {
    size_t values = 0;
    for (const ReconstructedSample& sample : samples) {
        values += sample.values.size();
    }
    size_t capacity = 512 + deviceId.size() +
                      JSON_ARRAY_SIZE(samples.size()) +
                      samples.size() * (JSON_OBJECT_SIZE(2) + JSON_ARRAY_SIZE(0)) +
                      JSON_ARRAY_SIZE(values);
    DynamicJsonDocument doc(capacity);

    doc["device_id"] = deviceId;
    doc["sample_count"] = (uint64_t)samples.size();
    JsonArray out = doc.createNestedArray("samples");
    for (const ReconstructedSample& sample : samples) {
        JsonObject entry = out.createNestedObject();
        entry["timestamp"] = sample.timestamp;
        JsonArray row = entry.createNestedArray("values");
        for (double value : sample.values) {
            row.add(value);
        }
    }

    if (doc.overflowed()) {
        return EngineFault::make(FaultKind::CODEC_ERROR, deviceId, samples.size(),
                                 "document capacity of " + std::to_string(capacity) + " bytes exceeded");
    }

    document.clear();
    serializeJson(doc, document);
    return EngineFault::none();
}

EngineFault ReconstructionDocument::writeFile(const std::string& path, const std::string& deviceId,
                                              const std::vector<ReconstructedSample>& samples) {
    std::string document;
    EngineFault fault = toJson(deviceId, samples, document);
    if (!fault.ok()) {
        return fault;
    }

    std::ofstream file(path.c_str(), std::ios::out | std::ios::trunc);
    if (!file) {
        return EngineFault::make(FaultKind::CODEC_ERROR, deviceId, 0, "cannot open '" + path + "'");
    }
    file << document;
    if (!file) {
        return EngineFault::make(FaultKind::CODEC_ERROR, deviceId, 0, "write to '" + path + "' failed");
    }
    LOG_INFO(LOG_TAG_CODEC, "[%s] wrote %zu samples to %s", deviceId.c_str(), samples.size(), path.c_str());
    return EngineFault::none();
}
