/**
 * @file record_codec.cpp
 * @brief Record batch serialization (ArduinoJson + mbedtls)
 */

#include "application/record_codec.h"
#include "application/engine_config.h"
#include "peripheral/logger.h"

#include <ArduinoJson.h>
#include <mbedtls/base64.h>
#include <mbedtls/md.h>

#include <algorithm>
#include <string.h>

namespace {

EngineFault codecFault(const std::string& deviceId, uint64_t index, const std::string& description) {
    return EngineFault::make(FaultKind::CODEC_ERROR, deviceId, index, description);
}

void bytesToHex(const uint8_t* data, size_t dataLen, std::string& hex) {
    static const char digits[] = "0123456789abcdef";
    hex.clear();
    hex.reserve(dataLen * 2);
    for (size_t i = 0; i < dataLen; i++) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
}

bool readInt64(JsonObjectConst obj, const char* key, int64_t& out) {
    JsonVariantConst value = obj[key];
    if (!value.is<int64_t>()) {
        return false;
    }
    out = value.as<int64_t>();
    return true;
}

bool readUint32(JsonObjectConst obj, const char* key, uint32_t& out) {
    JsonVariantConst value = obj[key];
    if (!value.is<uint32_t>()) {
        return false;
    }
    out = value.as<uint32_t>();
    return true;
}

bool digestOf(JsonArrayConst records, std::string& hex) {
    std::string serialized;
    serializeJson(records, serialized);
    return RecordCodec::digestHex(serialized, hex);
}

} // namespace

EngineFault RecordCodec::encode(const RecordBatch& batch, std::string& document) {
    std::vector<std::string> payloads;
    payloads.reserve(batch.records.size());
    size_t payloadBytes = 0;
    for (const CompressedRecord& record : batch.records) {
        if (const NewExemplarRecord* exemplar = std::get_if<NewExemplarRecord>(&record)) {
            payloads.push_back(packValues(exemplar->rawValues));
            payloadBytes += payloads.back().size() + 1;
        }
    }

    size_t capacity = 1024 + batch.deviceId.size() +
                      JSON_ARRAY_SIZE(batch.records.size()) +
                      batch.records.size() * JSON_OBJECT_SIZE(8) +
                      payloadBytes;
    DynamicJsonDocument doc(capacity);

    doc["device_id"] = batch.deviceId;
    doc["window_length"] = (uint64_t)batch.windowLength;
    doc["pool_capacity"] = (uint64_t)batch.poolCapacity;
    doc["record_count"] = (uint64_t)batch.records.size();
    JsonArray records = doc.createNestedArray("records");

    size_t nextPayload = 0;
    for (const CompressedRecord& record : batch.records) {
        JsonObject entry = records.createNestedObject();
        std::visit(RecordVisitor{
            [&](const ReferenceRecord& r) {
                entry["kind"] = "reference";
                entry["slot"] = r.slotIndex;
                entry["start"] = r.windowStartTimestamp;
                entry["end"] = r.windowEndTimestamp;
            },
            [&](const NewExemplarRecord& r) {
                entry["kind"] = "exemplar";
                entry["slot"] = r.slotIndex;
                entry["start"] = r.windowStartTimestamp;
                entry["end"] = r.windowEndTimestamp;
                entry["samples"] = r.sampleCount;
                entry["arity"] = r.arity;
                entry["values"] = payloads[nextPayload++];
            }
        }, record);
    }

    if (doc.overflowed()) {
        return codecFault(batch.deviceId, batch.records.size(),
                          "document capacity of " + std::to_string(capacity) + " bytes exceeded");
    }

    std::string digest;
    if (!digestOf(records, digest)) {
        return codecFault(batch.deviceId, 0, "SHA-256 digest failed");
    }
    doc["digest"] = digest;
    if (doc.overflowed()) {
        return codecFault(batch.deviceId, batch.records.size(), "no room left for the digest");
    }

    document.clear();
    serializeJson(doc, document);
    LOG_DEBUG(LOG_TAG_CODEC, "[%s] encoded %zu records (%zu bytes)",
              batch.deviceId.c_str(), batch.records.size(), document.size());
    return EngineFault::none();
}

EngineFault RecordCodec::decode(const std::string& document, RecordBatch& batch) {
    size_t objects = (size_t)std::count(document.begin(), document.end(), '{');
    DynamicJsonDocument doc(document.size() + objects * JSON_OBJECT_SIZE(8) + 1024);

    DeserializationError error = deserializeJson(doc, document);
    if (error) {
        return codecFault("", 0, std::string("JSON parse failed: ") + error.c_str());
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        return codecFault("", 0, "document is not an object");
    }
    if (!root["device_id"].is<const char*>()) {
        return codecFault("", 0, "'device_id' missing");
    }

    RecordBatch parsed;
    parsed.deviceId = root["device_id"].as<const char*>();
    if (!root["window_length"].is<uint32_t>() || !root["pool_capacity"].is<uint32_t>()) {
        return codecFault(parsed.deviceId, 0, "'window_length' and 'pool_capacity' must be counts");
    }
    parsed.windowLength = root["window_length"].as<uint32_t>();
    parsed.poolCapacity = root["pool_capacity"].as<uint32_t>();
    if (parsed.windowLength > ENGINE_MAX_WINDOW_LENGTH || parsed.poolCapacity > ENGINE_MAX_POOL_CAPACITY) {
        return codecFault(parsed.deviceId, 0, "'window_length' or 'pool_capacity' out of range");
    }

    if (!root["records"].is<JsonArrayConst>()) {
        return codecFault(parsed.deviceId, 0, "'records' must be an array");
    }
    JsonArrayConst records = root["records"].as<JsonArrayConst>();

    if (!root["record_count"].is<uint32_t>() || root["record_count"].as<uint32_t>() != records.size()) {
        return codecFault(parsed.deviceId, 0, "'record_count' does not match the records array");
    }

    if (!root["digest"].is<const char*>()) {
        return codecFault(parsed.deviceId, 0, "'digest' missing");
    }
    std::string expected = root["digest"].as<const char*>();
    std::string actual;
    if (!digestOf(records, actual)) {
        return codecFault(parsed.deviceId, 0, "SHA-256 digest failed");
    }
    if (actual != expected) {
        LOG_WARN(LOG_TAG_CODEC, "[%s] digest mismatch (expected %s, got %s)",
                 parsed.deviceId.c_str(), expected.c_str(), actual.c_str());
        return codecFault(parsed.deviceId, 0, "record digest mismatch");
    }

    uint64_t index = 0;
    for (JsonVariantConst item : records) {
        JsonObjectConst entry = item.as<JsonObjectConst>();
        if (entry.isNull()) {
            return codecFault(parsed.deviceId, index, "record is not an object");
        }
        const char* kind = entry["kind"].as<const char*>();
        if (kind == nullptr) {
            return codecFault(parsed.deviceId, index, "record has no 'kind'");
        }

        uint32_t slot = 0;
        int64_t start = 0;
        int64_t end = 0;
        if (!readUint32(entry, "slot", slot) || !readInt64(entry, "start", start) ||
            !readInt64(entry, "end", end)) {
            return codecFault(parsed.deviceId, index, "record header incomplete");
        }

        if (strcmp(kind, "reference") == 0) {
            ReferenceRecord reference;
            reference.slotIndex = slot;
            reference.windowStartTimestamp = start;
            reference.windowEndTimestamp = end;
            parsed.records.push_back(reference);
        } else if (strcmp(kind, "exemplar") == 0) {
            NewExemplarRecord exemplar;
            exemplar.slotIndex = slot;
            exemplar.windowStartTimestamp = start;
            exemplar.windowEndTimestamp = end;
            if (!readUint32(entry, "samples", exemplar.sampleCount) ||
                !readUint32(entry, "arity", exemplar.arity)) {
                return codecFault(parsed.deviceId, index, "exemplar shape incomplete");
            }
            const char* values = entry["values"].as<const char*>();
            if (values == nullptr || !unpackValues(values, exemplar.rawValues)) {
                return codecFault(parsed.deviceId, index, "exemplar payload is not valid Base64");
            }
            if (exemplar.rawValues.size() != (size_t)exemplar.sampleCount * exemplar.arity) {
                return codecFault(parsed.deviceId, index, "exemplar payload does not match its shape");
            }
            parsed.records.push_back(std::move(exemplar));
        } else {
            return codecFault(parsed.deviceId, index, std::string("unknown record kind '") + kind + "'");
        }
        index++;
    }

    batch = std::move(parsed);
    LOG_DEBUG(LOG_TAG_CODEC, "[%s] decoded %zu records", batch.deviceId.c_str(), batch.records.size());
    return EngineFault::none();
}

bool RecordCodec::digestHex(const std::string& data, std::string& hex) {
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (info == nullptr) {
        return false;
    }
    uint8_t digest[RECORD_DIGEST_SIZE];
    if (mbedtls_md(info, (const unsigned char*)data.data(), data.size(), digest) != 0) {
        return false;
    }
    bytesToHex(digest, sizeof(digest), hex);
    return true;
}

std::string RecordCodec::packValues(const std::vector<double>& values) {
    std::vector<uint8_t> packed(values.size() * sizeof(double));
    for (size_t i = 0; i < values.size(); i++) {
        uint64_t bits = 0;
        memcpy(&bits, &values[i], sizeof(bits));
        for (size_t b = 0; b < sizeof(bits); b++) {
            packed[i * sizeof(double) + b] = (uint8_t)((bits >> (8 * b)) & 0xFF);
        }
    }

    size_t required = 0;
    mbedtls_base64_encode(nullptr, 0, &required, packed.data(), packed.size());
    std::string encoded(required, '\0');
    size_t written = 0;
    if (mbedtls_base64_encode((unsigned char*)&encoded[0], encoded.size(), &written,
                              packed.data(), packed.size()) != 0) {
        LOG_ERROR(LOG_TAG_CODEC, "Base64 encoding of %zu values failed", values.size());
        return std::string();
    }
    encoded.resize(written);
    return encoded;
}

bool RecordCodec::unpackValues(const std::string& encoded, std::vector<double>& values) {
    values.clear();
    if (encoded.empty()) {
        return true;
    }

    size_t required = 0;
    int ret = mbedtls_base64_decode(nullptr, 0, &required,
                                    (const unsigned char*)encoded.data(), encoded.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        return false;
    }
    std::vector<uint8_t> packed(required);
    size_t written = 0;
    if (mbedtls_base64_decode(packed.data(), packed.size(), &written,
                              (const unsigned char*)encoded.data(), encoded.size()) != 0) {
        return false;
    }
    if (written % sizeof(double) != 0) {
        return false;
    }

    values.resize(written / sizeof(double));
    for (size_t i = 0; i < values.size(); i++) {
        uint64_t bits = 0;
        for (size_t b = 0; b < sizeof(bits); b++) {
            bits |= (uint64_t)packed[i * sizeof(double) + b] << (8 * b);
        }
        memcpy(&values[i], &bits, sizeof(bits));
    }
    return true;
}
