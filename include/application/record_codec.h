/**
 * @file record_codec.h
 * @brief JSON document format of a device's compressed record batch
 *
 * Document layout:
 * {
 *   "device_id": "meter-01",
 *   "window_length": 16,
 *   "pool_capacity": 64,
 *   "record_count": 3,
 *   "records": [
 *     {"kind": "exemplar", "slot": 0, "start": 1000, "end": 1150,
 *      "samples": 16, "arity": 1, "values": "<base64>"},
 *     {"kind": "reference", "slot": 0, "start": 1160, "end": 1310}
 *   ],
 *   "digest": "<hex sha-256 of the serialized records array>"
 * }
 *
 * Values are packed as little-endian IEEE-754 doubles before Base64, so a
 * decoded batch carries bit-identical payloads.
 */

#ifndef RECORD_CODEC_H
#define RECORD_CODEC_H

#include <stdint.h>
#include <string>
#include <vector>

#include "application/compressed_record.h"
#include "application/engine_fault.h"

#define RECORD_DIGEST_SIZE 32   // SHA-256

/**
 * @struct RecordBatch
 * @brief Records of one device plus what a reader needs to replay them
 */
struct RecordBatch {
    std::string deviceId;
    size_t windowLength = 0;
    size_t poolCapacity = 0;
    std::vector<CompressedRecord> records;
};

class RecordCodec {
public:
    /**
     * @brief Serialize a batch
     * @return CODEC_ERROR if the document cannot be built
     */
    static EngineFault encode(const RecordBatch& batch, std::string& document);

    /**
     * @brief Parse and verify a batch document
     *
     * @param document JSON text
     * @param batch Output batch (untouched on failure)
     * @return CODEC_ERROR on syntax or structure errors or a digest mismatch
     */
    static EngineFault decode(const std::string& document, RecordBatch& batch);

    /**
     * @brief Hex SHA-256 of a byte string
     * @return false if the digest could not be computed
     */
    static bool digestHex(const std::string& data, std::string& hex);

    static std::string packValues(const std::vector<double>& values);
    static bool unpackValues(const std::string& encoded, std::vector<double>& values);

private:
    // Prevent instantiation
    RecordCodec() = delete;
    ~RecordCodec() = delete;
    RecordCodec(const RecordCodec&) = delete;
    RecordCodec& operator=(const RecordCodec&) = delete;
};

#endif // RECORD_CODEC_H
