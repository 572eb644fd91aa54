/**
 * @file reconstruction_document.h
 * @brief Per-device output document of a decompressed series
 *
 * {
 *   "device_id": "meter-01",
 *   "sample_count": 2,
 *   "samples": [ {"timestamp": 1000, "values": [230.1, 4.2]}, ... ]
 * }
 */

#ifndef RECONSTRUCTION_DOCUMENT_H
#define RECONSTRUCTION_DOCUMENT_H

#include <string>
#include <vector>

#include "application/engine_fault.h"
#include "application/telemetry.h"

class ReconstructionDocument {
public:
    /**
     * @brief Serialize a reconstructed series
     * @return CODEC_ERROR if the document cannot be built
     */
    static EngineFault toJson(const std::string& deviceId,
                              const std::vector<ReconstructedSample>& samples,
                              std::string& document);

    /**
     * @brief Write the document to a file
     * @return CODEC_ERROR if the file cannot be written
     */
    static EngineFault writeFile(const std::string& path, const std::string& deviceId,
                                 const std::vector<ReconstructedSample>& samples);

private:
    // Prevent instantiation
    ReconstructionDocument() = delete;
    ~ReconstructionDocument() = delete;
};

#endif // RECONSTRUCTION_DOCUMENT_H
