/**
 * @file compressed_record.h
 * @brief Compressed record sum type and its size model
 *
 * A record is either a Reference to a live exemplar slot (no payload) or a
 * NewExemplar carrying the full window, which the reader must insert into its
 * own pool at the declared slot. Both sides switch over the variant with
 * std::visit, so adding a record kind fails to compile until every site
 * handles it.
 */

#ifndef COMPRESSED_RECORD_H
#define COMPRESSED_RECORD_H

#include <stdint.h>
#include <stddef.h>
#include <variant>
#include <vector>

#include "application/telemetry.h"

// Serialized size model (bytes)
#define RECORD_HEADER_BYTES     21   // tag(1) + slot(4) + start(8) + end(8)
#define EXEMPLAR_SHAPE_BYTES    8    // sampleCount(4) + arity(4)

struct ReferenceRecord {
    uint32_t slotIndex = 0;
    int64_t windowStartTimestamp = 0;
    int64_t windowEndTimestamp = 0;
};

struct NewExemplarRecord {
    uint32_t slotIndex = 0;
    int64_t windowStartTimestamp = 0;
    int64_t windowEndTimestamp = 0;
    uint32_t sampleCount = 0;
    uint32_t arity = 0;
    std::vector<double> rawValues;
};

using CompressedRecord = std::variant<ReferenceRecord, NewExemplarRecord>;

// Overload set helper for std::visit
template <class... Ts> struct RecordVisitor : Ts... { using Ts::operator()...; };
template <class... Ts> RecordVisitor(Ts...) -> RecordVisitor<Ts...>;

inline bool isReference(const CompressedRecord& record) {
    return std::holds_alternative<ReferenceRecord>(record);
}

inline uint32_t recordSlot(const CompressedRecord& record) {
    return std::visit([](const auto& r) { return r.slotIndex; }, record);
}

inline int64_t recordStartTimestamp(const CompressedRecord& record) {
    return std::visit([](const auto& r) { return r.windowStartTimestamp; }, record);
}

inline int64_t recordEndTimestamp(const CompressedRecord& record) {
    return std::visit([](const auto& r) { return r.windowEndTimestamp; }, record);
}

/**
 * @brief Serialized size of a record under the size model
 */
inline size_t recordEncodedBytes(const CompressedRecord& record) {
    return std::visit(RecordVisitor{
        [](const ReferenceRecord&) -> size_t {
            return RECORD_HEADER_BYTES;
        },
        [](const NewExemplarRecord& r) -> size_t {
            return RECORD_HEADER_BYTES + EXEMPLAR_SHAPE_BYTES + r.rawValues.size() * sizeof(double);
        }
    }, record);
}

/**
 * @class RecordSink
 * @brief Append-only destination for one device's records
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual void append(const CompressedRecord& record) = 0;
};

/**
 * @class VectorRecordSink
 * @brief RecordSink that keeps records in memory, in arrival order
 */
class VectorRecordSink : public RecordSink {
public:
    void append(const CompressedRecord& record) override { records.push_back(record); }

    const std::vector<CompressedRecord>& all() const { return records; }
    std::vector<CompressedRecord> take() { std::vector<CompressedRecord> out; out.swap(records); return out; }
    size_t size() const { return records.size(); }
    void clear() { records.clear(); }

private:
    std::vector<CompressedRecord> records;
};

#endif // COMPRESSED_RECORD_H
