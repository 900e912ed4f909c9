#pragma once

#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>

namespace marquise {

// One encoded point as it sits in the spool buffer. Bytes are forwarded
// verbatim, so a point is only ever a view into the batch.
struct PointSpan {
    const uint8_t* data;
    size_t         size;   // 24, or 24 + extended length
};

// Inspect a 24-byte point header. Returns false for a standard point.
// For an extended point, stores the little-endian payload length from
// bytes 16..24 in len and returns true.
bool extended_size(const uint8_t* header, uint64_t& len);

// Lazy, single-pass point decoder over a borrowed buffer.
// Once FORMAT_ERROR is returned the reader stays failed; no partial recovery.
class PointReader {
public:
    PointReader(const uint8_t* data, size_t len);

    // Pull the next point. END when the buffer is exhausted exactly on a
    // record boundary.
    ReadStatus next(PointSpan& out);

    size_t offset() const { return offset_; }
    const char* error() const { return error_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t offset_;
    bool failed_;
    const char* error_;
};

// Header-only pass over a whole batch. Returns false on the first malformed
// record; point_count receives the number of records seen before that.
bool validate_points(const uint8_t* data, size_t len, size_t& point_count,
                     const char** error = nullptr);

} // namespace marquise
