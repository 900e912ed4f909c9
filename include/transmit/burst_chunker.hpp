#pragma once

#include "codec/point_codec.hpp"
#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace marquise {

// Repackages a point stream into bursts of whole points.
//
// Greedy, single pass: points are appended until the burst reaches the
// target size. A point that would push a non-empty burst past the target is
// held back and opens the next burst, so a burst only exceeds the target
// when it consists of a single oversized extended point. Points are never
// split and order is preserved.
class BurstChunker {
public:
    BurstChunker(PointReader& reader, size_t target_size = IDEAL_BURST_SIZE);

    // Fill burst with the next burst (previous contents are discarded).
    // END once the stream is exhausted; an empty stream yields no bursts.
    // FORMAT_ERROR aborts the stream and leaves burst empty.
    ReadStatus next(std::vector<uint8_t>& burst);

    size_t target_size() const { return target_size_; }
    const char* error() const { return reader_.error(); }

private:
    PointReader& reader_;
    size_t target_size_;

    PointSpan pending_;
    bool have_pending_;
    bool done_;
    bool failed_;
};

} // namespace marquise
