#include "transmit/burst_chunker.hpp"

namespace marquise {

BurstChunker::BurstChunker(PointReader& reader, size_t target_size)
    : reader_(reader)
    , target_size_(target_size)
    , pending_{nullptr, 0}
    , have_pending_(false)
    , done_(false)
    , failed_(false)
{
}

ReadStatus BurstChunker::next(std::vector<uint8_t>& burst) {
    burst.clear();
    if (failed_) return ReadStatus::FORMAT_ERROR;
    if (done_) return ReadStatus::END;

    for (;;) {
        if (!have_pending_) {
            ReadStatus st = reader_.next(pending_);
            if (st == ReadStatus::FORMAT_ERROR) {
                failed_ = true;
                burst.clear();
                return ReadStatus::FORMAT_ERROR;
            }
            if (st == ReadStatus::END) {
                done_ = true;
                return burst.empty() ? ReadStatus::END : ReadStatus::OK;
            }
            have_pending_ = true;
        }

        // Flush before overflowing; the held point starts the next burst
        if (!burst.empty() && burst.size() + pending_.size > target_size_) {
            return ReadStatus::OK;
        }

        burst.insert(burst.end(), pending_.data, pending_.data + pending_.size);
        have_pending_ = false;

        if (burst.size() >= target_size_) {
            return ReadStatus::OK;
        }
    }
}

} // namespace marquise
