#include "codec/point_codec.hpp"

namespace marquise {

bool extended_size(const uint8_t* header, uint64_t& len) {
    Address addr = load_u64_le(header);
    if (!is_address_extended(addr)) {
        return false;
    }
    len = load_u64_le(header + POINT_LENGTH_OFFSET);
    return true;
}

PointReader::PointReader(const uint8_t* data, size_t len)
    : data_(data)
    , len_(len)
    , offset_(0)
    , failed_(false)
    , error_(nullptr)
{
}

ReadStatus PointReader::next(PointSpan& out) {
    if (failed_) return ReadStatus::FORMAT_ERROR;
    if (offset_ == len_) return ReadStatus::END;

    size_t remaining = len_ - offset_;
    if (remaining < POINT_HEADER_SIZE) {
        failed_ = true;
        error_ = "truncated point header";
        return ReadStatus::FORMAT_ERROR;
    }

    const uint8_t* header = data_ + offset_;
    size_t size = POINT_HEADER_SIZE;

    uint64_t ext_len = 0;
    if (extended_size(header, ext_len)) {
        // Compare against what is left rather than adding, so a huge
        // declared length cannot wrap size_t.
        if (ext_len > remaining - POINT_HEADER_SIZE) {
            failed_ = true;
            error_ = "not enough bytes in alleged extended burst";
            return ReadStatus::FORMAT_ERROR;
        }
        size += static_cast<size_t>(ext_len);
    }

    out.data = header;
    out.size = size;
    offset_ += size;
    return ReadStatus::OK;
}

bool validate_points(const uint8_t* data, size_t len, size_t& point_count,
                     const char** error) {
    PointReader reader(data, len);
    PointSpan span;
    point_count = 0;

    for (;;) {
        ReadStatus st = reader.next(span);
        if (st == ReadStatus::END) return true;
        if (st == ReadStatus::FORMAT_ERROR) {
            if (error) *error = reader.error();
            return false;
        }
        point_count++;
    }
}

} // namespace marquise
