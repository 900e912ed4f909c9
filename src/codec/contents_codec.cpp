#include "codec/contents_codec.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace marquise {

ContentsReader::ContentsReader(const uint8_t* data, size_t len)
    : data_(data)
    , len_(len)
    , offset_(0)
    , failed_(false)
    , error_(nullptr)
{
}

ReadStatus ContentsReader::next(ContentsRequest& out) {
    if (failed_) return ReadStatus::FORMAT_ERROR;
    if (offset_ == len_) return ReadStatus::END;

    size_t remaining = len_ - offset_;
    if (remaining < CONTENTS_HEADER_SIZE) {
        failed_ = true;
        error_ = "truncated contents request header";
        return ReadStatus::FORMAT_ERROR;
    }

    const uint8_t* p = data_ + offset_;
    Address addr = load_u64_le(p);
    uint64_t dict_len = load_u64_le(p + 8);

    if (dict_len > remaining - CONTENTS_HEADER_SIZE) {
        failed_ = true;
        error_ = "truncated source dict";
        return ReadStatus::FORMAT_ERROR;
    }

    SourceDict sd;
    if (!SourceDict::decode(p + CONTENTS_HEADER_SIZE,
                            static_cast<size_t>(dict_len), sd)) {
        failed_ = true;
        error_ = "malformed source dict";
        return ReadStatus::FORMAT_ERROR;
    }

    out.address = addr;
    out.source_dict = std::move(sd);
    offset_ += CONTENTS_HEADER_SIZE + static_cast<size_t>(dict_len);
    return ReadStatus::OK;
}

void encode_contents_request(const ContentsRequest& req, std::vector<uint8_t>& out) {
    std::string dict = req.source_dict.encode();

    size_t off = out.size();
    out.resize(off + CONTENTS_HEADER_SIZE + dict.size());
    store_u64_le(out.data() + off, req.address);
    store_u64_le(out.data() + off + 8, static_cast<uint64_t>(dict.size()));
    if (!dict.empty()) {
        std::memcpy(out.data() + off + CONTENTS_HEADER_SIZE, dict.data(), dict.size());
    }
}

} // namespace marquise
