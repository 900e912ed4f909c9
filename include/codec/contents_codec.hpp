#pragma once

#include "codec/source_dict.hpp"
#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace marquise {

// A metadata update for one address
struct ContentsRequest {
    Address    address;
    SourceDict source_dict;
};

// Lazy decoder for a contents batch: address(8) + length(8 LE) + dict bytes,
// repeated. Any malformed request fails the whole stream.
class ContentsReader {
public:
    ContentsReader(const uint8_t* data, size_t len);

    ReadStatus next(ContentsRequest& out);

    size_t offset() const { return offset_; }
    const char* error() const { return error_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t offset_;
    bool failed_;
    const char* error_;
};

// Append the broker body for a request (canonical dict bytes) to out.
void encode_contents_request(const ContentsRequest& req, std::vector<uint8_t>& out);

} // namespace marquise
