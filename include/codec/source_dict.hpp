#pragma once

#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace marquise {

// Metadata attached to an address: "key:value" pairs joined by ','.
// Pairs are kept sorted by key so the canonical encoding (and therefore the
// fingerprint) does not depend on the order a client wrote them in.
class SourceDict {
public:
    using Pair = std::pair<std::string, std::string>;

    SourceDict() = default;

    // Decode the wire form. Returns false on an empty key, a pair without
    // ':', or a duplicate key. Empty input decodes to an empty dict.
    static bool decode(const uint8_t* data, size_t len, SourceDict& out);

    // Canonical wire form (sorted pairs)
    std::string encode() const;

    Fingerprint fingerprint() const;

    bool set(const std::string& key, const std::string& value);
    const std::string* get(const std::string& key) const;

    size_t size() const { return pairs_.size(); }
    bool empty() const { return pairs_.empty(); }
    const std::vector<Pair>& pairs() const { return pairs_; }

private:
    std::vector<Pair> pairs_;
};

} // namespace marquise
