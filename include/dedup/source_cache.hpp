#pragma once

#include "codec/contents_codec.hpp"
#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace marquise {

// Cache file format (little-endian)
constexpr uint8_t  CACHE_MAGIC[4] = {'M', 'Q', 'S', 'C'};
constexpr uint32_t CACHE_VERSION  = 1;

enum class CacheLoadStatus {
    OK,
    MISSING,          // no cache file yet
    IO_ERROR,
    BAD_MAGIC,
    BAD_VERSION,
    TRUNCATED,
    TRAILING_BYTES,   // data after the checksum
    BAD_CHECKSUM,
    ORIGIN_MISMATCH,
};

const char* cache_load_status_name(CacheLoadStatus s);

// Set of SourceDict fingerprints already forwarded for one origin.
// Owned and mutated by the contents loop only.
class SourceCache {
public:
    explicit SourceCache(std::string origin);

    const std::string& origin() const { return origin_; }
    size_t size() const { return seen_.size(); }

    bool contains(Fingerprint fp) const { return seen_.count(fp) != 0; }
    bool insert(Fingerprint fp) { return seen_.insert(fp).second; }

    // Left-to-right dedup fold. Requests whose fingerprint is already cached
    // are dropped; the rest are cached and appended to forwarded. Every
    // fingerprint inserted by this call is appended to added.
    void filter(std::vector<ContentsRequest>& requests,
                std::vector<ContentsRequest>& forwarded,
                std::vector<Fingerprint>& added,
                bool verbose = false);

    // Undo a filter() whose forwarded requests never reached the broker.
    void forget(const std::vector<Fingerprint>& added);

    // Serialized form: magic, version, origin, sorted fingerprints, checksum.
    // Empty when the origin is longer than MAX_ORIGIN_LEN.
    std::vector<uint8_t> save() const;

    // Decode a serialized cache for the given origin. On any failure out is
    // left empty (scoped to origin) and the reason is returned.
    static CacheLoadStatus load(const uint8_t* data, size_t len,
                                const std::string& origin, SourceCache& out);

    // File wrappers. load_file never fails the caller: anything other than
    // OK leaves an empty cache and a warning (or info, for MISSING) on stderr.
    static CacheLoadStatus load_file(const char* path, const std::string& origin,
                                     SourceCache& out);
    // Write path.tmp, fsync, rename over path. Fails for an over-long origin.
    bool save_file(const char* path) const;

    bool operator==(const SourceCache& other) const {
        return origin_ == other.origin_ && seen_ == other.seen_;
    }

private:
    std::string origin_;
    std::unordered_set<Fingerprint> seen_;
};

} // namespace marquise
