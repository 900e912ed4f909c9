#include "dedup/source_cache.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace marquise {

const char* cache_load_status_name(CacheLoadStatus s) {
    switch (s) {
        case CacheLoadStatus::OK:              return "ok";
        case CacheLoadStatus::MISSING:         return "no cache file";
        case CacheLoadStatus::IO_ERROR:        return "read error";
        case CacheLoadStatus::BAD_MAGIC:       return "bad magic";
        case CacheLoadStatus::BAD_VERSION:     return "unsupported version";
        case CacheLoadStatus::TRUNCATED:       return "truncated";
        case CacheLoadStatus::TRAILING_BYTES:  return "trailing bytes after checksum";
        case CacheLoadStatus::BAD_CHECKSUM:    return "checksum mismatch";
        case CacheLoadStatus::ORIGIN_MISMATCH: return "cache belongs to another origin";
    }
    return "unknown";
}

SourceCache::SourceCache(std::string origin)
    : origin_(std::move(origin))
{
}

void SourceCache::filter(std::vector<ContentsRequest>& requests,
                         std::vector<ContentsRequest>& forwarded,
                         std::vector<Fingerprint>& added,
                         bool verbose) {
    for (auto& req : requests) {
        Fingerprint fp = req.source_dict.fingerprint();
        if (!insert(fp)) {
            if (verbose) {
                std::printf("  [CACHE] Seen source dict for %016llx before, ignoring\n",
                            static_cast<unsigned long long>(req.address));
            }
            continue;
        }
        added.push_back(fp);
        forwarded.push_back(std::move(req));
    }
}

void SourceCache::forget(const std::vector<Fingerprint>& added) {
    for (Fingerprint fp : added) {
        seen_.erase(fp);
    }
}

std::vector<uint8_t> SourceCache::save() const {
    if (origin_.size() > MAX_ORIGIN_LEN) return {};

    std::vector<Fingerprint> sorted(seen_.begin(), seen_.end());
    std::sort(sorted.begin(), sorted.end());

    // magic(4) version(4) origin_len(2) origin count(8) fps(8n) checksum(8)
    size_t body = 4 + 4 + 2 + origin_.size() + 8 + 8 * sorted.size();
    std::vector<uint8_t> out(body + 8);

    uint8_t* p = out.data();
    std::memcpy(p, CACHE_MAGIC, 4);
    p += 4;
    store_u32_le(p, CACHE_VERSION);
    p += 4;
    store_u16_le(p, static_cast<uint16_t>(origin_.size()));
    p += 2;
    std::memcpy(p, origin_.data(), origin_.size());
    p += origin_.size();
    store_u64_le(p, static_cast<uint64_t>(sorted.size()));
    p += 8;
    for (Fingerprint fp : sorted) {
        store_u64_le(p, fp);
        p += 8;
    }

    store_u64_le(p, fnv1a64(out.data(), body));
    return out;
}

CacheLoadStatus SourceCache::load(const uint8_t* data, size_t len,
                                  const std::string& origin, SourceCache& out) {
    out.origin_ = origin;
    out.seen_.clear();

    size_t off = 0;
    auto need = [&](size_t n) { return len - off >= n; };

    if (!need(4)) return CacheLoadStatus::TRUNCATED;
    if (std::memcmp(data, CACHE_MAGIC, 4) != 0) return CacheLoadStatus::BAD_MAGIC;
    off += 4;

    if (!need(4 + 2)) return CacheLoadStatus::TRUNCATED;
    if (load_u32_le(data + off) != CACHE_VERSION) return CacheLoadStatus::BAD_VERSION;
    off += 4;
    size_t origin_len = load_u16_le(data + off);
    off += 2;

    if (!need(origin_len + 8)) return CacheLoadStatus::TRUNCATED;
    std::string file_origin(reinterpret_cast<const char*>(data + off), origin_len);
    off += origin_len;
    uint64_t count = load_u64_le(data + off);
    off += 8;

    if (count > (len - off) / 8 || !need(count * 8 + 8)) {
        return CacheLoadStatus::TRUNCATED;
    }
    size_t body = off + static_cast<size_t>(count) * 8;
    if (body + 8 != len) return CacheLoadStatus::TRAILING_BYTES;
    if (load_u64_le(data + body) != fnv1a64(data, body)) {
        return CacheLoadStatus::BAD_CHECKSUM;
    }
    if (file_origin != origin) return CacheLoadStatus::ORIGIN_MISMATCH;

    out.seen_.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        out.seen_.insert(load_u64_le(data + off));
        off += 8;
    }
    return CacheLoadStatus::OK;
}

static bool read_file(const char* path, std::vector<uint8_t>& out, bool& missing) {
    missing = false;
    int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        missing = (errno == ENOENT);
        return false;
    }

    uint8_t buf[65536];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return false;
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    ::close(fd);
    return true;
}

CacheLoadStatus SourceCache::load_file(const char* path, const std::string& origin,
                                       SourceCache& out) {
    std::printf("  [CACHE] Reading source dict cache from %s\n", path);

    std::vector<uint8_t> bytes;
    bool missing = false;
    CacheLoadStatus st;
    if (!read_file(path, bytes, missing)) {
        out = SourceCache(origin);
        st = missing ? CacheLoadStatus::MISSING : CacheLoadStatus::IO_ERROR;
    } else {
        st = load(bytes.data(), bytes.size(), origin, out);
    }

    if (st == CacheLoadStatus::MISSING) {
        std::printf("  [CACHE] No cache file yet, starting with empty cache\n");
    } else if (st != CacheLoadStatus::OK) {
        std::fprintf(stderr, "  [CACHE] WARNING: error decoding cache file %s: %s. "
                     "Continuing with empty initial cache\n",
                     path, cache_load_status_name(st));
    } else {
        std::printf("  [CACHE] Loaded %zu fingerprints\n", out.size());
    }
    return st;
}

bool SourceCache::save_file(const char* path) const {
    std::vector<uint8_t> bytes = save();
    if (bytes.empty()) {
        std::fprintf(stderr, "  [CACHE] Origin of %zu bytes exceeds %zu, not saving\n",
                     origin_.size(), MAX_ORIGIN_LEN);
        return false;
    }

    char tmp_path[4096];
    int n = std::snprintf(tmp_path, sizeof(tmp_path), "%s.tmp", path);
    if (n < 0 || static_cast<size_t>(n) >= sizeof(tmp_path)) {
        std::fprintf(stderr, "  [CACHE] Cache path too long: %s\n", path);
        return false;
    }

    int fd = ::open(tmp_path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        std::fprintf(stderr, "  [CACHE] open(%s) failed: %s\n", tmp_path, strerror(errno));
        return false;
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t w = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::fprintf(stderr, "  [CACHE] write(%s) failed: %s\n", tmp_path, strerror(errno));
            ::close(fd);
            ::unlink(tmp_path);
            return false;
        }
        written += static_cast<size_t>(w);
    }

    if (::fsync(fd) < 0) {
        std::fprintf(stderr, "  [CACHE] fsync(%s) failed: %s\n", tmp_path, strerror(errno));
        ::close(fd);
        ::unlink(tmp_path);
        return false;
    }
    ::close(fd);

    if (::rename(tmp_path, path) < 0) {
        std::fprintf(stderr, "  [CACHE] rename(%s -> %s) failed: %s\n",
                     tmp_path, path, strerror(errno));
        ::unlink(tmp_path);
        return false;
    }
    return true;
}

} // namespace marquise
