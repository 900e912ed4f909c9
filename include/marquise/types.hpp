#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace marquise {

// Point record layout
constexpr size_t POINT_HEADER_SIZE = 24;   // address(8) + time(8) + value/length(8)
constexpr size_t POINT_LENGTH_OFFSET = 16;

// Contents request layout: address(8) + length(8) + source dict bytes
constexpr size_t CONTENTS_HEADER_SIZE = 16;

// A burst should be, at most, very close to this size unless a single
// extended point is longer on its own.
constexpr size_t IDEAL_BURST_SIZE = 16 * 1048576;

// Idle sleep between spool polls when nothing is ready
constexpr double IDLE_INTERVAL_SEC = 1.0;

constexpr size_t MAX_ORIGIN_LEN    = 32;
constexpr size_t MAX_NAMESPACE_LEN = 64;

// Bit 0 of an address marks the point as extended (variable-length payload)
constexpr uint64_t ADDRESS_EXTENDED_BIT = 0x1;

using Address = uint64_t;
using Fingerprint = uint64_t;

inline constexpr bool is_address_extended(Address addr) {
    return (addr & ADDRESS_EXTENDED_BIT) != 0;
}

// Little-endian loads/stores. Wire formats are LE regardless of host order.
inline uint64_t load_u64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline uint32_t load_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint16_t load_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline void store_u64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

inline void store_u32_le(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

inline void store_u16_le(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
}

// 64-bit FNV-1a. Used for SourceDict fingerprints and the cache file checksum.
constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME        = 0x100000001b3ULL;

inline uint64_t fnv1a64(const uint8_t* data, size_t len,
                        uint64_t seed = FNV_OFFSET_BASIS) {
    uint64_t h = seed;
    for (size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= FNV_PRIME;
    }
    return h;
}

// Result of pulling one item from a lazy decoder
enum class ReadStatus {
    OK,
    END,
    FORMAT_ERROR,
};

// Broker acknowledgment of one transmitted unit
enum class AckStatus {
    ACCEPTED,
    REJECTED_ORIGIN,
    FAILED,          // connection, send or protocol failure
};

inline const char* ack_status_name(AckStatus s) {
    switch (s) {
        case AckStatus::ACCEPTED:        return "accepted";
        case AckStatus::REJECTED_ORIGIN: return "rejected (invalid origin)";
        case AckStatus::FAILED:          return "failed";
    }
    return "unknown";
}

// Origins and spool namespaces are restricted to ASCII alphanumerics
inline bool is_valid_name(const char* s, size_t max_len) {
    size_t n = std::strlen(s);
    if (n == 0 || n > max_len) return false;
    for (size_t i = 0; i < n; ++i) {
        char c = s[i];
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9');
        if (!ok) return false;
    }
    return true;
}

} // namespace marquise
