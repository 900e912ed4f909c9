#pragma once

#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Forward declare LZ4F types to avoid including lz4frame.h in header
typedef struct LZ4F_cctx_s LZ4F_cctx;

namespace marquise {

// Broker protocol constants
constexpr int    DEFAULT_POINTS_PORT   = 5560;
constexpr int    DEFAULT_CONTENTS_PORT = 5580;
constexpr double CONNECT_TIMEOUT_SEC   = 10.0;
constexpr double SEND_TIMEOUT_SEC      = 30.0;   // without progress
constexpr double ACK_WAIT_FOREVER      = -1.0;

// Envelope header (24 bytes, little-endian):
//   magic "MQV1" (4) | type (1) | flags (1) | origin_len (2)
//   raw_len (8)      | body_len (8)
// followed by origin bytes, then body bytes.
constexpr uint8_t ENVELOPE_MAGIC[4]    = {'M', 'Q', 'V', '1'};
constexpr size_t  ENVELOPE_HEADER_SIZE = 24;

constexpr uint8_t MSG_POINTS_BURST    = 1;
constexpr uint8_t MSG_CONTENTS_UPDATE = 2;

constexpr uint8_t FLAG_LZ4_FRAME = 0x01;   // body is one LZ4 frame of raw_len bytes

// One-byte acknowledgment
constexpr uint8_t ACK_ON_DISK        = 0x00;
constexpr uint8_t ACK_INVALID_ORIGIN = 0x01;

struct EnvelopeHeader {
    uint8_t  type;
    uint8_t  flags;
    uint16_t origin_len;
    uint64_t raw_len;
    uint64_t body_len;
};

// dst must have at least ENVELOPE_HEADER_SIZE bytes.
void pack_envelope_header(uint8_t* dst, const EnvelopeHeader& h);

// Returns false if the magic does not match.
bool unpack_envelope_header(const uint8_t* src, EnvelopeHeader& h);

// Map an acknowledgment byte; unknown values are a protocol failure.
AckStatus decode_ack(uint8_t ack);

// LZ4 frame compressor with a context allocated once and reused per burst.
class Lz4Compressor {
public:
    Lz4Compressor();
    ~Lz4Compressor();

    Lz4Compressor(const Lz4Compressor&) = delete;
    Lz4Compressor& operator=(const Lz4Compressor&) = delete;

    bool ok() const { return ctx_ != nullptr; }

    // Replace out with a complete LZ4 frame of src. Returns false on error.
    bool compress(const uint8_t* src, size_t len, std::vector<uint8_t>& out);

private:
    LZ4F_cctx* ctx_;
};

// Resolve host and connect with a timeout. Returns a non-blocking
// socket fd with TCP_NODELAY set, or -1.
int connect_to(const char* host, int port, double timeout_sec);

// Non-blocking send loop using poll(POLLOUT). The timeout restarts
// whenever send() makes progress, so it bounds a stalled peer rather
// than the length of the whole transfer.
// Returns true if all data was sent, false on timeout or error.
// Always uses MSG_NOSIGNAL.
bool send_all(int fd, const uint8_t* data, size_t len, double timeout_sec);

// Receive exactly len bytes. A negative timeout waits indefinitely.
// Returns false on timeout, error or EOF.
bool recv_all(int fd, uint8_t* data, size_t len, double timeout_sec);

} // namespace marquise
