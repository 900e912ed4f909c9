#pragma once

#include "broker/protocol.hpp"
#include "broker/transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace marquise {

// TCP broker client. Bursts use a fresh connection per call; contents
// batches hold one connection for the batch. Not shared between threads.
class TcpBrokerTransport : public BrokerTransport {
public:
    TcpBrokerTransport(const char* host, int port, const char* origin,
                       double send_timeout_sec = SEND_TIMEOUT_SEC);

    TcpBrokerTransport(const TcpBrokerTransport&) = delete;
    TcpBrokerTransport& operator=(const TcpBrokerTransport&) = delete;

    AckStatus transmit_burst(const uint8_t* data, size_t len) override;
    std::unique_ptr<BrokerConnection> open_contents_connection() override;

    // Stats for display
    struct Stats {
        uint64_t units_sent;
        uint64_t bytes_sent;     // on the wire, after compression
        uint64_t connects;
        uint64_t failures;
    };
    Stats get_stats() const;

private:
    friend class TcpContentsConnection;

    // Send header + origin + body on fd and read the acknowledgment byte.
    // An origin longer than MAX_ORIGIN_LEN is refused locally as REJECTED_ORIGIN.
    AckStatus exchange(int fd, uint8_t type, uint8_t flags, uint64_t raw_len,
                       const uint8_t* body, size_t body_len);

    std::string host_;
    int port_;
    std::string origin_;
    double send_timeout_sec_;

    Lz4Compressor lz4_;
    std::vector<uint8_t> lz4_buf_;    // reused between bursts
    std::vector<uint8_t> frame_buf_;  // header + origin

    std::atomic<uint64_t> units_sent_;
    std::atomic<uint64_t> bytes_sent_;
    std::atomic<uint64_t> connects_;
    std::atomic<uint64_t> failures_;
};

} // namespace marquise
