#include "broker/tcp_transport.hpp"

#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace marquise {

class TcpContentsConnection : public BrokerConnection {
public:
    TcpContentsConnection(TcpBrokerTransport& transport, int fd)
        : transport_(transport)
        , fd_(fd)
    {
    }

    ~TcpContentsConnection() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    AckStatus send_contents(const ContentsRequest& req) override {
        if (fd_ < 0) return AckStatus::FAILED;

        body_.clear();
        encode_contents_request(req, body_);
        AckStatus st = transport_.exchange(fd_, MSG_CONTENTS_UPDATE, 0, body_.size(),
                                           body_.data(), body_.size());
        if (st == AckStatus::FAILED) {
            // Stream state is unknown after a failed exchange
            ::close(fd_);
            fd_ = -1;
        }
        return st;
    }

private:
    TcpBrokerTransport& transport_;
    int fd_;
    std::vector<uint8_t> body_;
};

TcpBrokerTransport::TcpBrokerTransport(const char* host, int port, const char* origin,
                                       double send_timeout_sec)
    : host_(host)
    , port_(port)
    , origin_(origin)
    , send_timeout_sec_(send_timeout_sec)
    , units_sent_(0)
    , bytes_sent_(0)
    , connects_(0)
    , failures_(0)
{
    frame_buf_.resize(ENVELOPE_HEADER_SIZE + origin_.size());
}

AckStatus TcpBrokerTransport::exchange(int fd, uint8_t type, uint8_t flags, uint64_t raw_len,
                                       const uint8_t* body, size_t body_len) {
    if (origin_.size() > MAX_ORIGIN_LEN) {
        std::fprintf(stderr, "  [BROKER] Origin of %zu bytes exceeds %zu, not sending\n",
                     origin_.size(), MAX_ORIGIN_LEN);
        return AckStatus::REJECTED_ORIGIN;
    }

    EnvelopeHeader h{};
    h.type = type;
    h.flags = flags;
    h.origin_len = static_cast<uint16_t>(origin_.size());
    h.raw_len = raw_len;
    h.body_len = body_len;

    pack_envelope_header(frame_buf_.data(), h);
    std::memcpy(frame_buf_.data() + ENVELOPE_HEADER_SIZE, origin_.data(), origin_.size());

    if (!send_all(fd, frame_buf_.data(), frame_buf_.size(), send_timeout_sec_) ||
        !send_all(fd, body, body_len, send_timeout_sec_)) {
        std::fprintf(stderr, "  [BROKER] Send to %s:%d failed\n", host_.c_str(), port_);
        failures_.fetch_add(1, std::memory_order_relaxed);
        return AckStatus::FAILED;
    }
    bytes_sent_.fetch_add(frame_buf_.size() + body_len, std::memory_order_relaxed);

    // No timeout on the acknowledgment: a silent broker stalls this loop
    uint8_t ack = 0;
    if (!recv_all(fd, &ack, 1, ACK_WAIT_FOREVER)) {
        std::fprintf(stderr, "  [BROKER] No acknowledgment from %s:%d\n",
                     host_.c_str(), port_);
        failures_.fetch_add(1, std::memory_order_relaxed);
        return AckStatus::FAILED;
    }

    AckStatus st = decode_ack(ack);
    if (st == AckStatus::FAILED) {
        std::fprintf(stderr, "  [BROKER] Unknown acknowledgment 0x%02x from %s:%d\n",
                     ack, host_.c_str(), port_);
        failures_.fetch_add(1, std::memory_order_relaxed);
    } else if (st == AckStatus::ACCEPTED) {
        units_sent_.fetch_add(1, std::memory_order_relaxed);
    }
    return st;
}

AckStatus TcpBrokerTransport::transmit_burst(const uint8_t* data, size_t len) {
    int fd = connect_to(host_.c_str(), port_, CONNECT_TIMEOUT_SEC);
    if (fd < 0) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return AckStatus::FAILED;
    }
    connects_.fetch_add(1, std::memory_order_relaxed);

    AckStatus st;
    if (lz4_.compress(data, len, lz4_buf_)) {
        st = exchange(fd, MSG_POINTS_BURST, FLAG_LZ4_FRAME, len,
                      lz4_buf_.data(), lz4_buf_.size());
    } else {
        // Fall back to the raw burst; the broker accepts both
        st = exchange(fd, MSG_POINTS_BURST, 0, len, data, len);
    }

    ::close(fd);
    return st;
}

std::unique_ptr<BrokerConnection> TcpBrokerTransport::open_contents_connection() {
    int fd = connect_to(host_.c_str(), port_, CONNECT_TIMEOUT_SEC);
    if (fd < 0) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    connects_.fetch_add(1, std::memory_order_relaxed);
    return std::make_unique<TcpContentsConnection>(*this, fd);
}

TcpBrokerTransport::Stats TcpBrokerTransport::get_stats() const {
    Stats s{};
    s.units_sent = units_sent_.load(std::memory_order_relaxed);
    s.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    s.connects = connects_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace marquise
