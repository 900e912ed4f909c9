#include "broker/protocol.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <time.h>
#include <unistd.h>

#include <netinet/in.h>
#include <netinet/tcp.h>

#include <lz4frame.h>

namespace marquise {

void pack_envelope_header(uint8_t* dst, const EnvelopeHeader& h) {
    std::memcpy(dst, ENVELOPE_MAGIC, 4);
    dst[4] = h.type;
    dst[5] = h.flags;
    store_u16_le(dst + 6, h.origin_len);
    store_u64_le(dst + 8, h.raw_len);
    store_u64_le(dst + 16, h.body_len);
}

bool unpack_envelope_header(const uint8_t* src, EnvelopeHeader& h) {
    if (std::memcmp(src, ENVELOPE_MAGIC, 4) != 0) return false;
    h.type = src[4];
    h.flags = src[5];
    h.origin_len = load_u16_le(src + 6);
    h.raw_len = load_u64_le(src + 8);
    h.body_len = load_u64_le(src + 16);
    return true;
}

AckStatus decode_ack(uint8_t ack) {
    switch (ack) {
        case ACK_ON_DISK:        return AckStatus::ACCEPTED;
        case ACK_INVALID_ORIGIN: return AckStatus::REJECTED_ORIGIN;
        default:                 return AckStatus::FAILED;
    }
}

Lz4Compressor::Lz4Compressor() : ctx_(nullptr) {
    LZ4F_errorCode_t err = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        std::fprintf(stderr, "  [BROKER] LZ4 context creation failed: %s\n",
                     LZ4F_getErrorName(err));
        ctx_ = nullptr;
    }
}

Lz4Compressor::~Lz4Compressor() {
    if (ctx_) {
        LZ4F_freeCompressionContext(ctx_);
    }
}

bool Lz4Compressor::compress(const uint8_t* src, size_t len, std::vector<uint8_t>& out) {
    if (!ctx_) return false;

    // compressFrameBound gives the total max for a complete frame
    size_t cap = LZ4F_compressFrameBound(len, nullptr);
    out.resize(cap);

    // LZ4 streaming compression: compressBegin + compressUpdate + compressEnd
    size_t hdr_sz = LZ4F_compressBegin(ctx_, out.data(), cap, nullptr);
    if (LZ4F_isError(hdr_sz)) {
        std::fprintf(stderr, "  [BROKER] LZ4 compressBegin error: %s\n",
                     LZ4F_getErrorName(hdr_sz));
        return false;
    }

    size_t body_sz = LZ4F_compressUpdate(ctx_, out.data() + hdr_sz, cap - hdr_sz,
                                         src, len, nullptr);
    if (LZ4F_isError(body_sz)) {
        std::fprintf(stderr, "  [BROKER] LZ4 compressUpdate error: %s\n",
                     LZ4F_getErrorName(body_sz));
        return false;
    }

    size_t ftr_sz = LZ4F_compressEnd(ctx_, out.data() + hdr_sz + body_sz,
                                     cap - hdr_sz - body_sz, nullptr);
    if (LZ4F_isError(ftr_sz)) {
        std::fprintf(stderr, "  [BROKER] LZ4 compressEnd error: %s\n",
                     LZ4F_getErrorName(ftr_sz));
        return false;
    }

    out.resize(hdr_sz + body_sz + ftr_sz);
    return true;
}

static double clock_monotonic() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

int connect_to(const char* host, int port, double timeout_sec) {
    char port_str[16];
    std::snprintf(port_str, sizeof(port_str), "%d", port);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host, port_str, &hints, &res);
    if (gai != 0) {
        std::fprintf(stderr, "  [BROKER] Cannot resolve %s: %s\n", host, gai_strerror(gai));
        return -1;
    }

    int fd = -1;
    for (struct addrinfo* ai = res; ai && fd < 0; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            ::close(fd);
            fd = -1;
            continue;
        }

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int timeout_ms = static_cast<int>(timeout_sec * 1000);
            int so_err = 0;
            socklen_t so_len = sizeof(so_err);
            int pr;
            do {
                pr = poll(&pfd, 1, timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr == 1 &&
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) == 0) {
                ret = so_err == 0 ? 0 : -1;
                errno = so_err;
            } else {
                errno = ETIMEDOUT;
            }
        }

        if (ret < 0) {
            ::close(fd);
            fd = -1;
        }
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        std::fprintf(stderr, "  [BROKER] connect(%s:%d) failed: %s\n",
                     host, port, strerror(errno));
        return -1;
    }

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

bool send_all(int fd, const uint8_t* data, size_t len, double timeout_sec) {
    double deadline = clock_monotonic() + timeout_sec;
    size_t sent = 0;

    while (sent < len) {
        double remaining = deadline - clock_monotonic();
        if (remaining <= 0) return false;

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int timeout_ms = static_cast<int>(remaining * 1000);
        if (timeout_ms < 1) timeout_ms = 1;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;
        if (pfd.revents & (POLLERR | POLLHUP)) return false;

        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
        deadline = clock_monotonic() + timeout_sec;  // inactivity, not total
    }

    return true;
}

bool recv_all(int fd, uint8_t* data, size_t len, double timeout_sec) {
    double deadline = clock_monotonic() + timeout_sec;
    size_t got = 0;

    while (got < len) {
        int timeout_ms = -1;
        if (timeout_sec >= 0) {
            double remaining = deadline - clock_monotonic();
            if (remaining <= 0) return false;
            timeout_ms = static_cast<int>(remaining * 1000);
            if (timeout_ms < 1) timeout_ms = 1;
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        ssize_t n = ::recv(fd, data + got, len - got, 0);
        if (n == 0) return false;  // peer closed
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return false;
        }
        got += static_cast<size_t>(n);
    }

    return true;
}

} // namespace marquise
