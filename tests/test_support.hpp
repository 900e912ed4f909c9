#pragma once

#include "broker/transport.hpp"
#include "codec/contents_codec.hpp"
#include "marquise/types.hpp"
#include "spool/spool.hpp"

#include <cstdint>
#include <cstring>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace marquise {
namespace test {

// Standard point: even address, time, 8-byte value
inline void append_point(std::vector<uint8_t>& buf, Address addr, uint64_t time,
                         uint64_t value) {
    size_t off = buf.size();
    buf.resize(off + POINT_HEADER_SIZE);
    store_u64_le(buf.data() + off, addr & ~ADDRESS_EXTENDED_BIT);
    store_u64_le(buf.data() + off + 8, time);
    store_u64_le(buf.data() + off + 16, value);
}

// Extended point with payload_len bytes of payload (filled with fill)
inline void append_extended_point(std::vector<uint8_t>& buf, Address addr, uint64_t time,
                                  size_t payload_len, uint8_t fill = 0xAB) {
    size_t off = buf.size();
    buf.resize(off + POINT_HEADER_SIZE + payload_len, fill);
    store_u64_le(buf.data() + off, addr | ADDRESS_EXTENDED_BIT);
    store_u64_le(buf.data() + off + 8, time);
    store_u64_le(buf.data() + off + 16, static_cast<uint64_t>(payload_len));
}

// Contents request in batch form with raw dict bytes
inline void append_contents(std::vector<uint8_t>& buf, Address addr, const std::string& dict) {
    size_t off = buf.size();
    buf.resize(off + CONTENTS_HEADER_SIZE + dict.size());
    store_u64_le(buf.data() + off, addr);
    store_u64_le(buf.data() + off + 8, static_cast<uint64_t>(dict.size()));
    if (!dict.empty()) {
        std::memcpy(buf.data() + off + CONTENTS_HEADER_SIZE, dict.data(), dict.size());
    }
}

inline ContentsRequest make_request(Address addr, const std::string& dict) {
    ContentsRequest req;
    req.address = addr;
    SourceDict::decode(reinterpret_cast<const uint8_t*>(dict.data()), dict.size(),
                       req.source_dict);
    return req;
}

// --- Fake spool ---

struct FakeSpoolState {
    std::deque<std::vector<uint8_t>> ready;
    std::vector<std::vector<uint8_t>> sealed;
    int fetches = 0;
    int releases = 0;
    bool fail_seal = false;
};

class FakeBatch : public Batch {
public:
    FakeBatch(FakeSpoolState& state, std::vector<uint8_t> bytes)
        : state_(state), bytes_(std::move(bytes)), sealed_(false) {}

    ~FakeBatch() override {
        if (!sealed_) {
            // Unsealed batches go back to the front of the queue
            state_.releases++;
            state_.ready.push_front(std::move(bytes_));
        }
    }

    const uint8_t* data() const override { return bytes_.data(); }
    size_t size() const override { return bytes_.size(); }

    bool seal() override {
        if (sealed_ || state_.fail_seal) return false;
        sealed_ = true;
        state_.sealed.push_back(bytes_);
        return true;
    }

private:
    FakeSpoolState& state_;
    std::vector<uint8_t> bytes_;
    bool sealed_;
};

class FakeSpool : public Spool {
public:
    explicit FakeSpool(FakeSpoolState& state) : state_(state) {}

    std::unique_ptr<Batch> next_batch() override {
        state_.fetches++;
        if (state_.ready.empty()) return nullptr;
        std::vector<uint8_t> bytes = std::move(state_.ready.front());
        state_.ready.pop_front();
        return std::make_unique<FakeBatch>(state_, std::move(bytes));
    }

private:
    FakeSpoolState& state_;
};

// --- Fake broker ---

struct FakeBrokerState {
    std::vector<std::vector<uint8_t>> bursts;
    std::vector<ContentsRequest> updates;
    int connections_opened = 0;
    int connections_closed = 0;
    int units_attempted = 0;

    // Unit index (counted across all calls) that gets fail_with instead of ACCEPTED
    int fail_at = -1;
    AckStatus fail_with = AckStatus::FAILED;
    bool refuse_connections = false;
};

class FakeConnection : public BrokerConnection {
public:
    explicit FakeConnection(FakeBrokerState& state) : state_(state) {}
    ~FakeConnection() override { state_.connections_closed++; }

    AckStatus send_contents(const ContentsRequest& req) override {
        int unit = state_.units_attempted++;
        if (unit == state_.fail_at) return state_.fail_with;
        state_.updates.push_back(req);
        return AckStatus::ACCEPTED;
    }

private:
    FakeBrokerState& state_;
};

class FakeBroker : public BrokerTransport {
public:
    explicit FakeBroker(FakeBrokerState& state) : state_(state) {}

    AckStatus transmit_burst(const uint8_t* data, size_t len) override {
        int unit = state_.units_attempted++;
        if (unit == state_.fail_at) return state_.fail_with;
        state_.bursts.emplace_back(data, data + len);
        return AckStatus::ACCEPTED;
    }

    std::unique_ptr<BrokerConnection> open_contents_connection() override {
        if (state_.refuse_connections) return nullptr;
        state_.connections_opened++;
        return std::make_unique<FakeConnection>(state_);
    }

private:
    FakeBrokerState& state_;
};

} // namespace test
} // namespace marquise
