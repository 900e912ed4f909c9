#pragma once

#include "codec/contents_codec.hpp"
#include "marquise/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace marquise {

// A connection held for one whole contents batch. Closed on destruction.
class BrokerConnection {
public:
    virtual ~BrokerConnection() = default;

    // Send one update and wait for its acknowledgment
    virtual AckStatus send_contents(const ContentsRequest& req) = 0;
};

// Broker side of the transmit loops. Each loop owns its own transport.
class BrokerTransport {
public:
    virtual ~BrokerTransport() = default;

    // Send one burst and wait for its acknowledgment. Stateless per call.
    virtual AckStatus transmit_burst(const uint8_t* data, size_t len) = 0;

    // nullptr if the broker cannot be reached
    virtual std::unique_ptr<BrokerConnection> open_contents_connection() = 0;
};

} // namespace marquise
