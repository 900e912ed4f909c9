#pragma once

#include "transmit/loop_common.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace marquise {

class Batch;
class BrokerTransport;
class ShutdownSignal;
class Spool;

// Drains the points spool: each batch is validated, chunked into bursts and
// sent burst by burst, each burst acknowledged before the next. The batch is
// sealed only after its last burst is accepted. Shutdown is observed only
// between batches.
class PointsLoop {
public:
    PointsLoop(Spool& spool, BrokerTransport& broker,
               const ShutdownSignal& shutdown, const LoopConfig& config);

    PointsLoop(const PointsLoop&) = delete;
    PointsLoop& operator=(const PointsLoop&) = delete;

    // Run until shutdown or a fatal condition
    LoopExit run();

    // One fetch/process/transmit/seal cycle, without sleeping
    BatchResult run_once();

    struct Stats {
        uint64_t batches_sealed;
        uint64_t batches_failed;
        uint64_t bursts_sent;
        uint64_t points_sent;
        uint64_t bytes_sent;
    };
    Stats get_stats() const;

private:
    BatchResult process(Batch& batch);

    Spool& spool_;
    BrokerTransport& broker_;
    const ShutdownSignal& shutdown_;
    LoopConfig config_;

    // Reused between batches
    std::vector<uint8_t> burst_;

    std::atomic<uint64_t> batches_sealed_;
    std::atomic<uint64_t> batches_failed_;
    std::atomic<uint64_t> bursts_sent_;
    std::atomic<uint64_t> points_sent_;
    std::atomic<uint64_t> bytes_sent_;
};

} // namespace marquise
