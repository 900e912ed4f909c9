#pragma once

#include "codec/contents_codec.hpp"
#include "dedup/source_cache.hpp"
#include "transmit/loop_common.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace marquise {

class Batch;
class BrokerTransport;
class ShutdownSignal;
class Spool;

// Drains the contents spool. Each batch is decoded, filtered through the
// source cache (first occurrence only) and the remaining updates are sent
// over one broker connection. The loop owns the cache; its fingerprints for
// a batch are kept only if the whole batch was accepted and sealed.
class ContentsLoop {
public:
    ContentsLoop(Spool& spool, BrokerTransport& broker, SourceCache cache,
                 const ShutdownSignal& shutdown, const LoopConfig& config);

    ContentsLoop(const ContentsLoop&) = delete;
    ContentsLoop& operator=(const ContentsLoop&) = delete;

    LoopExit run();
    BatchResult run_once();

    // Final cache state, read by the supervisor once the loop has stopped
    const SourceCache& cache() const { return cache_; }

    struct Stats {
        uint64_t batches_sealed;
        uint64_t batches_failed;
        uint64_t updates_sent;
        uint64_t duplicates_dropped;
    };
    Stats get_stats() const;

private:
    BatchResult process(Batch& batch);
    AckStatus transmit(const std::vector<ContentsRequest>& forwarded);

    Spool& spool_;
    BrokerTransport& broker_;
    SourceCache cache_;
    const ShutdownSignal& shutdown_;
    LoopConfig config_;

    std::atomic<uint64_t> batches_sealed_;
    std::atomic<uint64_t> batches_failed_;
    std::atomic<uint64_t> updates_sent_;
    std::atomic<uint64_t> duplicates_dropped_;
};

} // namespace marquise
