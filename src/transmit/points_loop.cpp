#include "transmit/points_loop.hpp"
#include "broker/transport.hpp"
#include "codec/point_codec.hpp"
#include "spool/spool.hpp"
#include "transmit/burst_chunker.hpp"
#include "transmit/shutdown.hpp"

#include <cstdio>

namespace marquise {

PointsLoop::PointsLoop(Spool& spool, BrokerTransport& broker,
                       const ShutdownSignal& shutdown, const LoopConfig& config)
    : spool_(spool)
    , broker_(broker)
    , shutdown_(shutdown)
    , config_(config)
    , batches_sealed_(0)
    , batches_failed_(0)
    , bursts_sent_(0)
    , points_sent_(0)
    , bytes_sent_(0)
{
}

LoopExit PointsLoop::run() {
    std::printf("  [POINTS] Transmit loop started\n");

    for (;;) {
        BatchResult r = run_once();
        switch (r) {
            case BatchResult::SEALED:
                break;
            case BatchResult::FORMAT_ERROR:
                std::fprintf(stderr, "  [POINTS] Stopping: malformed batch left in spool\n");
                return LoopExit::FORMAT_ERROR;
            case BatchResult::REJECTED_ORIGIN:
                std::fprintf(stderr, "  [POINTS] Stopping: broker rejected origin\n");
                return LoopExit::REJECTED_ORIGIN;
            case BatchResult::TRANSMIT_FAILED:
            case BatchResult::SEAL_FAILED:
                std::fprintf(stderr, "  [POINTS] Batch %s, retrying in %.1f s\n",
                             batch_result_name(r), config_.idle_interval_sec);
                sleep_sec(config_.idle_interval_sec);
                break;
            case BatchResult::IDLE:
                sleep_sec(config_.idle_interval_sec);
                break;
        }

        if (shutdown_.requested()) {
            std::printf("  [POINTS] Shutdown requested, loop stopped\n");
            return LoopExit::SHUTDOWN;
        }
    }
}

BatchResult PointsLoop::run_once() {
    std::unique_ptr<Batch> batch = spool_.next_batch();
    if (!batch) return BatchResult::IDLE;

    if (config_.verbose) {
        std::printf("  [POINTS] Got %zu bytes of points, starting transmission\n",
                    batch->size());
    }

    BatchResult r = process(*batch);
    if (r == BatchResult::SEALED) {
        batches_sealed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        batches_failed_.fetch_add(1, std::memory_order_relaxed);
    }
    return r;
}

BatchResult PointsLoop::process(Batch& batch) {
    // Reject a malformed batch before any of it reaches the broker
    size_t point_count = 0;
    const char* error = nullptr;
    if (!validate_points(batch.data(), batch.size(), point_count, &error)) {
        std::fprintf(stderr, "  [POINTS] Format error after %zu points: %s\n",
                     point_count, error ? error : "unknown");
        return BatchResult::FORMAT_ERROR;
    }

    PointReader reader(batch.data(), batch.size());
    BurstChunker chunker(reader, config_.burst_size);

    for (;;) {
        ReadStatus st = chunker.next(burst_);
        if (st == ReadStatus::END) break;
        if (st == ReadStatus::FORMAT_ERROR) {
            std::fprintf(stderr, "  [POINTS] Format error: %s\n",
                         chunker.error() ? chunker.error() : "unknown");
            return BatchResult::FORMAT_ERROR;
        }

        if (config_.verbose) {
            std::printf("  [POINTS] Sending burst of %zu bytes\n", burst_.size());
        }

        AckStatus ack = broker_.transmit_burst(burst_.data(), burst_.size());
        if (ack == AckStatus::REJECTED_ORIGIN) {
            return BatchResult::REJECTED_ORIGIN;
        }
        if (ack != AckStatus::ACCEPTED) {
            std::fprintf(stderr, "  [POINTS] Burst %s, batch left unsealed\n",
                         ack_status_name(ack));
            return BatchResult::TRANSMIT_FAILED;
        }

        bursts_sent_.fetch_add(1, std::memory_order_relaxed);
        bytes_sent_.fetch_add(burst_.size(), std::memory_order_relaxed);
    }

    if (!batch.seal()) {
        std::fprintf(stderr, "  [POINTS] Batch transmitted but could not be sealed\n");
        return BatchResult::SEAL_FAILED;
    }

    points_sent_.fetch_add(point_count, std::memory_order_relaxed);
    if (config_.verbose) {
        std::printf("  [POINTS] Transmission complete, %zu points sealed\n", point_count);
    }
    return BatchResult::SEALED;
}

PointsLoop::Stats PointsLoop::get_stats() const {
    Stats s{};
    s.batches_sealed = batches_sealed_.load(std::memory_order_relaxed);
    s.batches_failed = batches_failed_.load(std::memory_order_relaxed);
    s.bursts_sent = bursts_sent_.load(std::memory_order_relaxed);
    s.points_sent = points_sent_.load(std::memory_order_relaxed);
    s.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    return s;
}

} // namespace marquise
