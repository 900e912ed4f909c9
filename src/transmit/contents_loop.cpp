#include "transmit/contents_loop.hpp"
#include "broker/transport.hpp"
#include "spool/spool.hpp"
#include "transmit/shutdown.hpp"

#include <cstdio>
#include <memory>
#include <utility>

namespace marquise {

ContentsLoop::ContentsLoop(Spool& spool, BrokerTransport& broker, SourceCache cache,
                           const ShutdownSignal& shutdown, const LoopConfig& config)
    : spool_(spool)
    , broker_(broker)
    , cache_(std::move(cache))
    , shutdown_(shutdown)
    , config_(config)
    , batches_sealed_(0)
    , batches_failed_(0)
    , updates_sent_(0)
    , duplicates_dropped_(0)
{
}

LoopExit ContentsLoop::run() {
    std::printf("  [CONTENTS] Transmit loop started (%zu cached fingerprints)\n",
                cache_.size());

    for (;;) {
        BatchResult r = run_once();
        switch (r) {
            case BatchResult::SEALED:
                break;
            case BatchResult::FORMAT_ERROR:
                std::fprintf(stderr, "  [CONTENTS] Stopping: malformed batch left in spool\n");
                return LoopExit::FORMAT_ERROR;
            case BatchResult::REJECTED_ORIGIN:
                std::fprintf(stderr, "  [CONTENTS] Stopping: broker rejected origin\n");
                return LoopExit::REJECTED_ORIGIN;
            case BatchResult::TRANSMIT_FAILED:
            case BatchResult::SEAL_FAILED:
                std::fprintf(stderr, "  [CONTENTS] Batch %s, retrying in %.1f s\n",
                             batch_result_name(r), config_.idle_interval_sec);
                sleep_sec(config_.idle_interval_sec);
                break;
            case BatchResult::IDLE:
                sleep_sec(config_.idle_interval_sec);
                break;
        }

        if (shutdown_.requested()) {
            std::printf("  [CONTENTS] Shutdown requested, loop stopped\n");
            return LoopExit::SHUTDOWN;
        }
    }
}

BatchResult ContentsLoop::run_once() {
    std::unique_ptr<Batch> batch = spool_.next_batch();
    if (!batch) return BatchResult::IDLE;

    if (config_.verbose) {
        std::printf("  [CONTENTS] Got %zu bytes of contents, starting transmission\n",
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

BatchResult ContentsLoop::process(Batch& batch) {
    // Decode the whole batch first; contents batches are small and a
    // malformed one must not be partially forwarded.
    std::vector<ContentsRequest> requests;
    ContentsReader reader(batch.data(), batch.size());
    for (;;) {
        ContentsRequest req;
        ReadStatus st = reader.next(req);
        if (st == ReadStatus::END) break;
        if (st == ReadStatus::FORMAT_ERROR) {
            std::fprintf(stderr, "  [CONTENTS] Format error at offset %zu: %s\n",
                         reader.offset(), reader.error() ? reader.error() : "unknown");
            return BatchResult::FORMAT_ERROR;
        }
        requests.push_back(std::move(req));
    }

    size_t total = requests.size();
    std::vector<ContentsRequest> forwarded;
    std::vector<Fingerprint> added;
    cache_.filter(requests, forwarded, added, config_.verbose);

    AckStatus ack = transmit(forwarded);
    if (ack != AckStatus::ACCEPTED) {
        // Nothing in this batch counts as forwarded until it is sealed
        cache_.forget(added);
        return ack == AckStatus::REJECTED_ORIGIN ? BatchResult::REJECTED_ORIGIN
                                                 : BatchResult::TRANSMIT_FAILED;
    }

    if (!batch.seal()) {
        std::fprintf(stderr, "  [CONTENTS] Batch transmitted but could not be sealed\n");
        // The broker has these updates; keep them cached
        return BatchResult::SEAL_FAILED;
    }

    updates_sent_.fetch_add(forwarded.size(), std::memory_order_relaxed);
    duplicates_dropped_.fetch_add(total - forwarded.size(), std::memory_order_relaxed);
    if (config_.verbose) {
        std::printf("  [CONTENTS] Transmission complete: %zu sent, %zu duplicates\n",
                    forwarded.size(), total - forwarded.size());
    }
    return BatchResult::SEALED;
}

// The connection is released before returning, on every path
AckStatus ContentsLoop::transmit(const std::vector<ContentsRequest>& forwarded) {
    if (forwarded.empty()) return AckStatus::ACCEPTED;

    std::unique_ptr<BrokerConnection> conn = broker_.open_contents_connection();
    if (!conn) {
        std::fprintf(stderr, "  [CONTENTS] No broker connection, batch left unsealed\n");
        return AckStatus::FAILED;
    }

    for (const auto& req : forwarded) {
        if (config_.verbose) {
            std::printf("  [CONTENTS] Sending contents update for %016llx\n",
                        static_cast<unsigned long long>(req.address));
        }

        AckStatus ack = conn->send_contents(req);
        if (ack != AckStatus::ACCEPTED) {
            std::fprintf(stderr, "  [CONTENTS] Update %s, batch left unsealed\n",
                         ack_status_name(ack));
            return ack;
        }
    }
    return AckStatus::ACCEPTED;
}

ContentsLoop::Stats ContentsLoop::get_stats() const {
    Stats s{};
    s.batches_sealed = batches_sealed_.load(std::memory_order_relaxed);
    s.batches_failed = batches_failed_.load(std::memory_order_relaxed);
    s.updates_sent = updates_sent_.load(std::memory_order_relaxed);
    s.duplicates_dropped = duplicates_dropped_.load(std::memory_order_relaxed);
    return s;
}

} // namespace marquise
