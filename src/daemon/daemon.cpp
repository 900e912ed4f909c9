#include "daemon/daemon.hpp"

#include <cstdio>
#include <utility>

namespace marquise {

const char* daemon_status_name(DaemonStatus s) {
    switch (s) {
        case DaemonStatus::OK:              return "ok";
        case DaemonStatus::LOOP_FAILED:     return "transmit loop failed";
        case DaemonStatus::REJECTED_ORIGIN: return "origin rejected by broker";
        case DaemonStatus::CACHE_NOT_SAVED: return "cache not saved";
        case DaemonStatus::INVALID_ORIGIN:  return "invalid origin";
    }
    return "unknown";
}

Daemon::Daemon(const DaemonConfig& config, const ShutdownSignal& shutdown,
               Spool& points_spool, Spool& contents_spool,
               BrokerTransport& points_broker, BrokerTransport& contents_broker)
    : config_(config)
    , stop_(&shutdown)
    , points_exit_(LoopExit::SHUTDOWN)
    , contents_exit_(LoopExit::SHUTDOWN)
    , loops_running_(0)
    , started_(false)
    , finished_(false)
    , status_(DaemonStatus::OK)
{
    // A missing or corrupt cache never stops startup
    SourceCache cache(config_.origin);
    SourceCache::load_file(config_.cache_file.c_str(), config_.origin, cache);

    points_loop_ = std::make_unique<PointsLoop>(points_spool, points_broker,
                                                stop_, config_.loop);
    contents_loop_ = std::make_unique<ContentsLoop>(contents_spool, contents_broker,
                                                    std::move(cache), stop_, config_.loop);
}

Daemon::~Daemon() {
    if (started_ && !finished_) {
        stop_.request();
        wait();
    }
}

void Daemon::start() {
    if (started_) return;
    started_ = true;

    if (!is_valid_name(config_.origin.c_str(), MAX_ORIGIN_LEN)) {
        std::fprintf(stderr, "  [DAEMON] Invalid origin '%s' (1-%zu alphanumerics), "
                     "not starting\n", config_.origin.c_str(), MAX_ORIGIN_LEN);
        status_ = DaemonStatus::INVALID_ORIGIN;
        finished_ = true;
        return;
    }

    loops_running_.store(2, std::memory_order_release);

    std::printf("  [DAEMON] Starting points transmitting thread\n");
    points_thread_ = std::thread(&Daemon::run_points, this);
    std::printf("  [DAEMON] Starting contents transmitting thread\n");
    contents_thread_ = std::thread(&Daemon::run_contents, this);
}

void Daemon::run_points() {
    points_exit_ = points_loop_->run();
    if (points_exit_ == LoopExit::REJECTED_ORIGIN) {
        stop_.request();
    }
    loops_running_.fetch_sub(1, std::memory_order_acq_rel);
}

void Daemon::run_contents() {
    contents_exit_ = contents_loop_->run();
    if (contents_exit_ == LoopExit::REJECTED_ORIGIN) {
        stop_.request();
    }
    loops_running_.fetch_sub(1, std::memory_order_acq_rel);
}

DaemonStatus Daemon::wait() {
    if (!started_ || finished_) return status_;

    if (contents_thread_.joinable()) {
        contents_thread_.join();
    }
    std::printf("  [DAEMON] Contents loop stopped (%s)\n", loop_exit_name(contents_exit_));

    if (points_thread_.joinable()) {
        points_thread_.join();
    }
    std::printf("  [DAEMON] Points loop stopped (%s)\n", loop_exit_name(points_exit_));

    std::printf("  [DAEMON] Writing out cache (%zu fingerprints) to %s\n",
                contents_loop_->cache().size(), config_.cache_file.c_str());
    bool saved = contents_loop_->cache().save_file(config_.cache_file.c_str());

    if (points_exit_ == LoopExit::REJECTED_ORIGIN ||
        contents_exit_ == LoopExit::REJECTED_ORIGIN) {
        status_ = DaemonStatus::REJECTED_ORIGIN;
    } else if (points_exit_ == LoopExit::FORMAT_ERROR ||
               contents_exit_ == LoopExit::FORMAT_ERROR) {
        status_ = DaemonStatus::LOOP_FAILED;
    } else if (!saved) {
        status_ = DaemonStatus::CACHE_NOT_SAVED;
    }

    finished_ = true;
    return status_;
}

void Daemon::print_stats() const {
    auto ps = points_loop_->get_stats();
    auto cs = contents_loop_->get_stats();

    std::printf("\n============================================================\n"
                "FINAL STATISTICS\n"
                "============================================================\n"
                "Points:     %lu batches sealed, %lu failed\n"
                "            %lu bursts, %lu points, %lu bytes\n"
                "Contents:   %lu batches sealed, %lu failed\n"
                "            %lu updates sent, %lu duplicates dropped\n"
                "Cache:      %zu fingerprints\n"
                "============================================================\n\n",
                static_cast<unsigned long>(ps.batches_sealed),
                static_cast<unsigned long>(ps.batches_failed),
                static_cast<unsigned long>(ps.bursts_sent),
                static_cast<unsigned long>(ps.points_sent),
                static_cast<unsigned long>(ps.bytes_sent),
                static_cast<unsigned long>(cs.batches_sealed),
                static_cast<unsigned long>(cs.batches_failed),
                static_cast<unsigned long>(cs.updates_sent),
                static_cast<unsigned long>(cs.duplicates_dropped),
                contents_loop_->cache().size());
}

} // namespace marquise
