#pragma once

#include "dedup/source_cache.hpp"
#include "transmit/contents_loop.hpp"
#include "transmit/loop_common.hpp"
#include "transmit/points_loop.hpp"
#include "transmit/shutdown.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace marquise {

class BrokerTransport;
class Spool;

struct DaemonConfig {
    std::string origin;
    std::string cache_file;
    LoopConfig  loop;
};

enum class DaemonStatus {
    OK,
    LOOP_FAILED,       // a loop stopped on a malformed batch
    REJECTED_ORIGIN,
    CACHE_NOT_SAVED,
    INVALID_ORIGIN,    // empty, too long or not alphanumeric; nothing ran
};

const char* daemon_status_name(DaemonStatus s);

// Supervisor: loads the source cache, runs the points and contents loops on
// their own threads, and once both have stopped persists the final cache.
class Daemon {
public:
    // Collaborators are owned by the caller and must outlive the daemon.
    // Each loop gets its own broker transport.
    Daemon(const DaemonConfig& config, const ShutdownSignal& shutdown,
           Spool& points_spool, Spool& contents_spool,
           BrokerTransport& points_broker, BrokerTransport& contents_broker);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    void start();

    // Block until both loops have stopped and the cache has been written
    DaemonStatus wait();

    // Number of loops still running (a loop may stop on its own after a
    // fatal error)
    int loops_running() const { return loops_running_.load(std::memory_order_acquire); }

    void print_stats() const;

private:
    void run_points();
    void run_contents();

    DaemonConfig config_;
    ShutdownSignal stop_;   // chained to the external signal

    std::unique_ptr<PointsLoop> points_loop_;
    std::unique_ptr<ContentsLoop> contents_loop_;

    std::thread points_thread_;
    std::thread contents_thread_;

    // Written by each loop thread once, read after join
    LoopExit points_exit_;
    LoopExit contents_exit_;

    std::atomic<int> loops_running_;
    bool started_;
    bool finished_;
    DaemonStatus status_;
};

} // namespace marquise
