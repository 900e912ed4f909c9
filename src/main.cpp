#include "broker/protocol.hpp"
#include "broker/tcp_transport.hpp"
#include "daemon/daemon.hpp"
#include "marquise/types.hpp"
#include "spool/directory_spool.hpp"
#include "transmit/loop_common.hpp"
#include "transmit/shutdown.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Async-signal-safe shutdown flag (not std::atomic<bool>, volatile sig_atomic_t is correct here)
static volatile sig_atomic_t g_running = 1;

static void signal_handler(int /*sig*/) {
    g_running = 0;
}

// --- Argument parsing ---

struct Args {
    char broker[256] = "localhost";
    int points_port = marquise::DEFAULT_POINTS_PORT;
    int contents_port = marquise::DEFAULT_CONTENTS_PORT;
    const char* origin = nullptr;
    const char* name = "default";
    const char* spool_dir = "/var/spool/marquise";
    const char* cache_file = nullptr;   // nullptr = <spool-dir>/<namespace>.cache
    size_t burst_size = marquise::IDEAL_BURST_SIZE;
    bool verbose = false;
};

static void print_usage(const char* prog) {
    std::printf("Usage: %s --origin ORIGIN [--namespace NAME] [--broker HOST]\n"
                "       [--points-port PORT] [--contents-port PORT]\n"
                "       [--spool-dir DIR] [--cache-file PATH]\n"
                "       [--burst-size BYTES] [--verbose]\n\n"
                "Forwards spooled points and source dict updates to the broker.\n\n"
                "  --origin ORIGIN     Origin identifying this source (required,\n"
                "                      1-%zu alphanumerics)\n"
                "  --namespace NAME    Spool name (default: default, 1-%zu alphanumerics)\n"
                "  --broker HOST       Broker host (default: localhost)\n"
                "  --points-port PORT  Points port (default: %d)\n"
                "  --contents-port PORT\n"
                "                      Contents port (default: %d)\n"
                "  --spool-dir DIR     Spool root (default: /var/spool/marquise)\n"
                "  --cache-file PATH   Source cache file (default: <spool-dir>/<namespace>.cache)\n"
                "  --burst-size BYTES  Target burst size (default: %zu)\n"
                "  --verbose           Log every batch, burst and update\n",
                prog, marquise::MAX_ORIGIN_LEN, marquise::MAX_NAMESPACE_LEN,
                marquise::DEFAULT_POINTS_PORT, marquise::DEFAULT_CONTENTS_PORT,
                marquise::IDEAL_BURST_SIZE);
}

static bool parse_port(const char* str, int& out) {
    char* end = nullptr;
    long v = std::strtol(str, &end, 10);
    if (end == str || *end != '\0' || v <= 0 || v > 65535) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--origin") == 0 && i + 1 < argc) {
            args.origin = argv[++i];
        } else if (std::strcmp(argv[i], "--namespace") == 0 && i + 1 < argc) {
            args.name = argv[++i];
        } else if (std::strcmp(argv[i], "--broker") == 0 && i + 1 < argc) {
            std::strncpy(args.broker, argv[++i], sizeof(args.broker) - 1);
        } else if (std::strcmp(argv[i], "--points-port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], args.points_port)) {
                std::fprintf(stderr, "Error: Invalid port '%s'\n", argv[i]);
                return false;
            }
        } else if (std::strcmp(argv[i], "--contents-port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], args.contents_port)) {
                std::fprintf(stderr, "Error: Invalid port '%s'\n", argv[i]);
                return false;
            }
        } else if (std::strcmp(argv[i], "--spool-dir") == 0 && i + 1 < argc) {
            args.spool_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--cache-file") == 0 && i + 1 < argc) {
            args.cache_file = argv[++i];
        } else if (std::strcmp(argv[i], "--burst-size") == 0 && i + 1 < argc) {
            char* end = nullptr;
            unsigned long long v = std::strtoull(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || v == 0) {
                std::fprintf(stderr, "Error: Invalid burst size '%s'\n", argv[i]);
                return false;
            }
            args.burst_size = static_cast<size_t>(v);
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            args.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::fprintf(stderr, "Error: Unknown or incomplete option '%s'\n", argv[i]);
            return false;
        }
    }

    if (!args.origin) {
        std::fprintf(stderr, "Error: --origin is required\n");
        return false;
    }
    if (!marquise::is_valid_name(args.origin, marquise::MAX_ORIGIN_LEN)) {
        std::fprintf(stderr, "Error: Invalid origin '%s' (1-%zu alphanumerics)\n",
                     args.origin, marquise::MAX_ORIGIN_LEN);
        return false;
    }
    if (!marquise::is_valid_name(args.name, marquise::MAX_NAMESPACE_LEN)) {
        std::fprintf(stderr, "Error: Invalid namespace '%s' (1-%zu alphanumerics)\n",
                     args.name, marquise::MAX_NAMESPACE_LEN);
        return false;
    }
    return true;
}

static int exit_code(marquise::DaemonStatus status) {
    switch (status) {
        case marquise::DaemonStatus::OK:              return 0;
        case marquise::DaemonStatus::REJECTED_ORIGIN: return 2;
        case marquise::DaemonStatus::LOOP_FAILED:
        case marquise::DaemonStatus::CACHE_NOT_SAVED:
        case marquise::DaemonStatus::INVALID_ORIGIN:  return 1;
    }
    return 1;
}

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return 1;
    }

    std::string cache_file = args.cache_file
        ? std::string(args.cache_file)
        : std::string(args.spool_dir) + "/" + args.name + ".cache";

    // Signal handling
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::printf("============================================================\n"
                "MARQUISE DAEMON\n"
                "============================================================\n"
                "  Origin:     %s\n"
                "  Namespace:  %s\n"
                "  Broker:     %s (points %d, contents %d)\n"
                "  Spool:      %s\n"
                "  Cache:      %s\n"
                "  Burst size: %zu bytes\n"
                "============================================================\n\n",
                args.origin, args.name, args.broker, args.points_port,
                args.contents_port, args.spool_dir, cache_file.c_str(),
                args.burst_size);

    marquise::DirectorySpool points_spool(args.spool_dir, args.name,
                                          marquise::SpoolKind::POINTS);
    marquise::DirectorySpool contents_spool(args.spool_dir, args.name,
                                            marquise::SpoolKind::CONTENTS);
    if (!points_spool.open() || !contents_spool.open()) {
        std::fprintf(stderr, "[FAIL] Could not open spool under %s\n", args.spool_dir);
        return 1;
    }

    marquise::TcpBrokerTransport points_broker(args.broker, args.points_port, args.origin);
    marquise::TcpBrokerTransport contents_broker(args.broker, args.contents_port, args.origin);

    marquise::DaemonConfig config;
    config.origin = args.origin;
    config.cache_file = cache_file;
    config.loop.burst_size = args.burst_size;
    config.loop.verbose = args.verbose;

    marquise::ShutdownSignal shutdown;
    marquise::Daemon daemon(config, shutdown, points_spool, contents_spool,
                            points_broker, contents_broker);
    daemon.start();

    std::printf("\n============================================================\n"
                "TRANSMITTING - Ctrl+C to stop\n"
                "============================================================\n\n");

    // Both loops may stop on their own (rejected origin, malformed batches)
    while (g_running && daemon.loops_running() > 0) {
        marquise::sleep_sec(0.1);
    }

    std::printf("\n\nShutdown...\n");
    shutdown.request();

    marquise::DaemonStatus status = daemon.wait();
    daemon.print_stats();

    auto pb = points_broker.get_stats();
    auto cb = contents_broker.get_stats();
    std::printf("Broker:     points %lu sent, %lu bytes, %lu failures\n"
                "            contents %lu sent, %lu bytes, %lu failures\n\n",
                static_cast<unsigned long>(pb.units_sent),
                static_cast<unsigned long>(pb.bytes_sent),
                static_cast<unsigned long>(pb.failures),
                static_cast<unsigned long>(cb.units_sent),
                static_cast<unsigned long>(cb.bytes_sent),
                static_cast<unsigned long>(cb.failures));

    if (status != marquise::DaemonStatus::OK) {
        std::fprintf(stderr, "[FAIL] %s\n", marquise::daemon_status_name(status));
    } else {
        std::printf("Daemon shutdown complete\n");
    }
    return exit_code(status);
}
