#pragma once

#include "marquise/types.hpp"

#include <cstddef>

namespace marquise {

// Outcome of one Fetch -> Process -> Transmit -> Seal cycle
enum class BatchResult {
    IDLE,             // no batch ready
    SEALED,
    FORMAT_ERROR,     // batch left unsealed, loop must stop
    TRANSMIT_FAILED,  // batch left unsealed, retried on a later fetch
    SEAL_FAILED,      // fully transmitted but still in the spool
    REJECTED_ORIGIN,  // broker refused our origin, daemon must stop
};

// Why a transmit loop returned
enum class LoopExit {
    SHUTDOWN,
    FORMAT_ERROR,
    REJECTED_ORIGIN,
};

struct LoopConfig {
    double idle_interval_sec = IDLE_INTERVAL_SEC;
    size_t burst_size = IDEAL_BURST_SIZE;
    bool   verbose = false;
};

const char* batch_result_name(BatchResult r);
const char* loop_exit_name(LoopExit e);

void sleep_sec(double sec);

} // namespace marquise
