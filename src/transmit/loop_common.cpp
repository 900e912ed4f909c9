#include "transmit/loop_common.hpp"

#include <time.h>

namespace marquise {

const char* batch_result_name(BatchResult r) {
    switch (r) {
        case BatchResult::IDLE:            return "idle";
        case BatchResult::SEALED:          return "sealed";
        case BatchResult::FORMAT_ERROR:    return "format error";
        case BatchResult::TRANSMIT_FAILED: return "transmit failed";
        case BatchResult::SEAL_FAILED:     return "seal failed";
        case BatchResult::REJECTED_ORIGIN: return "origin rejected";
    }
    return "unknown";
}

const char* loop_exit_name(LoopExit e) {
    switch (e) {
        case LoopExit::SHUTDOWN:        return "shutdown";
        case LoopExit::FORMAT_ERROR:    return "format error";
        case LoopExit::REJECTED_ORIGIN: return "origin rejected";
    }
    return "unknown";
}

void sleep_sec(double sec) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - ts.tv_sec) * 1e9);
    nanosleep(&ts, nullptr);
}

} // namespace marquise
