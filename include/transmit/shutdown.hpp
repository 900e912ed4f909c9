#pragma once

#include <atomic>

namespace marquise {

// One-shot broadcast stop request. Set once, never cleared, read by both
// transmit loops between batches. A signal may be chained to a parent so
// that it reads as requested when either one is.
class ShutdownSignal {
public:
    explicit ShutdownSignal(const ShutdownSignal* parent = nullptr)
        : parent_(parent)
        , requested_(false)
    {
    }

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    void request() { requested_.store(true, std::memory_order_release); }

    bool requested() const {
        if (requested_.load(std::memory_order_acquire)) return true;
        return parent_ && parent_->requested();
    }

private:
    const ShutdownSignal* parent_;
    std::atomic<bool> requested_;
};

} // namespace marquise
