#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace marquise {

// One unit of spooled data handed to a transmit loop. The bytes stay valid
// for the lifetime of the batch. seal() commits removal from the spool and
// may succeed at most once; a batch destroyed unsealed stays in the spool.
class Batch {
public:
    virtual ~Batch() = default;

    virtual const uint8_t* data() const = 0;
    virtual size_t size() const = 0;

    virtual bool seal() = 0;
};

// Source of ready batches for one kind of data (points or contents)
class Spool {
public:
    virtual ~Spool() = default;

    // Non-blocking. nullptr means nothing is ready.
    virtual std::unique_ptr<Batch> next_batch() = 0;
};

} // namespace marquise
