#ifndef FRAGXFER_BUFFER_POOL_HPP
#define FRAGXFER_BUFFER_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

/**
 * @brief Reusable byte buffers keyed by slot.
 *
 * A fragment with index i uses slot i % slots(), so at most slots() buffers
 * are ever allocated no matter how large the source is. A buffer goes back to
 * its slot with release() once a stage is done with it.
 */
class BufferPool {
public:
    explicit BufferPool(size_t slots);

    // Returns a buffer resized to length; reuses the slot's capacity when present.
    std::vector<uint8_t> acquire(size_t slot, size_t length);

    void release(size_t slot, std::vector<uint8_t>&& buffer);

    size_t slots() const { return free_.size(); }

    // Number of acquire() calls that had to allocate fresh memory.
    size_t allocations() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<uint8_t>> free_;
    std::vector<bool> parked_;
    size_t allocations_ = 0;
};

#endif // FRAGXFER_BUFFER_POOL_HPP
