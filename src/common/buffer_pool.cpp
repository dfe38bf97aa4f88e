#include "common/buffer_pool.hpp"

#include <stdexcept>

BufferPool::BufferPool(size_t slots) : free_(slots), parked_(slots, false) {
    if (slots == 0) {
        throw std::invalid_argument("BufferPool needs at least one slot");
    }
}

std::vector<uint8_t> BufferPool::acquire(size_t slot, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t s = slot % free_.size();
    std::vector<uint8_t> buffer;
    if (parked_[s]) {
        buffer.swap(free_[s]);
        parked_[s] = false;
    }
    if (buffer.capacity() < length) {
        ++allocations_;
    }
    buffer.resize(length);
    return buffer;
}

void BufferPool::release(size_t slot, std::vector<uint8_t>&& buffer) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t s = slot % free_.size();
    // Keep whichever buffer is larger; the other one is freed.
    if (!parked_[s] || buffer.capacity() > free_[s].capacity()) {
        free_[s] = std::move(buffer);
        parked_[s] = true;
    }
}

size_t BufferPool::allocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}
