#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace beatlight {

// Lock-free single-producer/single-consumer ring buffer. One slot stays
// empty to tell full from empty, so it holds size - 1 items.
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t size)
        : buffer(size < 2 ? 2 : size), write_index(0), read_index(0) {}

    bool push(const T& item) {
        size_t write_idx = write_index.load(std::memory_order_relaxed);
        size_t next_idx = (write_idx + 1) % buffer.size();

        if (next_idx == read_index.load(std::memory_order_acquire)) {
            return false;  // Buffer full
        }

        buffer[write_idx] = item;
        write_index.store(next_idx, std::memory_order_release);
        return true;
    }

    bool pop(T& item) {
        size_t read_idx = read_index.load(std::memory_order_relaxed);

        if (read_idx == write_index.load(std::memory_order_acquire)) {
            return false;  // Buffer empty
        }

        item = buffer[read_idx];
        read_index.store((read_idx + 1) % buffer.size(), std::memory_order_release);
        return true;
    }

    bool empty() const {
        return read_index.load(std::memory_order_acquire) == write_index.load(std::memory_order_acquire);
    }

    size_t capacity() const { return buffer.size() - 1; }

private:
    std::vector<T> buffer;
    std::atomic<size_t> write_index;
    std::atomic<size_t> read_index;
};

} // namespace beatlight
