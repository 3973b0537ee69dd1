#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace crossover::utils {

// Fixed-capacity FIFO. push() on a full buffer overwrites the oldest element.
// Not thread-safe; owned by a single loop.
template<typename T>
class RingBuffer {
private:
    std::vector<T> buffer;
    size_t head = 0;   // index of the oldest element
    size_t count = 0;

public:
    explicit RingBuffer(size_t capacity) : buffer(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(const T& item) {
        size_t tail = (head + count) % buffer.size();
        buffer[tail] = item;

        if (count == buffer.size()) {
            head = (head + 1) % buffer.size();
        } else {
            ++count;
        }
    }

    // 0 is the oldest element, size() - 1 the newest.
    const T& operator[](size_t index) const {
        return buffer[(head + index) % buffer.size()];
    }

    void clear() {
        head = 0;
        count = 0;
    }

    bool empty() const {
        return count == 0;
    }

    bool full() const {
        return count == buffer.size();
    }

    size_t size() const {
        return count;
    }

    size_t capacity() const {
        return buffer.size();
    }
};

} // namespace crossover::utils
