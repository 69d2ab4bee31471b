#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace affectrt {
namespace session {

/**
 * Fixed-capacity ring buffer that evicts the oldest entry on overflow.
 * Not synchronized; the owning session serializes access.
 */
template <typename T> class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : buffer_(capacity), capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(const T& item) {
        buffer_[(head_ + size_) % capacity_] = item;
        if (size_ < capacity_) {
            size_++;
        } else {
            head_ = (head_ + 1) % capacity_;
        }
    }

    size_t size() const { return size_; }
    size_t capacity() const { return capacity_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == capacity_; }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    /**
     * Index 0 is the oldest retained entry
     */
    const T& operator[](size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return buffer_[(head_ + index) % capacity_];
    }

    const T& back() const { return (*this)[size_ - 1]; }

    /**
     * Up to count newest entries, oldest first
     */
    std::vector<T> getLatest(size_t count) const {
        count = std::min(count, size_);
        std::vector<T> result;
        result.reserve(count);
        for (size_t i = size_ - count; i < size_; ++i) {
            result.push_back((*this)[i]);
        }
        return result;
    }

    std::vector<T> getAll() const { return getLatest(size_); }

private:
    std::vector<T> buffer_;
    size_t capacity_;
    size_t head_ = 0;
    size_t size_ = 0;
};

} // namespace session
} // namespace affectrt
