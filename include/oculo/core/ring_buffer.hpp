#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace oculo::core {

/**
 * Fixed-capacity circular buffer. Pushing into a full buffer overwrites the
 * oldest element and hands it back to the caller.
 *
 * Index 0 is the oldest element, size() - 1 the newest.
 */
template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(size_t capacity) : buffer_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be non-zero");
        }
    }

    std::optional<T> push(T value) {
        if (count_ < buffer_.size()) {
            buffer_[(start_ + count_) % buffer_.size()] = std::move(value);
            ++count_;
            return std::nullopt;
        }

        std::optional<T> evicted = std::move(buffer_[start_]);
        buffer_[start_] = std::move(value);
        start_ = (start_ + 1) % buffer_.size();
        return evicted;
    }

    const T &operator[](size_t index) const {
        return buffer_[(start_ + index) % buffer_.size()];
    }

    const T &front() const { return (*this)[0]; }
    const T &back() const { return (*this)[count_ - 1]; }

    size_t size() const { return count_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == buffer_.size(); }

    void clear() {
        start_ = 0;
        count_ = 0;
    }

    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i)
            out.push_back((*this)[i]);
        return out;
    }

  private:
    std::vector<T> buffer_;
    size_t start_ = 0;
    size_t count_ = 0;
};

} // namespace oculo::core
