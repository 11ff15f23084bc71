#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>

namespace oculo::core {

// Multi-producer hand-off queue between worker threads. A non-zero
// `max_size` bounds memory: pushing into a full queue drops the oldest item.
template <typename T> class Queue {
  public:
    explicit Queue(size_t max_size = 0) : max_size_(max_size) {}

    // Returns true when an older item had to be dropped to make room
    bool push(T value) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (max_size_ != 0 && queue_.size() >= max_size_) {
                queue_.pop();
                dropped = true;
            }
            queue_.push(std::move(value));
        }
        cond_.notify_one();
        return dropped;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    bool wait_and_pop(T &value, std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_value =
            cond_.wait(lock, stoken, [this] { return !queue_.empty(); });

        if (!has_value) {
            return false; // Stopped without getting a value
        }

        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    template <typename Rep, typename Period>
    bool wait_for_and_pop(T &value, std::chrono::duration<Rep, Period> timeout,
                          std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_value = cond_.wait_for(lock, stoken, timeout,
                                        [this] { return !queue_.empty(); });
        if (!has_value) {
            return false; // Timed out or stopped
        }

        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<T>().swap(queue_);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

  private:
    mutable std::mutex mutex_;
    std::queue<T> queue_;
    std::condition_variable_any cond_;
    size_t max_size_;
};

} // namespace oculo::core
