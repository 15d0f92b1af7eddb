#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace core {

// Thread-safe mailbox between producer threads (audio callback, UI) and a single consumer.
// Design: push() never blocks on the consumer. With a non-zero max_size the consumer drops
//         the oldest messages when it has fallen behind; max_size == 0 keeps everything.
template <typename T>
class MessageQueue {
public:
    explicit MessageQueue(size_t max_size = 0) : max_size_(max_size), stopped_(false) {}

    // Returns false once the queue has been stopped.
    bool push(T&& msg) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        queue_.push(std::move(msg));
        cv_pop_.notify_one();
        return true;
    }

    // Blocks until a message is available. Returns false when stopped and drained.
    bool pop(T& msg) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        return take_locked(msg);
    }

    // Like pop() but gives up after timeout. Returns false on timeout or when stopped and drained.
    template <typename Rep, typename Period>
    bool pop_for(T& msg, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait_for(lock, timeout, [this] { return !queue_.empty() || stopped_; });
        return take_locked(msg);
    }

    // Signal stop (no more messages will be accepted; pending ones can still be drained)
    void stop() {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_pop_.notify_all();
    }

    bool stopped() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return stopped_;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t dropped_count() const {
        return dropped_count_.load();
    }

private:
    bool take_locked(T& msg) {
        if (queue_.empty()) {
            return false;
        }
        // Consumer fell behind: drop oldest, keep newest
        while (max_size_ > 0 && queue_.size() > max_size_) {
            queue_.pop();
            dropped_count_++;
        }
        msg = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::queue<T> queue_;
    size_t max_size_;
    bool stopped_;
    std::atomic<size_t> dropped_count_{0};
};

} // namespace core
