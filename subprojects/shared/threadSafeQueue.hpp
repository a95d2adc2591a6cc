#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>

/** \brief What a bounded queue does when a producer pushes into a full queue. */
enum class OverflowPolicy {
    Block,      ///< Wait for room (or for shutdown).
    DropOldest, ///< Evict the head to make room.
    Reject      ///< Discard the new element.
};

/**
 * @brief A thread-safe FIFO queue.
 *
 * A mutex guards the underlying std::queue and two condition variables signal
 * "not empty" and "not full". Consumers may block (pop), wait with a timeout
 * (pop_for) or poll (try_pop). A capacity of 0 means unbounded; otherwise the
 * OverflowPolicy decides what push does when the queue is full.
 *
 * After shutdown() every waiter wakes, push() refuses new elements and pops
 * keep draining whatever is left.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : capacity_(0), policy_(OverflowPolicy::Block), shutdown_(false) {}

    ThreadSafeQueue(std::size_t capacity, OverflowPolicy policy)
        : capacity_(capacity), policy_(policy), shutdown_(false) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Adds an element to the back of the queue.
     *
     * Notifies one waiting consumer. With a full bounded queue the configured
     * OverflowPolicy applies.
     *
     * @param value The element to add to the queue.
     * @return false if the element was not stored (queue shut down, or rejected
     *         by the Reject policy).
     */
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        if (capacity_ > 0 && queue_.size() >= capacity_) {
            switch (policy_) {
                case OverflowPolicy::Block:
                    not_full_.wait(lock, [this]() { return shutdown_ || queue_.size() < capacity_; });
                    if (shutdown_) {
                        return false;
                    }
                    break;
                case OverflowPolicy::DropOldest:
                    queue_.pop();
                    ++dropped_;
                    break;
                case OverflowPolicy::Reject:
                    ++dropped_;
                    return false;
            }
        }
        queue_.push(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Removes and returns the front element, waiting until one is available.
     *
     * @return The front element, or std::nullopt once the queue is shut down and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return shutdown_ || !queue_.empty(); });
        return take_front_locked();
    }

    /**
     * @brief Like pop(), but gives up after `timeout`.
     *
     * @return The front element, or std::nullopt on timeout or shutdown with an empty queue.
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return shutdown_ || !queue_.empty(); });
        return take_front_locked();
    }

    /**
     * @brief Removes and returns the front element without waiting.
     *
     * @return The front element, or std::nullopt if the queue is empty.
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front_locked();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /// Elements discarded by the DropOldest or Reject policies.
    std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    std::size_t capacity() const { return capacity_; }

    /**
     * @brief Shuts down the queue and wakes every waiting producer and consumer.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return value;
    }

    mutable std::mutex mutex_;
    std::queue<T> queue_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    const std::size_t capacity_;
    const OverflowPolicy policy_;
    std::size_t dropped_{0};
    bool shutdown_;
};

#endif // THREAD_SAFE_QUEUE_HPP
