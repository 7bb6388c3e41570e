#ifndef FRAME_QUEUE_HPP
#define FRAME_QUEUE_HPP

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace vigil {

/**
 * @file frame_queue.hpp
 * @brief Bounded drop-oldest queue between acquisition and the pipeline consumer.
 *
 * The producer is a live camera and must never stall, so a full queue admits
 * the newest item by evicting the oldest one. Evictions are counted and
 * reported to an optional hook so metrics can expose them.
 */

/**
 * @brief Thread-safe bounded queue that evicts the oldest element on overflow.
 * @threading One producer and one consumer may call concurrently.
 * @ownership Queue owns its elements until popped or evicted.
 */
template<typename T>
class BoundedQueue {
public:
    using DropHook = std::function<void(size_t)>;

    /**
     * @brief Construct queue with bounded capacity.
     * @param capacity Maximum number of elements retained; values below 1 become 1.
     */
    explicit BoundedQueue(size_t capacity = 100);

    /**
     * @brief Install a callback invoked with the number of evicted elements.
     * @threading Call before the producer starts.
     */
    void setDropHook(DropHook hook) { drop_hook_ = std::move(hook); }

    /**
     * @brief Append an item, evicting the oldest element when full.
     * @return False only after stop(); the item is discarded in that case.
     */
    bool push(T item);

    /**
     * @brief Pop the oldest item, waiting up to @p timeout for one to arrive.
     * @return False on timeout or when stopped and drained.
     */
    bool pop(T& item, std::chrono::milliseconds timeout);

    /**
     * @brief Attempt non-blocking pop.
     */
    bool tryPop(T& item);

    /**
     * @brief Change capacity; shrinking evicts the oldest surplus elements.
     */
    void setCapacity(size_t capacity);

    size_t size() const;
    size_t capacity() const;
    bool empty() const;

    /**
     * @brief Total elements evicted since construction.
     */
    uint64_t droppedCount() const { return dropped_.load(); }

    /**
     * @brief Remove all elements without counting them as dropped.
     */
    void clear();

    /**
     * @brief Stop queue and wake all waiters so they can exit gracefully.
     */
    void stop();
    bool stopped() const { return stopped_.load(); }

private:
    size_t evictLocked();
    void reportDrops(size_t n);

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    size_t capacity_;
    std::atomic<bool> stopped_;
    std::atomic<uint64_t> dropped_;
    DropHook drop_hook_;
};

using BoundedFrameQueue = BoundedQueue<Frame>;

// Inline implementation for template methods
template<typename T>
BoundedQueue<T>::BoundedQueue(size_t capacity)
    : capacity_(capacity < 1 ? 1 : capacity), stopped_(false), dropped_(0) {}

template<typename T>
size_t BoundedQueue<T>::evictLocked() {
    size_t n = 0;
    while (queue_.size() >= capacity_ && !queue_.empty()) {
        queue_.pop_front();
        ++n;
    }
    return n;
}

template<typename T>
void BoundedQueue<T>::reportDrops(size_t n) {
    if (n == 0) return;
    dropped_.fetch_add(n);
    if (drop_hook_) drop_hook_(n);
}

template<typename T>
bool BoundedQueue<T>::push(T item) {
    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return false;
        evicted = evictLocked();
        queue_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    reportDrops(evicted);
    return true;
}

template<typename T>
bool BoundedQueue<T>::pop(T& item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [&]{ return stopped_.load() || !queue_.empty(); });
    if (queue_.empty()) return false;
    item = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

template<typename T>
bool BoundedQueue<T>::tryPop(T& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return false;
    item = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

template<typename T>
void BoundedQueue<T>::setCapacity(size_t capacity) {
    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity < 1 ? 1 : capacity;
        while (queue_.size() > capacity_) {
            queue_.pop_front();
            ++evicted;
        }
    }
    reportDrops(evicted);
}

template<typename T>
size_t BoundedQueue<T>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

template<typename T>
size_t BoundedQueue<T>::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

template<typename T>
bool BoundedQueue<T>::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

template<typename T>
void BoundedQueue<T>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

template<typename T>
void BoundedQueue<T>::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    not_empty_.notify_all();
}

} // namespace vigil

#endif // FRAME_QUEUE_HPP
