#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <type_traits>

namespace sqlpool {

/**
 * @brief Bounded multi-producer multi-consumer FIFO queue
 *
 * Design:
 * - Fixed capacity set at construction
 * - Producers never block: try_push fails when the queue is full
 * - Consumers can poll (try_pop) or wait with a deadline (pop_for)
 * - No ordering among waiting consumers; whichever wakes first wins
 *
 * @tparam T Element type (must be move-constructible)
 */
template <typename T>
class BoundedQueue {
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move-constructible");

public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Enqueue without blocking
     * @return false if the queue is full (item is left untouched)
     */
    [[nodiscard]] bool try_push(T& item) {
        {
            std::lock_guard lock(mutex_);
            if (items_.size() >= capacity_) {
                return false;
            }
            items_.emplace_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue if an item is immediately available
     */
    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return pop_front_locked();
    }

    /**
     * @brief Dequeue, waiting up to `timeout` for an item
     * @return std::nullopt if the timeout elapsed first
     */
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty(); });
        return pop_front_locked();
    }

    /**
     * @brief Remove and return every queued item
     */
    [[nodiscard]] std::deque<T> drain() {
        std::lock_guard lock(mutex_);
        std::deque<T> out;
        out.swap(items_);
        return out;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    std::optional<T> pop_front_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace sqlpool
