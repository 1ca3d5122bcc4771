/**
 * @file DropOldestQueue.hpp
 * @brief Bounded channel that never blocks the producer.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace bidlens::application {

/**
 * @class DropOldestQueue
 * @brief When full, push() evicts the oldest pending item instead of waiting.
 */
template <typename T>
class DropOldestQueue {
public:
    explicit DropOldestQueue(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief Enqueues an item.
     * @return True when an older item had to be dropped to make room.
     */
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) return false;
            if (m_items.size() >= m_capacity) {
                m_items.pop_front();
                ++m_dropped;
                dropped = true;
            }
            m_items.push_back(std::move(item));
        }
        m_cv.notify_one();
        return dropped;
    }

    /** @brief Waits up to timeout for an item. Returns nullopt on timeout or when closed and drained. */
    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_items.empty() || m_closed; });
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    /** @brief Wakes all waiters; later pushes are ignored. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    /** @brief Reopens a closed queue and discards leftovers. */
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.clear();
        m_closed = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    std::size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;
    std::deque<T> m_items;
    std::size_t m_dropped = 0;
    bool m_closed = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace bidlens::application
