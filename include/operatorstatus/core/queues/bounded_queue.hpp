#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

/**
 * @class BoundedBlockingQueue
 * @brief Mutex-protected FIFO with a hard capacity
 *
 * Overflow policy is BLOCK_PRODUCER: push() waits until a slot drains.
 * tryPush() never waits.
 * close() wakes everyone; after it, pushes fail and pop() keeps
 * returning the remaining items until the queue is empty.
 */
template<typename T>
class BoundedBlockingQueue {
public:
    explicit BoundedBlockingQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedBlockingQueue capacity must be at least 1");
        }
    }

    BoundedBlockingQueue(const BoundedBlockingQueue&) = delete;
    BoundedBlockingQueue& operator=(const BoundedBlockingQueue&) = delete;

    /**
     * @brief Push item, blocking while the queue is full
     * @return false if the queue was closed before the item went in
     */
    bool push(T item) {
        {
            std::unique_lock<std::mutex> lock(m_);
            not_full_.wait(lock, [&]() { return closed_ || dq_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            dq_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push item only if a slot is free right now
     * @return false if the queue is full or closed; item is discarded
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (closed_ || dq_.size() >= capacity_) {
                return false;
            }
            dq_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop oldest item, blocking while the queue is empty
     * @return std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(m_);
            not_empty_.wait(lock, [&]() { return closed_ || !dq_.empty(); });
            if (dq_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(dq_.front()));
            dq_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return dq_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> dq_;
    const size_t capacity_;
    bool closed_ = false;
};
