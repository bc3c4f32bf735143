#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "pingwatch/cancel.hpp"

namespace pingwatch {

/**
 * Counting semaphore with a fixed capacity and a cancellable acquire.
 * Also records the highest number of slots ever held at once.
 */
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t capacity);

    /**
     * Block until a slot is free or `cancel` fires.
     * @return true if a slot was taken, false if cancelled while waiting.
     */
    bool acquire(const CancelToken& cancel);
    void release();

    size_t capacity() const { return capacity_; }
    size_t in_use() const;
    size_t peak() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    const size_t capacity_;
    size_t in_use_{0};
    size_t peak_{0};
};

/**
 * Releases a limiter slot on scope exit.
 */
class LimiterSlot {
public:
    explicit LimiterSlot(ConcurrencyLimiter& limiter) : limiter_(limiter) {}
    ~LimiterSlot() { limiter_.release(); }

    LimiterSlot(const LimiterSlot&) = delete;
    LimiterSlot& operator=(const LimiterSlot&) = delete;

private:
    ConcurrencyLimiter& limiter_;
};

} // namespace pingwatch
