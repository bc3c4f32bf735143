#include "pingwatch/limiter.hpp"

#include <algorithm>

namespace pingwatch {

ConcurrencyLimiter::ConcurrencyLimiter(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

bool ConcurrencyLimiter::acquire(const CancelToken& cancel) {
    // Wake the waiter below when the token fires.
    CancelRegistration reg = cancel.on_cancel([this] {
        std::lock_guard<std::mutex> lk(mtx_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&] { return in_use_ < capacity_ || cancel.cancelled(); });

    if (cancel.cancelled())
        return false;

    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return true;
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_all();
}

size_t ConcurrencyLimiter::in_use() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_use_;
}

size_t ConcurrencyLimiter::peak() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return peak_;
}

} // namespace pingwatch
