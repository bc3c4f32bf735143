#include "pingwatch/cancel.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace pingwatch {

namespace detail {

struct CancelState {
    std::mutex mtx;
    std::condition_variable cv;
    bool cancelled{false};
    uint64_t next_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;

    void cancel() {
        std::map<uint64_t, std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (cancelled) return;
            cancelled = true;
            pending.swap(callbacks);
        }
        cv.notify_all();

        // Callbacks run outside the lock so they may touch other tokens.
        for (auto& kv : pending)
            kv.second();
    }
};

} // namespace detail


// ============================================================================
// CancelRegistration
// ============================================================================
CancelRegistration::CancelRegistration(std::weak_ptr<detail::CancelState> state,
                                       uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancelRegistration::~CancelRegistration() {
    reset();
}

CancelRegistration::CancelRegistration(CancelRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancelRegistration& CancelRegistration::operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelRegistration::reset() {
    if (id_ == 0) return;
    if (auto s = state_.lock()) {
        std::lock_guard<std::mutex> lk(s->mtx);
        s->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}


// ============================================================================
// CancelToken
// ============================================================================
CancelToken::CancelToken(std::shared_ptr<detail::CancelState> state)
    : state_(std::move(state)) {}

bool CancelToken::cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->cancelled;
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return false;
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, d, [this] { return state_->cancelled; });
}

CancelRegistration CancelToken::on_cancel(std::function<void()> fn) const {
    if (!state_) return {};

    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(fn));
            return CancelRegistration(state_, id);
        }
    }

    fn();
    return {};
}


// ============================================================================
// CancelSource
// ============================================================================
CancelSource::CancelSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancelSource::CancelSource(const CancelToken& parent)
    : state_(std::make_shared<detail::CancelState>()) {
    std::weak_ptr<detail::CancelState> weak = state_;
    parent_link_ = parent.on_cancel([weak] {
        if (auto s = weak.lock()) s->cancel();
    });
}

CancelToken CancelSource::token() const {
    return CancelToken(state_);
}

void CancelSource::cancel() {
    state_->cancel();
}

bool CancelSource::cancelled() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->cancelled;
}

} // namespace pingwatch
