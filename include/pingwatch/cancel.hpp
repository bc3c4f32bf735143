#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace pingwatch {

namespace detail {
struct CancelState;
}

/**
 * RAII handle for a callback registered on a CancelToken.
 * Destroying (or reset()ing) the handle unregisters the callback.
 *
 * A callback that is already running when the handle goes away is
 * not waited for; callbacks must only capture state they co-own.
 */
class CancelRegistration {
public:
    CancelRegistration() = default;
    CancelRegistration(std::weak_ptr<detail::CancelState> state, uint64_t id);
    ~CancelRegistration();

    CancelRegistration(CancelRegistration&& other) noexcept;
    CancelRegistration& operator=(CancelRegistration&& other) noexcept;
    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

    void reset();

private:
    std::weak_ptr<detail::CancelState> state_;
    uint64_t id_{0};
};

/**
 * Observer side of a cancellation signal.
 *
 * A default-constructed token is never cancelled; wait_for() on it is
 * a plain sleep.
 */
class CancelToken {
public:
    CancelToken() = default;

    bool cancelled() const;

    /**
     * Sleep for up to `d`.
     * @return true if the token was (or became) cancelled, false on timeout.
     */
    bool wait_for(std::chrono::milliseconds d) const;

    /**
     * Register `fn` to run once on cancellation. If the token is already
     * cancelled, `fn` runs immediately on the calling thread.
     */
    CancelRegistration on_cancel(std::function<void()> fn) const;

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<detail::CancelState> state);

    std::shared_ptr<detail::CancelState> state_;
};

/**
 * Owner side of a cancellation signal. cancel() is one-way and idempotent.
 */
class CancelSource {
public:
    CancelSource();

    /**
     * Create a source that is also cancelled when `parent` fires.
     */
    explicit CancelSource(const CancelToken& parent);

    CancelToken token() const;
    void cancel();
    bool cancelled() const;

private:
    std::shared_ptr<detail::CancelState> state_;
    CancelRegistration parent_link_;
};

} // namespace pingwatch
