#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace manax {

// Cooperative cancellation signal shared between a caller and a blocking
// operation. Transports register callbacks that make the blocked call
// itself return (e.g. shutting down the socket).
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Idempotent. Runs registered callbacks once, on the cancelling thread.
    void cancel();

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Runs cb immediately if already cancelled. The returned id is passed to
    // remove(); remove() blocks while the callback is executing.
    uint64_t add_callback(std::function<void()> cb);
    void remove_callback(uint64_t id);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mu_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, std::function<void()>> callbacks_;
};

// RAII registration; the token may be null (operation not cancellable).
class CancelRegistration {
public:
    CancelRegistration() = default;
    CancelRegistration(CancelToken* token, std::function<void()> cb);
    ~CancelRegistration();
    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

    void reset();

private:
    CancelToken* token_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace manax
