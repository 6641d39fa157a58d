#include "cancel.hpp"

namespace manax {

void CancelToken::cancel() {
    std::lock_guard<std::mutex> lock(mu_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    for (auto& [id, cb] : callbacks_) {
        (void)id;
        cb();
    }
    callbacks_.clear();
}

uint64_t CancelToken::add_callback(std::function<void()> cb) {
    std::lock_guard<std::mutex> lock(mu_);
    if (cancelled_.load(std::memory_order_acquire)) {
        cb();
        return 0;
    }
    uint64_t id = next_id_++;
    callbacks_.emplace(id, std::move(cb));
    return id;
}

void CancelToken::remove_callback(uint64_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    callbacks_.erase(id);
}

CancelRegistration::CancelRegistration(CancelToken* token, std::function<void()> cb)
    : token_(token) {
    if (token_) id_ = token_->add_callback(std::move(cb));
}

CancelRegistration::~CancelRegistration() {
    reset();
}

void CancelRegistration::reset() {
    if (token_ && id_ != 0) token_->remove_callback(id_);
    token_ = nullptr;
    id_ = 0;
}

} // namespace manax
