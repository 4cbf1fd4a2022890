/**
 * @file retry_policy.cpp
 * @brief Implementation of RetryTracker and the backoff curve.
 */
#include "negsync/sync/retry_policy.hpp"

#include <algorithm>
#include <string>

#include "negsync/obs/log.hpp"
#include "negsync/obs/observability.hpp"

namespace negsync::sync {

std::chrono::milliseconds backoff_delay(const RetryConfig& cfg, uint32_t failures) noexcept {
    auto delay = cfg.min_delay;
    for (uint32_t i = 1; i < failures && delay < cfg.max_delay; ++i) {
        if (delay > cfg.max_delay / 2) {
            delay = cfg.max_delay;
            break;
        }
        delay *= 2;
    }
    return std::clamp(delay, cfg.min_delay, std::max(cfg.min_delay, cfg.max_delay));
}

RetryDecision RetryTracker::on_failure(const std::string& key, const Error& err) {
    uint32_t attempts = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        attempts = ++failures_[key];
        if (attempts >= cfg_.max_attempts) failures_.erase(key);
    }

    if (attempts < cfg_.max_attempts) {
        const auto delay = backoff_delay(cfg_, attempts);
        obs::logger()->warn("sync of {} failed (attempt {}/{}), retrying in {} ms: {}",
                            key, attempts, cfg_.max_attempts, delay.count(), err.message);
        return RetryDecision{true, delay, attempts};
    }

    const Error exhausted{ErrorCode::Exhausted, "retry budget of " + std::to_string(attempts) +
                                                " attempts used up, last error: " + err.message};
    if (observer_) {
        observer_->record_exhausted(key, exhausted.message);
    } else {
        obs::logger()->error("dropping {} out of the sync queue: {}", key, exhausted.message);
    }
    return RetryDecision{false, std::chrono::milliseconds{0}, attempts, negsync_detail::unexpected<Error>(exhausted)};
}

void RetryTracker::forget(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    failures_.erase(key);
}

uint32_t RetryTracker::failures(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = failures_.find(key);
    return it == failures_.end() ? 0 : it->second;
}

} // namespace negsync::sync
