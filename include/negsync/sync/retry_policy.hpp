#pragma once
/**
 * @file retry_policy.hpp
 * @brief Per-key retry budget with exponential backoff for failed sync passes.
 * @details Defaults are named in constants.hpp. The scheduler owns timing; this
 *          only answers "retry after how long, or give up".
 */

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "negsync/config/constants.hpp"
#include "negsync/core/error.hpp"

namespace negsync::obs { class Observer; }

namespace negsync::sync {

/** @struct RetryConfig
 *  @brief Attempt budget and delay bounds.
 */
struct RetryConfig {
    uint32_t                  max_attempts{config::constants::RETRY_MAX_ATTEMPTS};                ///< Total attempts per key
    std::chrono::milliseconds min_delay{config::constants::RETRY_MIN_DELAY_MS};                   ///< First retry delay
    std::chrono::milliseconds max_delay{config::constants::RETRY_MAX_DELAY_MS};                   ///< Delay ceiling
};

/** @struct RetryDecision
 *  @brief Answer for one failed attempt.
 */
struct RetryDecision {
    bool                      retry{false};   ///< false: budget exhausted, key forgotten
    std::chrono::milliseconds delay{0};       ///< Wait before the next attempt (retry only)
    uint32_t                  attempts{0};    ///< Failed attempts so far, including this one
    Status                    status{};       ///< ErrorCode::Exhausted once retry is false
};

/**
 * @brief Backoff for the n-th consecutive failure: min_delay * 2^(n-1), clamped to [min_delay, max_delay].
 * @param failures Consecutive failures, >= 1 (0 is treated as 1).
 */
std::chrono::milliseconds backoff_delay(const RetryConfig& cfg, uint32_t failures) noexcept;

/** @class RetryTracker
 *  @brief Counts consecutive failures per key. Thread-safe.
 */
class RetryTracker {
public:
    /// Construct with configuration; @p observer (optional) is told about exhausted keys.
    explicit RetryTracker(RetryConfig cfg, obs::Observer* observer = nullptr) noexcept
        : cfg_(cfg), observer_(observer) {}

    /**
     * @brief Register a failed attempt for @p key.
     * @return retry=true with the delay to wait, or retry=false once the key has
     *         used max_attempts attempts (the key is then forgotten and the
     *         failure reported to the observer and log).
     */
    RetryDecision on_failure(const std::string& key, const Error& err);

    /// Reset the key after a successful pass.
    void forget(const std::string& key);

    /// Consecutive failures recorded for @p key.
    [[nodiscard]] uint32_t failures(const std::string& key) const;

    /// @return Current configuration (by const reference).
    const RetryConfig& config() const noexcept { return cfg_; }

private:
    RetryConfig cfg_{};
    obs::Observer* observer_{nullptr};
    mutable std::mutex mu_;
    std::unordered_map<std::string, uint32_t> failures_;
};

} // namespace negsync::sync
