#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overlaid with key/value overrides or NEGSYNC_* env vars.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <string>
#include <unordered_map>

#include "negsync/config/constants.hpp"
#include "negsync/core/error.hpp"
#include "negsync/sync/retry_policy.hpp"

namespace negsync::config {

    /** @struct SyncerConfig
     *  @brief Aggregate of settings the reconciliation core reads.
     */
    struct SyncerConfig {
        bool        create_hybrid_neg{false};                                            ///< Hybrid (non-cloud) endpoints
        std::size_t max_endpoints_per_batch{constants::MAX_NETWORK_ENDPOINTS_PER_BATCH}; ///< Per attach/detach call
        sync::RetryConfig retry;                                                          ///< Failed-pass backoff
        std::string log_level{constants::LOG_LEVEL_DEFAULT};                              ///< spdlog level name
    };

    /// Raw "key" -> "value" settings.
    using Overrides = std::unordered_map<std::string, std::string>;

    /** @class Loader
     *  @brief Source of syncer configuration.
     *
     * Recognized keys: create_hybrid_neg, max_endpoints_per_batch,
     * retry_max_attempts, retry_min_delay_ms, retry_max_delay_ms, log_level.
     */
    class Loader {
    public:
        /// Named defaults only.
        static SyncerConfig defaults();

        /**
         * @brief Apply overrides on top of the defaults.
         * @return ErrorCode::InvalidArgument for unknown keys or malformed/out of range values.
         */
        static Result<SyncerConfig> load(const Overrides& overrides);

        /// Same keys, read from NEGSYNC_<UPPERCASE_KEY> environment variables.
        static Result<SyncerConfig> from_environment();
    };

} // namespace negsync::config
