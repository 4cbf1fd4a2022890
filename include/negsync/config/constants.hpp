#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the reconciliation core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (key/value overrides or NEGSYNC_* environment) in deployments.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace negsync::config::constants {

// =====================
// Cloud API batching
// =====================
/// Upper bound on endpoints carried by one attach/detach call.
inline constexpr std::size_t MAX_NETWORK_ENDPOINTS_PER_BATCH = 500;

// =====================
// Retry / backoff for a failed reconciliation pass
// Convention shared with the cluster controller manager: 15 attempts per key.
// =====================
inline constexpr std::uint32_t RETRY_MAX_ATTEMPTS  = 15;      ///< Attempts before surfacing failure
inline constexpr std::uint32_t RETRY_MIN_DELAY_MS  = 5000;    ///< 5 s floor
inline constexpr std::uint32_t RETRY_MAX_DELAY_MS  = 600000;  ///< 600 s ceiling
/// Largest delay a configuration may set for either bound (24 h).
inline constexpr std::uint32_t RETRY_DELAY_LIMIT_MS = 86400000;

// =====================
// Endpoint key encoding
// Field values (IP, node, port) must never contain the separator.
// =====================
inline constexpr std::string_view ENDPOINT_SEPARATOR = "||";

// =====================
// Backend group (NEG) endpoint types
// =====================
/// Zonal VM IP:port endpoints; carries an instance reference.
inline constexpr std::string_view NEG_TYPE_GCE_VM_IP_PORT = "GCE_VM_IP_PORT";
/// Hybrid IP:port endpoints outside the cloud; no instance, no subnetwork.
inline constexpr std::string_view NEG_TYPE_NON_GCP_PRIVATE_IP_PORT = "NON_GCP_PRIVATE_IP_PORT";

// =====================
// Cluster object kinds / event reasons
// =====================
inline constexpr std::string_view KIND_POD            = "Pod";
inline constexpr std::string_view EVENT_REASON_CREATE = "Create";
inline constexpr std::string_view EVENT_REASON_DELETE = "Delete";

// =====================
// Logging
// =====================
inline constexpr std::string_view LOGGER_NAME       = "negsync";
inline constexpr std::string_view LOG_LEVEL_DEFAULT = "info";

} // namespace negsync::config::constants
