#pragma once
/**
 * @file error.hpp
 * @brief Error model shared by every reconciliation component.
 * @details Fallible operations return Result<T>; nothing throws across the
 *          public API. The code tells callers which failure class they hit.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "negsync/compat/expected.hpp"

namespace negsync {

/// Failure classes surfaced by the core.
enum class ErrorCode : std::uint8_t {
    NotFound,        ///< Keyed object or cloud resource does not exist.
    ZoneLookup,      ///< Node could not be resolved to a zone (fatal to a pass).
    Cloud,           ///< Cloud collaborator call failed (fatal to a pass).
    Encoding,        ///< Endpoint key or port could not be decoded.
    InvalidArgument, ///< Caller or configuration supplied a malformed value.
    Exhausted        ///< Retry budget for a key is used up.
};

/// Error value: class + human readable context.
struct Error {
    ErrorCode   code{ErrorCode::InvalidArgument};
    std::string message;

    bool operator==(const Error&) const = default;
};

template <class T>
using Result = negsync_detail::expected<T, Error>;

/// Result of an operation with no value.
using Status = Result<void>;

/// Build the error side of a Result.
inline negsync_detail::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return negsync_detail::unexpected<Error>(Error{code, std::move(message)});
}

/// Stable lowercase name, used in log lines.
constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:        return "not_found";
        case ErrorCode::ZoneLookup:      return "zone_lookup";
        case ErrorCode::Cloud:           return "cloud";
        case ErrorCode::Encoding:        return "encoding";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Exhausted:       return "exhausted";
    }
    return "unknown";
}

} // namespace negsync
