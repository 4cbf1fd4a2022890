#pragma once
/**
 * @file endpoint_codec.hpp
 * @brief Flat string key for an endpoint identity: "ip||node||port".
 * @note No escaping is performed. IP, node and port values produced anywhere
 *       in the system must never contain the separator; decode() rejects keys
 *       that do not split into exactly three fields.
 */

#include <string>
#include <string_view>

#include "negsync/core/error.hpp"
#include "negsync/endpoint/network_endpoint.hpp"

namespace negsync {

/// Decoded key fields.
struct EndpointParts {
    std::string ip;
    std::string node;
    std::string port;

    bool operator==(const EndpointParts&) const = default;
};

/// Join ip, node and port with the reserved separator.
std::string encode_endpoint(std::string_view ip, std::string_view node, std::string_view port);

/// Inverse of encode_endpoint(). ErrorCode::Encoding on a malformed key.
Result<EndpointParts> decode_endpoint(std::string_view key);

/// Encode a typed endpoint.
std::string encode_endpoint(const NetworkEndpoint& e);

/// Project a typed zone map onto the raw-string flavor.
ZoneEncodedEndpointMap encode_zone_map(const ZoneEndpointMap& zones);

} // namespace negsync
