/**
 * @file endpoint_codec.cpp
 * @brief Separator-joined endpoint keys.
 */
#include "negsync/endpoint/endpoint_codec.hpp"

#include <vector>

#include "negsync/config/constants.hpp"

namespace negsync {

using config::constants::ENDPOINT_SEPARATOR;

std::string encode_endpoint(std::string_view ip, std::string_view node, std::string_view port) {
    std::string out;
    out.reserve(ip.size() + node.size() + port.size() + 2 * ENDPOINT_SEPARATOR.size());
    out.append(ip).append(ENDPOINT_SEPARATOR);
    out.append(node).append(ENDPOINT_SEPARATOR);
    out.append(port);
    return out;
}

std::string encode_endpoint(const NetworkEndpoint& e) {
    return encode_endpoint(e.ip, e.node, e.port);
}

Result<EndpointParts> decode_endpoint(std::string_view key) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    for (;;) {
        const auto pos = key.find(ENDPOINT_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            fields.push_back(key.substr(start));
            break;
        }
        fields.push_back(key.substr(start, pos - start));
        start = pos + ENDPOINT_SEPARATOR.size();
    }
    if (fields.size() != 3) {
        return make_error(ErrorCode::Encoding,
                          "malformed endpoint key \"" + std::string(key) + "\": expected 3 fields, got " +
                          std::to_string(fields.size()));
    }
    return EndpointParts{std::string(fields[0]), std::string(fields[1]), std::string(fields[2])};
}

ZoneEncodedEndpointMap encode_zone_map(const ZoneEndpointMap& zones) {
    ZoneEncodedEndpointMap out;
    out.reserve(zones.size());
    for (const auto& [zone, set] : zones) {
        auto& encoded = out[zone];
        encoded.reserve(set.size());
        for (const auto& e : set) encoded.insert(encode_endpoint(e));
    }
    return out;
}

} // namespace negsync
