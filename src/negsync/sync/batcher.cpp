/**
 * @file batcher.cpp
 * @brief Implementation of EndpointBatcher.
 */
#include "negsync/sync/batcher.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

namespace negsync::sync {

Result<EndpointBatch> EndpointBatcher::make_batch(NetworkEndpointSet& endpoints) const {
    EndpointBatch batch;
    batch.reserve(std::min(max_batch_, endpoints.size()));

    for (std::size_t i = 0; i < max_batch_; ++i) {
        auto ep = endpoints.pop_any();
        if (!ep) break;

        // Ports are canonical decimal here (resolve_target_port / cloud listings).
        std::int64_t port{};
        const auto& p = ep->port;
        const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), port);
        if (p.empty() || ec != std::errc{} || ptr != p.data() + p.size()) {
            return make_error(ErrorCode::Encoding, "failed to decode endpoint port of " + ep->ip + "/" +
                                                   ep->node + ": \"" + p + "\" is not numeric");
        }

        cloud::NetworkEndpoint out{.ip_address = ep->ip, .instance = {}, .port = port};
        if (!hybrid_) out.instance = ep->node;
        batch.insert_or_assign(std::move(*ep), std::move(out));
    }
    return batch;
}

} // namespace negsync::sync
