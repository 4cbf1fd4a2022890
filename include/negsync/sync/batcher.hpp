#pragma once
/**
 * @file batcher.hpp
 * @brief Drain an endpoint set into cloud API sized batches.
 */

#include <cstddef>
#include <unordered_map>

#include "negsync/cloud/neg_cloud.hpp"
#include "negsync/config/constants.hpp"
#include "negsync/core/error.hpp"
#include "negsync/endpoint/network_endpoint.hpp"

namespace negsync::sync {

/// Internal identity -> cloud representation for one API call.
using EndpointBatch = std::unordered_map<NetworkEndpoint, cloud::NetworkEndpoint, NetworkEndpointHash>;

/**
 * @class EndpointBatcher
 * @brief Pops up to max_batch endpoints per call.
 *
 * The input set is consumed: after a call it holds only the endpoints not yet
 * batched, so repeated calls drain it. Do not share one set between
 * concurrent callers.
 */
class EndpointBatcher {
public:
    /**
     * @param hybrid Omit the instance field (hybrid endpoints have none).
     * @param max_batch Endpoints per batch, at least 1.
     */
    explicit EndpointBatcher(bool hybrid,
                             std::size_t max_batch = config::constants::MAX_NETWORK_ENDPOINTS_PER_BATCH) noexcept
        : hybrid_(hybrid), max_batch_(max_batch == 0 ? 1 : max_batch) {}

    /**
     * @brief Pop the next batch out of @p endpoints.
     * @return ErrorCode::Encoding if a popped endpoint's port is not numeric.
     *         That endpoint is already removed from the set.
     */
    Result<EndpointBatch> make_batch(NetworkEndpointSet& endpoints) const;

    [[nodiscard]] std::size_t max_batch() const noexcept { return max_batch_; }

private:
    bool hybrid_;
    std::size_t max_batch_;
};

} // namespace negsync::sync
