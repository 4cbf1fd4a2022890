/**
 * @file test_batcher.cpp
 * @brief Tests for draining endpoint sets into API sized batches.
 */

#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <vector>

#include "negsync/sync/batcher.hpp"

using negsync::ErrorCode;
using negsync::NetworkEndpoint;
using negsync::NetworkEndpointHash;
using negsync::NetworkEndpointSet;
using negsync::sync::EndpointBatcher;

namespace {

NetworkEndpointSet many_endpoints(std::size_t n) {
  NetworkEndpointSet set;
  for (std::size_t i = 0; i < n; ++i) {
    set.insert(NetworkEndpoint{"10." + std::to_string(i / 256) + ".0." + std::to_string(i % 256), "8080", "n1"});
  }
  return set;
}

} // namespace

/**
 * @test Drain_1234_In_500s
 * @brief ceil(N/B) calls of sizes B, B, N mod B; every endpoint emitted exactly once.
 */
TEST(Batcher, Drain_1234_In_500s) {
  auto set = many_endpoints(1234);
  ASSERT_EQ(set.size(), 1234u);
  EndpointBatcher batcher(/*hybrid=*/false);
  EXPECT_EQ(batcher.max_batch(), 500u);

  std::vector<std::size_t> sizes;
  std::unordered_set<NetworkEndpoint, NetworkEndpointHash> seen;
  while (!set.empty()) {
    auto batch = batcher.make_batch(set);
    ASSERT_TRUE(batch);
    sizes.push_back(batch->size());
    for (const auto& [ep, cloud_ep] : *batch) {
      EXPECT_TRUE(seen.insert(ep).second);
      EXPECT_EQ(cloud_ep.ip_address, ep.ip);
      EXPECT_EQ(cloud_ep.instance, "n1");
      EXPECT_EQ(cloud_ep.port, 8080);
    }
  }
  EXPECT_EQ(sizes, (std::vector<std::size_t>{500, 500, 234}));
  EXPECT_EQ(seen.size(), 1234u);
  EXPECT_TRUE(set.empty());
}

/**
 * @test EmptySet_EmptyBatch
 * @brief Nothing to pop yields an empty batch, not an error.
 */
TEST(Batcher, EmptySet_EmptyBatch) {
  NetworkEndpointSet set;
  auto batch = EndpointBatcher(false).make_batch(set);
  ASSERT_TRUE(batch);
  EXPECT_TRUE(batch->empty());
}

/**
 * @test Hybrid_OmitsInstance
 * @brief Hybrid endpoints are sent without an instance.
 */
TEST(Batcher, Hybrid_OmitsInstance) {
  NetworkEndpointSet set{{"192.168.0.7", "443", "n9"}};
  auto batch = EndpointBatcher(/*hybrid=*/true).make_batch(set);
  ASSERT_TRUE(batch);
  ASSERT_EQ(batch->size(), 1u);
  const auto& cloud_ep = batch->begin()->second;
  EXPECT_EQ(cloud_ep.ip_address, "192.168.0.7");
  EXPECT_TRUE(cloud_ep.instance.empty());
  EXPECT_EQ(cloud_ep.port, 443);
}

/**
 * @test NonNumericPort_Encoding
 * @brief A port that does not parse is an encoding error.
 */
TEST(Batcher, NonNumericPort_Encoding) {
  NetworkEndpointSet set{{"10.0.0.1", "http", "n1"}};
  auto batch = EndpointBatcher(false).make_batch(set);
  ASSERT_FALSE(batch);
  EXPECT_EQ(batch.error().code, ErrorCode::Encoding);
}

/**
 * @test ZeroBatchSize_ClampedToOne
 * @brief A zero limit still makes progress.
 */
TEST(Batcher, ZeroBatchSize_ClampedToOne) {
  auto set = many_endpoints(3);
  EndpointBatcher batcher(false, 0);
  EXPECT_EQ(batcher.max_batch(), 1u);
  auto batch = batcher.make_batch(set);
  ASSERT_TRUE(batch);
  EXPECT_EQ(batch->size(), 1u);
  EXPECT_EQ(set.size(), 2u);
}
