/**
 * @file test_endpoint.cpp
 * @brief Tests for endpoint key encoding and NetworkEndpointSet.
 *
 * Validates:
 *  - encode/decode round trip, including IPv6 literals and empty nodes
 *  - malformed keys are rejected instead of crashing
 *  - set insert/erase/pop semantics and order-independent equality
 */

#include <gtest/gtest.h>
#include <set>
#include <string>

#include "negsync/endpoint/endpoint_codec.hpp"
#include "negsync/endpoint/network_endpoint.hpp"

using negsync::EndpointParts;
using negsync::ErrorCode;
using negsync::NetworkEndpoint;
using negsync::NetworkEndpointSet;
using negsync::decode_endpoint;
using negsync::encode_endpoint;

// --------------------------- Codec -----------------------------------------

/**
 * @test Codec_RoundTrip
 * @brief decode(encode(a,b,c)) == (a,b,c) for separator-free fields.
 */
TEST(EndpointCodec, Codec_RoundTrip) {
  const EndpointParts cases[] = {
    {"10.0.0.1", "node-a", "8080"},
    {"2001:db8::1", "gke-pool-1-abcd", "443"},
    {"10.0.0.2", "", "80"},
    {"", "", ""},
  };
  for (const auto& c : cases) {
    const auto key = encode_endpoint(c.ip, c.node, c.port);
    auto back = decode_endpoint(key);
    ASSERT_TRUE(back.has_value()) << key;
    EXPECT_EQ(*back, c);
  }
}

/**
 * @test Codec_Format
 * @brief Fields are joined in ip, node, port order.
 */
TEST(EndpointCodec, Codec_Format) {
  EXPECT_EQ(encode_endpoint("10.0.0.1", "n1", "80"), "10.0.0.1||n1||80");
  EXPECT_EQ(encode_endpoint(NetworkEndpoint{.ip = "10.0.0.1", .port = "80", .node = "n1"}), "10.0.0.1||n1||80");
}

/**
 * @test Codec_Malformed_Rejected
 * @brief Keys without exactly three fields are an Encoding error.
 */
TEST(EndpointCodec, Codec_Malformed_Rejected) {
  for (const char* bad : {"10.0.0.1", "10.0.0.1||n1", "a||b||c||d"}) {
    auto r = decode_endpoint(bad);
    ASSERT_FALSE(r.has_value()) << bad;
    EXPECT_EQ(r.error().code, ErrorCode::Encoding);
  }
}

// --------------------------- Set -------------------------------------------

/**
 * @test Set_Insert_Dedup
 * @brief Structural identity: equal tuples collapse, any differing field does not.
 */
TEST(NetworkEndpointSet, Set_Insert_Dedup) {
  NetworkEndpointSet s;
  EXPECT_TRUE(s.insert({"10.0.0.1", "80", "n1"}));
  EXPECT_FALSE(s.insert({"10.0.0.1", "80", "n1"}));
  EXPECT_TRUE(s.insert({"10.0.0.1", "81", "n1"}));
  EXPECT_TRUE(s.insert({"10.0.0.1", "80", "n2"}));
  EXPECT_EQ(s.size(), 3u);
  EXPECT_TRUE(s.contains({"10.0.0.1", "80", "n2"}));
  EXPECT_FALSE(s.contains({"10.0.0.9", "80", "n2"}));
}

/**
 * @test Set_Erase_KeepsIndexConsistent
 * @brief Erasing from the middle leaves every other element reachable.
 */
TEST(NetworkEndpointSet, Set_Erase_KeepsIndexConsistent) {
  NetworkEndpointSet s{{"a", "1", "n"}, {"b", "1", "n"}, {"c", "1", "n"}, {"d", "1", "n"}};
  EXPECT_TRUE(s.erase({"b", "1", "n"}));
  EXPECT_FALSE(s.erase({"b", "1", "n"}));
  EXPECT_EQ(s.size(), 3u);
  for (const char* ip : {"a", "c", "d"}) EXPECT_TRUE(s.contains({ip, "1", "n"})) << ip;

  EXPECT_TRUE(s.erase({"d", "1", "n"}));
  EXPECT_TRUE(s.erase({"a", "1", "n"}));
  EXPECT_TRUE(s.contains({"c", "1", "n"}));
  EXPECT_EQ(s.size(), 1u);
}

/**
 * @test Set_PopAny_Drains
 * @brief pop_any yields every element exactly once, then nullopt.
 */
TEST(NetworkEndpointSet, Set_PopAny_Drains) {
  NetworkEndpointSet s{{"a", "1", "n"}, {"b", "1", "n"}, {"c", "1", "n"}};
  std::set<std::string> seen;
  while (auto e = s.pop_any()) {
    EXPECT_FALSE(s.contains(*e));
    seen.insert(e->ip);
  }
  EXPECT_TRUE(s.empty());
  EXPECT_EQ(seen, (std::set<std::string>{"a", "b", "c"}));
  EXPECT_FALSE(s.pop_any().has_value());
}

/**
 * @test Set_Difference_And_Equality
 * @brief difference() keeps only left-side elements; equality ignores order.
 */
TEST(NetworkEndpointSet, Set_Difference_And_Equality) {
  const NetworkEndpointSet lhs{{"a", "1", "n"}, {"b", "1", "n"}, {"c", "1", "n"}};
  const NetworkEndpointSet rhs{{"b", "1", "n"}, {"x", "1", "n"}};
  EXPECT_EQ(lhs.difference(rhs), (NetworkEndpointSet{{"c", "1", "n"}, {"a", "1", "n"}}));
  EXPECT_EQ(rhs.difference(lhs), (NetworkEndpointSet{{"x", "1", "n"}}));
  EXPECT_TRUE(lhs.difference(lhs).empty());
  EXPECT_NE(lhs, rhs);
}

/**
 * @test Encode_ZoneMap
 * @brief Typed zone maps project onto encoded keys zone by zone.
 */
TEST(EndpointCodec, Encode_ZoneMap) {
  negsync::ZoneEndpointMap zones;
  zones["us-central1-a"].insert({"10.0.0.1", "80", "n1"});
  zones["us-central1-b"];
  const auto encoded = negsync::encode_zone_map(zones);
  ASSERT_EQ(encoded.size(), 2u);
  EXPECT_EQ(encoded.at("us-central1-a"), (negsync::EncodedEndpointSet{"10.0.0.1||n1||80"}));
  EXPECT_TRUE(encoded.at("us-central1-b").empty());
}
