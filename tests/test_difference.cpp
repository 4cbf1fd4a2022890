/**
 * @file test_difference.cpp
 * @brief Tests for the zone-partitioned set difference (both set flavors).
 *
 * Validates:
 *  - add/remove per zone, zones present on one side only
 *  - convergence: (current ∪ add) − remove == target, add ∩ remove == ∅
 *  - the encoded-key flavor agrees with the typed flavor
 */

#include <gtest/gtest.h>
#include <string>

#include "negsync/endpoint/endpoint_codec.hpp"
#include "negsync/sync/difference.hpp"

using negsync::EncodedEndpointSet;
using negsync::NetworkEndpoint;
using negsync::NetworkEndpointSet;
using negsync::ZoneEncodedEndpointMap;
using negsync::ZoneEndpointMap;
using negsync::sync::calculate_difference;

namespace {

const NetworkEndpoint e1{"10.0.0.1", "80", "n1"};
const NetworkEndpoint e2{"10.0.0.2", "80", "n2"};
const NetworkEndpoint e3{"10.0.0.3", "80", "n1"};
const NetworkEndpoint e4{"10.0.0.4", "80", "n3"};

// Apply add then remove to current, zone by zone.
template <class Set>
negsync::ZoneMap<Set> converge(negsync::ZoneMap<Set> current, const negsync::sync::ZoneDifference<Set>& d) {
  for (const auto& [zone, set] : d.add) {
    for (const auto& e : set) current[zone].insert(e);
  }
  for (const auto& [zone, set] : d.remove) {
    auto& cur = current[zone];
    for (const auto& e : set) cur.erase(e);
  }
  return current;
}

template <class Set>
void expect_converges(const negsync::ZoneMap<Set>& target, const negsync::ZoneMap<Set>& current) {
  const auto d = calculate_difference(target, current);
  const auto result = converge(current, d);

  for (const auto& [zone, set] : target) {
    const auto it = result.find(zone);
    ASSERT_NE(it, result.end()) << zone;
    EXPECT_TRUE(set == it->second) << zone;
  }
  for (const auto& [zone, set] : result) {
    if (target.count(zone) == 0) EXPECT_TRUE(set.empty()) << zone;
  }
  for (const auto& [zone, add] : d.add) {
    const auto it = d.remove.find(zone);
    if (it == d.remove.end()) continue;
    for (const auto& e : add) EXPECT_FALSE(it->second.contains(e)) << zone;
  }
}

} // namespace

/**
 * @test Difference_Scenario_ZoneOnlyInActual
 * @brief actual {a:{e1}, b:{e2}}, desired {a:{e1,e3}} → add {a:{e3}}, remove {b:{e2}}.
 */
TEST(Difference, Difference_Scenario_ZoneOnlyInActual) {
  ZoneEndpointMap desired{{"a", NetworkEndpointSet{e1, e3}}};
  ZoneEndpointMap actual{{"a", NetworkEndpointSet{e1}}, {"b", NetworkEndpointSet{e2}}};

  const auto d = calculate_difference(desired, actual);
  ASSERT_EQ(d.add.size(), 1u);
  EXPECT_EQ(d.add.at("a"), (NetworkEndpointSet{e3}));
  ASSERT_EQ(d.remove.size(), 1u);
  EXPECT_EQ(d.remove.at("b"), (NetworkEndpointSet{e2}));
}

/**
 * @test Difference_Identical_IsEmpty
 * @brief Equal maps need no changes; empty zones produce no entries.
 */
TEST(Difference, Difference_Identical_IsEmpty) {
  ZoneEndpointMap m{{"a", NetworkEndpointSet{e1, e2}}, {"b", NetworkEndpointSet{}}};
  const auto d = calculate_difference(m, m);
  EXPECT_TRUE(d.add.empty());
  EXPECT_TRUE(d.remove.empty());
}

/**
 * @test Difference_ZoneOnlyInDesired
 * @brief A zone missing from actual is added wholesale.
 */
TEST(Difference, Difference_ZoneOnlyInDesired) {
  ZoneEndpointMap desired{{"c", NetworkEndpointSet{e4}}};
  const auto d = calculate_difference(desired, ZoneEndpointMap{});
  EXPECT_EQ(d.add.at("c"), (NetworkEndpointSet{e4}));
  EXPECT_TRUE(d.remove.empty());
}

/**
 * @test Difference_Converges_Typed
 * @brief Applying add then remove to actual yields desired.
 */
TEST(Difference, Difference_Converges_Typed) {
  expect_converges<NetworkEndpointSet>(
      {{"a", NetworkEndpointSet{e1, e3}}, {"b", NetworkEndpointSet{}}, {"c", NetworkEndpointSet{e4}}},
      {{"a", NetworkEndpointSet{e1, e2}}, {"b", NetworkEndpointSet{e2}}});
  expect_converges<NetworkEndpointSet>({}, {{"a", NetworkEndpointSet{e1}}});
  expect_converges<NetworkEndpointSet>({{"a", NetworkEndpointSet{e1}}}, {});
}

/**
 * @test Difference_Converges_Encoded
 * @brief Same algorithm over raw string keys.
 */
TEST(Difference, Difference_Converges_Encoded) {
  ZoneEncodedEndpointMap desired{{"a", EncodedEndpointSet{"x||n1||80", "y||n1||80"}}};
  ZoneEncodedEndpointMap actual{{"a", EncodedEndpointSet{"y||n1||80", "z||n1||80"}},
                                {"b", EncodedEndpointSet{"w||n2||80"}}};
  const auto d = calculate_difference(desired, actual);
  EXPECT_EQ(d.add.at("a"), (EncodedEndpointSet{"x||n1||80"}));
  EXPECT_EQ(d.remove.at("a"), (EncodedEndpointSet{"z||n1||80"}));
  EXPECT_EQ(d.remove.at("b"), (EncodedEndpointSet{"w||n2||80"}));
  expect_converges(desired, actual);
}

/**
 * @test Difference_Flavors_Agree
 * @brief Encoding both inputs first gives the encoded form of the typed result.
 */
TEST(Difference, Difference_Flavors_Agree) {
  ZoneEndpointMap desired{{"a", NetworkEndpointSet{e1, e3}}, {"c", NetworkEndpointSet{e4}}};
  ZoneEndpointMap actual{{"a", NetworkEndpointSet{e1, e2}}, {"b", NetworkEndpointSet{e2}}};

  const auto typed = calculate_difference(desired, actual);
  const auto encoded = calculate_difference(negsync::encode_zone_map(desired), negsync::encode_zone_map(actual));

  EXPECT_EQ(negsync::encode_zone_map(typed.add), encoded.add);
  EXPECT_EQ(negsync::encode_zone_map(typed.remove), encoded.remove);
}
