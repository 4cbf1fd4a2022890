/**
 * @file test_pod_filter.cpp
 * @brief Tests for the fail-closed pod eligibility and subset checks.
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "negsync/sync/pod_filter.hpp"

using negsync::sync::should_pod_be_in_neg;
using negsync::sync::should_pod_be_in_subset;
using negsync::testing::FlakyPodStore;
using negsync::testing::make_pod;

/**
 * @test Eligible_RunningPod
 * @brief Present pod without deletion timestamp is eligible.
 */
TEST(PodFilter, Eligible_RunningPod) {
  FlakyPodStore pods;
  pods.inner.upsert(make_pod("default", "web-0"));
  EXPECT_TRUE(should_pod_be_in_neg(&pods, "default", "web-0"));
}

/**
 * @test Ineligible_FailClosed
 * @brief Terminating, missing, store error and no store are all "not eligible".
 */
TEST(PodFilter, Ineligible_FailClosed) {
  FlakyPodStore pods;
  pods.inner.upsert(make_pod("default", "web-1", {}, /*terminating=*/true));
  pods.inner.upsert(make_pod("default", "web-2"));
  pods.failing_keys.insert("default/web-2");

  EXPECT_FALSE(should_pod_be_in_neg(&pods, "default", "web-1"));
  EXPECT_FALSE(should_pod_be_in_neg(&pods, "default", "missing"));
  EXPECT_FALSE(should_pod_be_in_neg(&pods, "default", "web-2"));
  EXPECT_FALSE(should_pod_be_in_neg(nullptr, "default", "web-0"));
}

/**
 * @test Subset_Matching
 * @brief Label match decides; namespace is part of the key.
 */
TEST(PodFilter, Subset_Matching) {
  FlakyPodStore pods;
  pods.inner.upsert(make_pod("default", "canary-0", {{"track", "canary"}}));
  pods.inner.upsert(make_pod("default", "stable-0", {{"track", "stable"}}));

  EXPECT_TRUE(should_pod_be_in_subset(&pods, "default", "canary-0", "track=canary"));
  EXPECT_FALSE(should_pod_be_in_subset(&pods, "default", "stable-0", "track=canary"));
  EXPECT_FALSE(should_pod_be_in_subset(&pods, "other", "canary-0", "track=canary"));
}

/**
 * @test Subset_FailClosed
 * @brief Parse failure, missing pod, store error and no store are "no match".
 */
TEST(PodFilter, Subset_FailClosed) {
  FlakyPodStore pods;
  pods.inner.upsert(make_pod("default", "canary-0", {{"track", "canary"}}));
  pods.inner.upsert(make_pod("default", "canary-1", {{"track", "canary"}}));
  pods.failing_keys.insert("default/canary-1");

  EXPECT_FALSE(should_pod_be_in_subset(&pods, "default", "canary-0", "track in canary"));
  EXPECT_FALSE(should_pod_be_in_subset(&pods, "default", "nope", "track=canary"));
  EXPECT_FALSE(should_pod_be_in_subset(&pods, "default", "canary-1", "track=canary"));
  EXPECT_FALSE(should_pod_be_in_subset(nullptr, "default", "canary-0", "track=canary"));
}

/**
 * @test Subset_TerminatingPodStillMatches
 * @brief Subset matching looks at labels only; termination is the eligibility check's job.
 */
TEST(PodFilter, Subset_TerminatingPodStillMatches) {
  FlakyPodStore pods;
  pods.inner.upsert(make_pod("default", "canary-0", {{"track", "canary"}}, /*terminating=*/true));
  EXPECT_TRUE(should_pod_be_in_subset(&pods, "default", "canary-0", "track=canary"));
}
