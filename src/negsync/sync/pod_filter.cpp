/**
 * @file pod_filter.cpp
 * @brief Pod store lookups behind the eligibility and subset checks.
 */
#include "negsync/sync/pod_filter.hpp"

#include <optional>
#include <string>
#include <utility>

#include "negsync/obs/log.hpp"

namespace negsync::sync {

namespace {

// Pod if present; logs and returns nullopt on store errors.
std::optional<cluster::Pod> lookup_pod(const cluster::PodStore* pods, std::string_view namespace_,
                                       std::string_view name) {
    if (pods == nullptr) return std::nullopt;
    const std::string key = cluster::object_key(namespace_, name);
    auto pod = pods->get_by_key(key);
    if (!pod) {
        obs::logger()->error("Failed to retrieve pod {} from pod store: {}", key, pod.error().message);
        return std::nullopt;
    }
    return std::move(*pod);
}

} // namespace

bool should_pod_be_in_neg(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name) {
    const auto pod = lookup_pod(pods, namespace_, name);
    if (!pod) return false;
    // A deletion timestamp means the pod is in graceful termination.
    return !pod->deletion_timestamp.has_value();
}

bool should_pod_be_in_subset(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name,
                             std::string_view subset_labels) {
    const auto selector = cluster::LabelSelector::parse(subset_labels);
    if (!selector) {
        obs::logger()->error("Failed to parse the subset selectors: {}", selector.error().message);
        return false;
    }
    return should_pod_be_in_subset(pods, namespace_, name, *selector);
}

bool should_pod_be_in_subset(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name,
                             const cluster::LabelSelector& selector) {
    const auto pod = lookup_pod(pods, namespace_, name);
    if (!pod) return false;
    return selector.matches(pod->labels);
}

} // namespace negsync::sync
