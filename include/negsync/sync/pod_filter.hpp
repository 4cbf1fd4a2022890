#pragma once
/**
 * @file pod_filter.hpp
 * @brief Fail-closed pod checks used while mapping desired state.
 * @details Both checks return false on a missing store, a missing pod or a
 *          store error; a single bad pod never aborts a pass.
 */

#include <string_view>

#include "negsync/cluster/label_selector.hpp"
#include "negsync/cluster/stores.hpp"

namespace negsync::sync {

/**
 * @brief Whether a pod should currently back an endpoint.
 * @return true iff the pod exists in @p pods and is not in graceful termination.
 */
bool should_pod_be_in_neg(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name);

/**
 * @brief Whether a pod's labels satisfy a subset selector expression.
 * @param subset_labels Non-empty selector expression; callers skip the check entirely when it is empty.
 * @return false if the pod is missing, the store fails, or the expression does not parse.
 */
bool should_pod_be_in_subset(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name,
                             std::string_view subset_labels);

/// As above, with a selector parsed once by the caller.
bool should_pod_be_in_subset(const cluster::PodStore* pods, std::string_view namespace_, std::string_view name,
                             const cluster::LabelSelector& selector);

} // namespace negsync::sync
