#pragma once
/**
 * @file resource_id.hpp
 * @brief Cloud resource URL parsing and URL-form tolerant equality.
 */

#include <string>
#include <string_view>

#include "negsync/core/error.hpp"

namespace negsync::cloud {

/** @struct ResourceId
 *  @brief Parsed resource path.
 *  @details scope is "global", "regions/<r>" or "zones/<z>". project is empty
 *           for project-relative forms such as "global/networks/default".
 */
struct ResourceId {
    std::string project;
    std::string scope;
    std::string resource; ///< Collection, e.g. "networks", "subnetworks"
    std::string name;

    bool operator==(const ResourceId&) const = default;
};

/**
 * @brief Parse a resource URL.
 *
 * Accepted forms:
 *   https://<host>/compute/<version>/projects/<p>/<scope>/<resource>/<name>
 *   projects/<p>/<scope>/<resource>/<name>
 *   <scope>/<resource>/<name>
 *   projects/<p>
 * @return ErrorCode::InvalidArgument for anything else.
 */
Result<ResourceId> parse_resource_url(std::string_view url);

/**
 * @brief Compare two resource URLs by identity rather than spelling.
 * @return true when resource, name and scope match, and the projects match
 *         whenever both URLs name one. Two empty strings are equal; an empty
 *         and a non-empty string, or any unparsable URL, are not.
 */
bool equal_resource_ids(std::string_view a, std::string_view b);

} // namespace negsync::cloud
