#pragma once
/**
 * @file stores.hpp
 * @brief Collaborator contracts for cluster state: keyed object stores and zone lookup.
 * @details Implementations are injected at construction; the core never owns them.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "negsync/cluster/objects.hpp"
#include "negsync/core/error.hpp"

namespace negsync::cluster {

    /**
     * @class ObjectStore
     * @brief Keyed lookup by "namespace/name".
     * @details Absence is an empty optional, not an error. Errors mean the
     *          lookup itself failed.
     */
    template <class T>
    class ObjectStore {
    public:
        virtual ~ObjectStore() = default;

        virtual Result<std::optional<T>> get_by_key(std::string_view key) const = 0;
    };

    using PodStore     = ObjectStore<Pod>;
    using ServiceStore = ObjectStore<Service>;

    /// Store key for a namespaced object.
    inline std::string object_key(std::string_view namespace_, std::string_view name) {
        std::string key;
        key.reserve(namespace_.size() + name.size() + 1);
        key.append(namespace_).append("/").append(name);
        return key;
    }

    /**
     * @class ZoneGetter
     * @brief Node -> zone resolution and zone enumeration.
     */
    class ZoneGetter {
    public:
        virtual ~ZoneGetter() = default;

        /// Zone of @p node; an error when the node is unknown.
        virtual Result<std::string> zone_for_node(const std::string& node) const = 0;

        /// Every zone the cluster has nodes in.
        virtual Result<std::vector<std::string>> list_zones() const = 0;
    };

} // namespace negsync::cluster
