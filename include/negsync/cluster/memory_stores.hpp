#pragma once
/**
 * @file memory_stores.hpp
 * @brief In-memory store and zone table backing tests and the demo app.
 */

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "negsync/cluster/stores.hpp"

namespace negsync::cluster {

    /// Thread-safe keyed store.
    template <class T>
    class MemoryObjectStore final : public ObjectStore<T> {
    public:
        void upsert(const T& obj) {
            std::lock_guard<std::mutex> lk(mu_);
            objects_.insert_or_assign(object_key(obj.namespace_, obj.name), obj);
        }

        bool remove(std::string_view key) {
            std::lock_guard<std::mutex> lk(mu_);
            return objects_.erase(std::string(key)) > 0;
        }

        Result<std::optional<T>> get_by_key(std::string_view key) const override {
            std::lock_guard<std::mutex> lk(mu_);
            const auto it = objects_.find(std::string(key));
            if (it == objects_.end()) return std::optional<T>{};
            return std::optional<T>{it->second};
        }

    private:
        mutable std::mutex mu_;
        std::unordered_map<std::string, T> objects_;
    };

    using MemoryPodStore     = MemoryObjectStore<Pod>;
    using MemoryServiceStore = MemoryObjectStore<Service>;

    /**
     * @class StaticZoneGetter
     * @brief Fixed node -> zone table.
     */
    class StaticZoneGetter final : public ZoneGetter {
    public:
        /// Add or move a node.
        void set_node_zone(const std::string& node, const std::string& zone);

        /// Forget a node (e.g. node deleted).
        void remove_node(const std::string& node);

        Result<std::string> zone_for_node(const std::string& node) const override;

        /// Sorted, de-duplicated.
        Result<std::vector<std::string>> list_zones() const override;

    private:
        mutable std::mutex mu_;
        std::map<std::string, std::string> node_zone_;
    };

} // namespace negsync::cluster
