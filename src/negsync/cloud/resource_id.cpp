/**
 * @file resource_id.cpp
 * @brief Segment-based resource URL parser.
 */
#include "negsync/cloud/resource_id.hpp"

#include <vector>

namespace negsync::cloud {

namespace {

std::vector<std::string_view> split_path(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        const auto pos = s.find('/', start);
        const auto end = pos == std::string_view::npos ? s.size() : pos;
        if (end > start) out.push_back(s.substr(start, end - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

negsync_detail::unexpected<Error> bad_url(std::string_view url) {
    return make_error(ErrorCode::InvalidArgument, "unrecognized resource URL \"" + std::string(url) + "\"");
}

} // namespace

Result<ResourceId> parse_resource_url(std::string_view url) {
    std::string_view path = url;
    if (const auto scheme = path.find("://"); scheme != std::string_view::npos) {
        // Drop scheme, host and API prefix; identity starts at "projects/".
        const auto proj = path.find("/projects/", scheme + 3);
        if (proj == std::string_view::npos) return bad_url(url);
        path = path.substr(proj + 1);
    }

    const auto seg = split_path(path);
    ResourceId id;
    std::size_t i = 0;

    if (!seg.empty() && seg[0] == "projects") {
        if (seg.size() < 2) return bad_url(url);
        id.project = std::string(seg[1]);
        i = 2;
        if (seg.size() == 2) {
            id.resource = "projects";
            id.name = id.project;
            return id;
        }
    }

    if (i >= seg.size()) return bad_url(url);
    if (seg[i] == "global") {
        id.scope = "global";
        i += 1;
    } else if (seg[i] == "regions" || seg[i] == "zones") {
        if (i + 1 >= seg.size()) return bad_url(url);
        id.scope = std::string(seg[i]) + "/" + std::string(seg[i + 1]);
        i += 2;
    } else {
        return bad_url(url);
    }

    if (seg.size() - i != 2) return bad_url(url);
    id.resource = std::string(seg[i]);
    id.name = std::string(seg[i + 1]);
    return id;
}

bool equal_resource_ids(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return a.empty() && b.empty();

    const auto ida = parse_resource_url(a);
    const auto idb = parse_resource_url(b);
    if (!ida || !idb) return false;

    if (!ida->project.empty() && !idb->project.empty() && ida->project != idb->project) return false;
    return ida->scope == idb->scope && ida->resource == idb->resource && ida->name == idb->name;
}

} // namespace negsync::cloud
