#pragma once

#include "roadfleet/core/types.hpp"
#include <unordered_map>
#include <vector>

namespace roadfleet::core {

class EdgeCatalog {
public:
    EdgeCatalog() = default;
    EdgeCatalog(int num_nodes, const std::vector<Edge>& edges);

    int num_nodes() const noexcept { return num_nodes_; }
    std::size_t num_edges() const noexcept { return edges_.size(); }

    const std::unordered_map<EdgeId, Edge>& edges() const noexcept { return edges_; }

    const Edge* find(EdgeId id) const;
    bool contains(EdgeId id) const { return find(id) != nullptr; }

private:
    int num_nodes_ = 0;
    std::unordered_map<EdgeId, Edge> edges_;
};

} // namespace roadfleet::core
