#include "roadfleet/core/edge_catalog.hpp"

namespace roadfleet::core {

EdgeCatalog::EdgeCatalog(int num_nodes, const std::vector<Edge>& edges)
    : num_nodes_(num_nodes) {
    edges_.reserve(edges.size());
    for (const auto& edge : edges) {
        edges_.insert_or_assign(edge.id, edge);
    }
}

const Edge* EdgeCatalog::find(EdgeId id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

} // namespace roadfleet::core
