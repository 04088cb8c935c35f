#pragma once

#include "roadfleet/ports/igraph_loader.hpp"
#include <string>
#include <vector>

namespace roadfleet::adapters {

// Reads <dir>/graph.meta ("num_nodes N" / "num_edges M") and <dir>/edges.csv
// (edge_id,from_node,to_node,base_length,base_speed_limit).
class GraphLoaderFile : public roadfleet::ports::IGraphLoader {
public:
    GraphLoaderFile() = default;
    ~GraphLoaderFile() override = default;

    std::optional<core::EdgeCatalog> load(const std::filesystem::path& graph_dir) override;

private:
    struct MetaCounts {
        int num_nodes = -1;
        int num_edges = -1;
    };

    std::optional<MetaCounts> read_meta(const std::filesystem::path& path) const;
    std::optional<std::vector<core::Edge>> read_edges(const std::filesystem::path& path,
                                                      const MetaCounts& counts) const;
};

} // namespace roadfleet::adapters
