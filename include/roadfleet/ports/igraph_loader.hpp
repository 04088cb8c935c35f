#pragma once

#include "roadfleet/core/edge_catalog.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace roadfleet::ports {

class IGraphLoader {
public:
    virtual ~IGraphLoader() = default;

    virtual std::optional<roadfleet::core::EdgeCatalog> load(const std::filesystem::path& graph_dir) = 0;
};

using GraphLoaderPtr = std::unique_ptr<IGraphLoader>;

} // namespace roadfleet::ports
