#include "roadfleet/adapters/graph_loader_file.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace roadfleet::adapters {

namespace {

constexpr std::array<std::string_view, 5> kEdgeColumns = {
    "edge_id", "from_node", "to_node", "base_length", "base_speed_limit"
};

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
    return s;
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

std::optional<int> to_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> to_double(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<core::EdgeCatalog> GraphLoaderFile::load(const std::filesystem::path& graph_dir) {
    namespace fs = std::filesystem;

    if (!fs::is_directory(graph_dir)) {
        spdlog::error("Graph directory does not exist: {}", graph_dir.string());
        return std::nullopt;
    }

    auto counts = read_meta(graph_dir / "graph.meta");
    if (!counts) {
        return std::nullopt;
    }

    auto edges = read_edges(graph_dir / "edges.csv", *counts);
    if (!edges) {
        return std::nullopt;
    }

    spdlog::info("Loaded graph with {} nodes and {} edges from {}",
                 counts->num_nodes, edges->size(), graph_dir.string());
    return core::EdgeCatalog(counts->num_nodes, *edges);
}

std::optional<GraphLoaderFile::MetaCounts> GraphLoaderFile::read_meta(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Failed to open meta file: {}", path.string());
        return std::nullopt;
    }

    MetaCounts counts;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string key;
        int value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }
        if (key == "num_nodes") {
            counts.num_nodes = value;
        } else if (key == "num_edges") {
            counts.num_edges = value;
        }
    }

    if (counts.num_nodes <= 0 || counts.num_edges < 0) {
        spdlog::error("Meta file missing or invalid counts (num_nodes={}, num_edges={}): {}",
                      counts.num_nodes, counts.num_edges, path.string());
        return std::nullopt;
    }
    return counts;
}

std::optional<std::vector<core::Edge>> GraphLoaderFile::read_edges(const std::filesystem::path& path,
                                                                   const MetaCounts& counts) const {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Failed to open edges file: {}", path.string());
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line)) {
        spdlog::error("Edges file is empty: {}", path.string());
        return std::nullopt;
    }

    auto header = split_csv(line);
    std::array<std::size_t, kEdgeColumns.size()> column_index{};
    for (std::size_t i = 0; i < kEdgeColumns.size(); ++i) {
        auto it = std::find(header.begin(), header.end(), kEdgeColumns[i]);
        if (it == header.end()) {
            spdlog::error("Edges file lacks column '{}': {}", kEdgeColumns[i], path.string());
            return std::nullopt;
        }
        column_index[i] = static_cast<std::size_t>(it - header.begin());
    }

    std::vector<core::Edge> edges;
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }

        auto fields = split_csv(line);
        if (fields.size() < header.size()) {
            spdlog::error("Bad edges.csv line: '{}'", line);
            return std::nullopt;
        }

        auto id = to_int(fields[column_index[0]]);
        auto from = to_int(fields[column_index[1]]);
        auto to = to_int(fields[column_index[2]]);
        auto length = to_double(fields[column_index[3]]);
        auto speed = to_double(fields[column_index[4]]);
        if (!id || !from || !to || !length || !speed) {
            spdlog::error("Bad edges.csv line: '{}'", line);
            return std::nullopt;
        }

        if (*id < 0 || *id >= counts.num_edges) {
            spdlog::error("Edge id out of range: {}", *id);
            return std::nullopt;
        }
        if (*from < 0 || *from >= counts.num_nodes || *to < 0 || *to >= counts.num_nodes) {
            spdlog::error("Edge {} references a node outside 0..{}", *id, counts.num_nodes - 1);
            return std::nullopt;
        }
        if (*length < 0.0 || *speed <= 0.0) {
            spdlog::error("Edge {} has invalid length {} or speed limit {}", *id, *length, *speed);
            return std::nullopt;
        }

        edges.push_back({*id, *from, *to, *length, *speed});
    }

    if (static_cast<int>(edges.size()) != counts.num_edges) {
        spdlog::error("Edges count mismatch (expected {}, got {})", counts.num_edges, edges.size());
        return std::nullopt;
    }
    return edges;
}

} // namespace roadfleet::adapters
