#pragma once

#include "../core/layout.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lunar_habitat {

// Undirected zone adjacency graph.
// Built by symmetrizing every zone's declared connections; self-loops are
// dropped and connection names without a zone become stub nodes.
// Node indices follow first-appearance order in the layout.
class ZoneGraph {
public:
    ZoneGraph() = default;

    static ZoneGraph from_layout(const Layout& layout);

    // Add node if missing, return its index
    int add_node(std::string_view name);
    // Add undirected edge (ignored for self-loops and duplicates)
    void add_edge(std::string_view a, std::string_view b);

    [[nodiscard]] size_t size() const { return names_.size(); }
    [[nodiscard]] bool empty() const { return names_.empty(); }
    [[nodiscard]] bool contains(std::string_view name) const { return index_of(name) >= 0; }
    [[nodiscard]] int index_of(std::string_view name) const;
    [[nodiscard]] const std::string& name(int node) const { return names_[static_cast<size_t>(node)]; }
    [[nodiscard]] const std::vector<int>& neighbors(int node) const { return adjacency_[static_cast<size_t>(node)]; }

    // Direct edge between two named nodes
    [[nodiscard]] bool has_edge(std::string_view a, std::string_view b) const;

    // Nodes reachable from start by breadth-first search (start included)
    [[nodiscard]] std::vector<bool> reachable_from(int start) const;

    // True if any component holds a cycle.
    // Iterative depth-first search: a visited neighbor that is not the
    // parent of the current node is a back-edge.
    [[nodiscard]] bool has_cycle() const;

    // Breadth-first hop count from a to b; -1 if either is missing or unreachable
    [[nodiscard]] int hop_distance(std::string_view from, std::string_view to) const;

private:
    std::vector<std::string> names_;
    std::vector<std::vector<int>> adjacency_;
    std::unordered_map<std::string, int> index_;
};

}  // namespace lunar_habitat
