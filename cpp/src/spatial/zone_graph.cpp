#include "lunar_habitat/spatial/zone_graph.hpp"
#include <algorithm>
#include <deque>

namespace lunar_habitat {

ZoneGraph ZoneGraph::from_layout(const Layout& layout) {
    ZoneGraph graph;
    for (const auto& zone : layout.zones) {
        graph.add_node(zone.name());
        for (const auto& neighbor : zone.connections) {
            if (neighbor == zone.name()) {
                continue;
            }
            graph.add_node(neighbor);
            graph.add_edge(zone.name(), neighbor);
        }
    }
    return graph;
}

int ZoneGraph::add_node(std::string_view name) {
    int existing = index_of(name);
    if (existing >= 0) {
        return existing;
    }
    int idx = static_cast<int>(names_.size());
    names_.emplace_back(name);
    adjacency_.emplace_back();
    index_.emplace(names_.back(), idx);
    return idx;
}

void ZoneGraph::add_edge(std::string_view a, std::string_view b) {
    int ia = add_node(a);
    int ib = add_node(b);
    if (ia == ib) {
        return;
    }
    auto& na = adjacency_[static_cast<size_t>(ia)];
    if (std::find(na.begin(), na.end(), ib) == na.end()) {
        na.push_back(ib);
    }
    auto& nb = adjacency_[static_cast<size_t>(ib)];
    if (std::find(nb.begin(), nb.end(), ia) == nb.end()) {
        nb.push_back(ia);
    }
}

int ZoneGraph::index_of(std::string_view name) const {
    auto it = index_.find(std::string(name));
    return it == index_.end() ? -1 : it->second;
}

bool ZoneGraph::has_edge(std::string_view a, std::string_view b) const {
    int ia = index_of(a);
    int ib = index_of(b);
    if (ia < 0 || ib < 0) {
        return false;
    }
    const auto& na = neighbors(ia);
    return std::find(na.begin(), na.end(), ib) != na.end();
}

std::vector<bool> ZoneGraph::reachable_from(int start) const {
    std::vector<bool> seen(names_.size(), false);
    if (start < 0 || static_cast<size_t>(start) >= names_.size()) {
        return seen;
    }
    std::deque<int> queue{start};
    seen[static_cast<size_t>(start)] = true;
    while (!queue.empty()) {
        int node = queue.front();
        queue.pop_front();
        for (int nbr : neighbors(node)) {
            if (!seen[static_cast<size_t>(nbr)]) {
                seen[static_cast<size_t>(nbr)] = true;
                queue.push_back(nbr);
            }
        }
    }
    return seen;
}

bool ZoneGraph::has_cycle() const {
    struct Frame {
        int node;
        int parent;
        size_t next;  // next neighbor slot to inspect
    };

    std::vector<bool> visited(names_.size(), false);
    std::vector<Frame> stack;

    for (size_t root = 0; root < names_.size(); ++root) {
        if (visited[root]) continue;
        visited[root] = true;
        stack.push_back({static_cast<int>(root), -1, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& nbrs = neighbors(top.node);
            if (top.next == nbrs.size()) {
                stack.pop_back();
                continue;
            }
            int nbr = nbrs[top.next++];
            if (nbr == top.parent) {
                continue;
            }
            if (visited[static_cast<size_t>(nbr)]) {
                return true;
            }
            visited[static_cast<size_t>(nbr)] = true;
            int parent = top.node;
            stack.push_back({nbr, parent, 0});
        }
    }
    return false;
}

int ZoneGraph::hop_distance(std::string_view from, std::string_view to) const {
    int start = index_of(from);
    int target = index_of(to);
    if (start < 0 || target < 0) {
        return -1;
    }
    std::vector<int> dist(names_.size(), -1);
    std::deque<int> queue{start};
    dist[static_cast<size_t>(start)] = 0;
    while (!queue.empty()) {
        int node = queue.front();
        queue.pop_front();
        if (node == target) {
            return dist[static_cast<size_t>(node)];
        }
        for (int nbr : neighbors(node)) {
            if (dist[static_cast<size_t>(nbr)] < 0) {
                dist[static_cast<size_t>(nbr)] = dist[static_cast<size_t>(node)] + 1;
                queue.push_back(nbr);
            }
        }
    }
    return -1;
}

}  // namespace lunar_habitat
