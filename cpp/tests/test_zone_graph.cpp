#include <catch2/catch.hpp>
#include <string>
#include <utility>
#include <vector>
#include "lunar_habitat/spatial/zone_graph.hpp"

using namespace lunar_habitat;

namespace {

Zone connected_zone(ZoneKind kind, std::vector<std::string> connections) {
    Zone zone;
    zone.kind = kind;
    zone.volume_m3 = 10.0;
    zone.connections = std::move(connections);
    return zone;
}

ZoneGraph make_graph(const std::vector<std::pair<std::string, std::string>>& edges) {
    ZoneGraph graph;
    for (const auto& [a, b] : edges) {
        graph.add_edge(a, b);
    }
    return graph;
}

}  // namespace

TEST_CASE("ZoneGraph construction", "[zone_graph]") {
    SECTION("One-directional connections are symmetrized") {
        Layout layout;
        layout.zones.push_back(connected_zone(ZoneKind::Airlock, {"Work"}));
        layout.zones.push_back(connected_zone(ZoneKind::Work, {}));

        ZoneGraph graph = ZoneGraph::from_layout(layout);
        REQUIRE(graph.size() == 2);
        REQUIRE(graph.has_edge("Airlock", "Work"));
        REQUIRE(graph.has_edge("Work", "Airlock"));
    }

    SECTION("Unknown connection names become stub nodes") {
        Layout layout;
        layout.zones.push_back(connected_zone(ZoneKind::Work, {"Agriculture"}));

        ZoneGraph graph = ZoneGraph::from_layout(layout);
        REQUIRE(graph.size() == 2);
        REQUIRE(graph.contains("Agriculture"));
        REQUIRE(graph.has_edge("Work", "Agriculture"));
    }

    SECTION("Self-loops dropped") {
        Layout layout;
        layout.zones.push_back(connected_zone(ZoneKind::Work, {"Work"}));

        ZoneGraph graph = ZoneGraph::from_layout(layout);
        REQUIRE(graph.size() == 1);
        REQUIRE(graph.neighbors(0).empty());
        REQUIRE_FALSE(graph.has_cycle());
    }

    SECTION("Duplicate edges collapse") {
        Layout layout;
        layout.zones.push_back(connected_zone(ZoneKind::Airlock, {"Work", "Work"}));
        layout.zones.push_back(connected_zone(ZoneKind::Work, {"Airlock"}));

        ZoneGraph graph = ZoneGraph::from_layout(layout);
        REQUIRE(graph.neighbors(graph.index_of("Airlock")).size() == 1);
        REQUIRE_FALSE(graph.has_cycle());
    }

    SECTION("Missing names") {
        ZoneGraph graph = make_graph({{"A", "B"}});
        REQUIRE(graph.index_of("C") == -1);
        REQUIRE_FALSE(graph.has_edge("A", "C"));
    }
}

TEST_CASE("ZoneGraph traversal", "[zone_graph]") {
    SECTION("Reachability") {
        ZoneGraph graph = make_graph({{"A", "B"}, {"B", "C"}, {"D", "E"}});
        auto seen = graph.reachable_from(graph.index_of("A"));
        REQUIRE(seen[static_cast<size_t>(graph.index_of("C"))]);
        REQUIRE_FALSE(seen[static_cast<size_t>(graph.index_of("D"))]);
    }

    SECTION("Path has no cycle") {
        ZoneGraph graph = make_graph({{"A", "B"}, {"B", "C"}, {"C", "D"}});
        REQUIRE_FALSE(graph.has_cycle());
    }

    SECTION("Triangle has a cycle") {
        ZoneGraph graph = make_graph({{"A", "B"}, {"B", "C"}, {"C", "A"}});
        REQUIRE(graph.has_cycle());
    }

    SECTION("Cycle in a second component is found") {
        ZoneGraph graph = make_graph({{"A", "B"}, {"C", "D"}, {"D", "E"}, {"E", "C"}});
        REQUIRE(graph.has_cycle());
    }

    SECTION("Star tree has no cycle") {
        ZoneGraph graph = make_graph({{"H", "A"}, {"H", "B"}, {"H", "C"}, {"C", "D"}});
        REQUIRE_FALSE(graph.has_cycle());
    }

    SECTION("Hop distance") {
        ZoneGraph graph = make_graph({{"A", "B"}, {"B", "C"}, {"C", "D"}, {"A", "D"}, {"X", "Y"}});
        REQUIRE(graph.hop_distance("A", "A") == 0);
        REQUIRE(graph.hop_distance("A", "C") == 2);
        REQUIRE(graph.hop_distance("B", "D") == 2);
        REQUIRE(graph.hop_distance("A", "X") == -1);
        REQUIRE(graph.hop_distance("A", "Missing") == -1);
    }

    SECTION("Empty graph") {
        ZoneGraph graph;
        REQUIRE(graph.empty());
        REQUIRE_FALSE(graph.has_cycle());
    }
}
