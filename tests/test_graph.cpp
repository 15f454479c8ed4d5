#include <catch2/catch.hpp>
#include <pmat/graph.hpp>
#include <numeric>
#include <string>

using namespace pmat;

TEST_CASE("add nodes and edges", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("a");
    auto b = g.add_node("b");
    g.add_edge(a, b);
    g.add_edge(a, b);
    REQUIRE(g.node_count() == 2);
    REQUIRE(g.edge_count() == 1);
    REQUIRE(g.has_edge(a, b));
    REQUIRE_FALSE(g.has_edge(b, a));
    REQUIRE(g.out_degree(a) == 1);
    REQUIRE(g.in_degree(b) == 1);
    REQUIRE(g.predecessors(b) == std::vector<size_t>{a});
}

TEST_CASE("topological sort orders dependencies first", "[graph]") {
    GraphMap<> g;
    g.add_edge("main", "parser");
    g.add_edge("parser", "lexer");
    g.add_edge("main", "lexer");
    auto order = g.topological_sort();
    REQUIRE(order.is_ok());
    REQUIRE(order.value() == std::vector<std::string>{"main", "parser", "lexer"});
}

TEST_CASE("cycles are reported", "[graph]") {
    GraphMap<> g;
    g.add_edge("a", "b");
    g.add_edge("b", "c");
    g.add_edge("c", "a");
    g.add_edge("c", "d");
    auto order = g.topological_sort();
    REQUIRE(order.is_err());
    REQUIRE(order.error().code == PmatError::Conflict);
    REQUIRE(g.inner().has_cycle());

    auto cycles = g.inner().cycles();
    REQUIRE(cycles.size() == 1);
    REQUIRE(cycles[0].size() == 3);
}

TEST_CASE("self loop counts as a cycle", "[graph]") {
    Graph<int> g;
    auto n = g.add_node(1);
    g.add_node(2);
    g.add_edge(n, n);
    auto cycles = g.cycles();
    REQUIRE(cycles.size() == 1);
    REQUIRE(cycles[0] == std::vector<size_t>{n});
}

TEST_CASE("strongly connected components cover every node", "[graph]") {
    Graph<int> g;
    for (int i = 0; i < 5; ++i) g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(1, 0);
    g.add_edge(2, 3);
    auto sccs = g.strongly_connected();
    size_t covered = 0;
    for (const auto& c : sccs) covered += c.size();
    REQUIRE(covered == 5);
    REQUIRE(sccs.size() == 4);
}

TEST_CASE("pagerank sums to one and favours sinks of many edges", "[graph]") {
    GraphMap<> g;
    g.add_edge("a", "hub");
    g.add_edge("b", "hub");
    g.add_edge("c", "hub");
    g.add_edge("hub", "a");
    auto rank = g.inner().pagerank();
    double total = std::accumulate(rank.begin(), rank.end(), 0.0);
    REQUIRE(total == Approx(1.0).epsilon(1e-6));
    auto hub = *g.find("hub");
    for (size_t i = 0; i < rank.size(); ++i) {
        if (i != hub) REQUIRE(rank[hub] > rank[i]);
    }
    REQUIRE(Graph<int>().pagerank().empty());
}

TEST_CASE("dfs visits reachable nodes once in order", "[graph]") {
    GraphMap<> g;
    g.add_edge("root", "x");
    g.add_edge("root", "y");
    g.add_edge("x", "y");
    g.add_node("island");
    std::vector<std::string> seen;
    g.inner().dfs(*g.find("root"), [&](size_t id) { seen.push_back(g.inner().node(id)); });
    REQUIRE(seen == std::vector<std::string>{"root", "x", "y"});
}

TEST_CASE("GraphMap deduplicates names", "[graph]") {
    GraphMap<> g;
    auto a1 = g.add_node("a");
    auto a2 = g.add_node("a");
    REQUIRE(a1 == a2);
    REQUIRE(g.contains("a"));
    REQUIRE_FALSE(g.find("zzz"));
    REQUIRE(g.node_count() == 1);
}
