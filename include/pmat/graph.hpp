#pragma once

#include <pmat/result.hpp>
#include <algorithm>
#include <functional>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pmat {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph over a node-index arena.
// Edges refer to nodes by index, so cyclic dependency graphs own no cycles.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.emplace_back();
        radj_.emplace_back();
        return id;
    }

    // Parallel edges are collapsed
    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        if (has_edge(from, to)) return;
        adj_[from].push_back({from, to, std::move(data)});
        radj_[to].push_back(from);
        ++edge_count_;
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_count_; }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    size_t in_degree(NodeId id) const { return radj_[id].size(); }
    size_t out_degree(NodeId id) const { return adj_[id].size(); }

    // Kahn's algorithm. Conflict error when the graph has a cycle.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n);
        std::queue<NodeId> q;
        for (size_t i = 0; i < n; ++i) {
            in_deg[i] = radj_[i].size();
            if (in_deg[i] == 0) q.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            order.push_back(u);
            for (const auto& e : adj_[u]) {
                if (--in_deg[e.to] == 0) q.push(e.to);
            }
        }

        if (order.size() != n) {
            return PmatError{PmatError::Conflict, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    bool has_cycle() const {
        return topological_sort().is_err();
    }

    // Strongly connected components (iterative Tarjan). Components with more
    // than one node, or a self-loop, are the graph's cycles.
    std::vector<std::vector<NodeId>> strongly_connected() const {
        size_t n = nodes_.size();
        const size_t unvisited = static_cast<size_t>(-1);
        std::vector<size_t> index(n, unvisited), low(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<NodeId> stack;
        std::vector<std::vector<NodeId>> out;
        size_t counter = 0;

        struct Frame { NodeId node; size_t next_edge; };
        for (NodeId start = 0; start < n; ++start) {
            if (index[start] != unvisited) continue;
            std::vector<Frame> call{{start, 0}};
            index[start] = low[start] = counter++;
            stack.push_back(start);
            on_stack[start] = true;

            while (!call.empty()) {
                Frame& f = call.back();
                if (f.next_edge < adj_[f.node].size()) {
                    NodeId w = adj_[f.node][f.next_edge++].to;
                    if (index[w] == unvisited) {
                        index[w] = low[w] = counter++;
                        stack.push_back(w);
                        on_stack[w] = true;
                        call.push_back({w, 0});
                    } else if (on_stack[w]) {
                        low[f.node] = std::min(low[f.node], index[w]);
                    }
                    continue;
                }
                NodeId v = f.node;
                call.pop_back();
                if (!call.empty()) {
                    low[call.back().node] = std::min(low[call.back().node], low[v]);
                }
                if (low[v] == index[v]) {
                    std::vector<NodeId> comp;
                    NodeId w;
                    do {
                        w = stack.back();
                        stack.pop_back();
                        on_stack[w] = false;
                        comp.push_back(w);
                    } while (w != v);
                    std::sort(comp.begin(), comp.end());
                    out.push_back(std::move(comp));
                }
            }
        }
        return out;
    }

    std::vector<std::vector<NodeId>> cycles() const {
        std::vector<std::vector<NodeId>> result;
        for (auto& comp : strongly_connected()) {
            if (comp.size() > 1 || has_edge(comp[0], comp[0])) {
                result.push_back(std::move(comp));
            }
        }
        return result;
    }

    // PageRank with uniform teleport; dangling mass is spread evenly.
    std::vector<double> pagerank(double damping = 0.85, int iterations = 50) const {
        size_t n = nodes_.size();
        if (n == 0) return {};
        std::vector<double> rank(n, 1.0 / n), next(n);
        for (int it = 0; it < iterations; ++it) {
            double dangling = 0.0;
            for (size_t i = 0; i < n; ++i) {
                if (adj_[i].empty()) dangling += rank[i];
            }
            std::fill(next.begin(), next.end(), (1.0 - damping) / n + damping * dangling / n);
            for (size_t i = 0; i < n; ++i) {
                if (adj_[i].empty()) continue;
                double share = damping * rank[i] / adj_[i].size();
                for (const auto& e : adj_[i]) next[e.to] += share;
            }
            rank.swap(next);
        }
        return rank;
    }

    void dfs(NodeId start, const std::function<void(NodeId)>& visitor) const {
        std::unordered_set<NodeId> visited;
        std::vector<NodeId> todo{start};
        while (!todo.empty()) {
            NodeId u = todo.back();
            todo.pop_back();
            if (!visited.insert(u).second) continue;
            visitor(u);
            for (auto it = adj_[u].rbegin(); it != adj_[u].rend(); ++it) {
                todo.push_back(it->to);
            }
        }
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;
    size_t edge_count_ = 0;
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed convenience wrapper
// ---------------------------------------------------------------------------

template<typename EdgeData = std::monostate>
class GraphMap {
public:
    using NodeId = typename Graph<std::string, EdgeData>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    void add_edge(const std::string& from, const std::string& to, EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        graph_.add_edge(f, t, std::move(data));
    }

    bool contains(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    std::optional<NodeId> find(const std::string& name) const {
        auto it = name_to_id_.find(name);
        if (it == name_to_id_.end()) return std::nullopt;
        return it->second;
    }

    Result<std::vector<std::string>> topological_sort() const {
        auto r = graph_.topological_sort();
        if (r.is_err()) return std::move(r).error();
        std::vector<std::string> names;
        names.reserve(r.value().size());
        for (auto id : r.value()) names.push_back(graph_.node(id));
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    size_t node_count() const { return graph_.node_count(); }
    size_t edge_count() const { return graph_.edge_count(); }

    const Graph<std::string, EdgeData>& inner() const { return graph_; }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace pmat
