#pragma once

#include <stow/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <algorithm>
#include <functional>

namespace stow {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph over an adjacency list
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
        adj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }

    // Depth-first post-order over the nodes reachable from `roots`, visiting
    // successors in insertion order. Every node appears after all of its
    // successors. A back edge yields a Cycle error whose message spells the
    // chain with name_fn, e.g. "a → b → a".
    Result<std::vector<NodeId>> dfs_postorder(
        const std::vector<NodeId>& roots,
        std::function<std::string(const NodeData&)> name_fn) const
    {
        enum Color { White, Gray, Black };
        std::vector<Color> color(nodes_.size(), White);
        std::vector<NodeId> stack;
        std::vector<NodeId> order;
        std::vector<NodeId> cycle;

        std::function<bool(NodeId)> visit = [&](NodeId u) -> bool {
            color[u] = Gray;
            stack.push_back(u);
            for (const auto& e : adj_[u]) {
                if (color[e.to] == Gray) {
                    auto it = std::find(stack.begin(), stack.end(), e.to);
                    cycle.assign(it, stack.end());
                    cycle.push_back(e.to);
                    return false;
                }
                if (color[e.to] == White && !visit(e.to)) return false;
            }
            stack.pop_back();
            color[u] = Black;
            order.push_back(u);
            return true;
        };

        for (NodeId root : roots) {
            if (color[root] != White) continue;
            if (!visit(root)) {
                std::string chain;
                for (size_t i = 0; i < cycle.size(); ++i) {
                    if (i > 0) chain += " → ";
                    chain += name_fn(nodes_[cycle[i]]);
                }
                return StowError{StowError::Cycle,
                    "circular dependency: " + chain,
                    "remove one of the dependency declarations in the chain"};
            }
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed wrapper over Graph
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

    void add_edge(const std::string& from, const std::string& to,
                  EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        if (!graph_.has_edge(f, t)) {
            graph_.add_edge(f, t, std::move(data));
        }
    }

    // Dependencies-first order of everything reachable from roots.
    Result<std::vector<std::string>> postorder(const std::vector<std::string>& roots) const {
        std::vector<NodeId> ids;
        for (const auto& r : roots) {
            auto it = name_to_id_.find(r);
            if (it != name_to_id_.end()) ids.push_back(it->second);
        }
        auto r = graph_.dfs_postorder(ids, [](const std::string& s) { return s; });
        if (r.is_err()) return std::move(r).error();
        std::vector<std::string> names;
        for (auto id : r.value()) {
            names.push_back(graph_.node(id));
        }
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace stow
