// graph/weighted_digraph.h - Token-labelled weighted digraph and builder
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// The FAS sort consumes a plain weighted edge list that may contain
// cycles.  weighted_digraph_builder collects the list, then finalise()
// produces an immutable graph with both outgoing and incoming arc lists
// and per-node weight totals.
//
// finalise() CANONICALISATION RULES:
// 1. Nodes are numbered in order of first appearance (src before dst).
// 2. Self-edges are dropped; their node is kept.
// 3. A repeated (src, dst) pair keeps the weight given last.
// 4. Arcs keep first-insertion order per node.

#ifndef PREFSORT_GRAPH_WEIGHTED_DIGRAPH_H
#define PREFSORT_GRAPH_WEIGHTED_DIGRAPH_H

#include "graph_concepts.h"
#include <prefsort/core/token.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prefsort::graph {

/// One input edge: src should precede dst, with the given strength.
struct weighted_edge {
    token src;
    token dst;
    double weight = 1.0;
};

/// Adjacency entry.
struct weighted_arc {
    node_id to;
    double weight;
};

// Forward declaration for friend access.
class weighted_digraph_builder;

// =============================================================================
// weighted_digraph
// =============================================================================

/// Immutable weighted digraph over tokens, cycles allowed.
class weighted_digraph {
public:
    weighted_digraph() = default;

    [[nodiscard]] std::size_t node_count() const noexcept { return labels_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return E_; }
    [[nodiscard]] bool empty() const noexcept { return labels_.empty(); }

    [[nodiscard]] token const& label(node_id u) const { return labels_.at(to_index(u)); }

    [[nodiscard]] std::vector<weighted_arc> const& out_arcs(node_id u) const {
        return out_.at(to_index(u));
    }
    [[nodiscard]] std::vector<weighted_arc> const& in_arcs(node_id u) const {
        return in_.at(to_index(u));
    }

    /// Sum of outgoing arc weights.
    [[nodiscard]] double out_weight(node_id u) const { return total(out_arcs(u)); }
    /// Sum of incoming arc weights.
    [[nodiscard]] double in_weight(node_id u) const { return total(in_arcs(u)); }

private:
    static double total(std::vector<weighted_arc> const& arcs) noexcept {
        double w = 0.0;
        for (auto const& a : arcs) w += a.weight;
        return w;
    }

    std::vector<token> labels_;
    std::vector<std::vector<weighted_arc>> out_;
    std::vector<std::vector<weighted_arc>> in_;
    std::size_t E_ = 0;

    friend class weighted_digraph_builder;
};

// =============================================================================
// weighted_digraph_builder
// =============================================================================

/// Builder for weighted_digraph.
///
/// Example:
/// ```cpp
/// weighted_digraph_builder b;
/// b.add_edge("a", "b", 2.0);
/// b.add_edge("b", "a", 1.0);
/// auto g = b.finalise();   // 2 nodes, 2 arcs
/// ```
class weighted_digraph_builder {
public:
    /// Record an edge.  Weights must be finite and non-negative.
    void add_edge(token src, token dst, double weight) {
        if (!std::isfinite(weight) || weight < 0.0)
            throw std::invalid_argument(
                "weighted_digraph_builder::add_edge: weight must be finite and non-negative");
        auto const u = intern(std::move(src));
        auto const v = intern(std::move(dst));
        edges_.push_back(pending{u, v, weight});
    }

    void add_edge(weighted_edge const& e) { add_edge(e.src, e.dst, e.weight); }

    /// Register a node with no edges.
    node_id add_node(token t) { return intern(std::move(t)); }

    [[nodiscard]] std::size_t node_count() const noexcept { return labels_.size(); }

    /// Build the immutable graph.
    [[nodiscard]] weighted_digraph finalise() const {
        weighted_digraph g;
        auto const V = labels_.size();
        g.labels_ = labels_;
        g.out_.resize(V);
        g.in_.resize(V);

        // (src, dst) -> position in g.out_[src]; later duplicates overwrite.
        std::vector<std::unordered_map<std::uint32_t, std::size_t>> seen(V);
        for (auto const& e : edges_) {
            if (e.src == e.dst) continue;
            auto& slot = seen[to_index(e.src)];
            auto it = slot.find(e.dst.value);
            if (it != slot.end()) {
                g.out_[to_index(e.src)][it->second].weight = e.weight;
                for (auto& a : g.in_[to_index(e.dst)]) {
                    if (a.to == e.src) a.weight = e.weight;
                }
                continue;
            }
            slot.emplace(e.dst.value, g.out_[to_index(e.src)].size());
            g.out_[to_index(e.src)].push_back(weighted_arc{e.dst, e.weight});
            g.in_[to_index(e.dst)].push_back(weighted_arc{e.src, e.weight});
            ++g.E_;
        }
        return g;
    }

private:
    struct pending {
        node_id src;
        node_id dst;
        double weight;
    };

    node_id intern(token t) {
        auto it = index_.find(t);
        if (it != index_.end()) return it->second;
        node_id const id{static_cast<std::uint32_t>(labels_.size())};
        index_.emplace(t, id);
        labels_.push_back(std::move(t));
        return id;
    }

    std::vector<token> labels_;
    std::unordered_map<token, node_id> index_;
    std::vector<pending> edges_;
};

} // namespace prefsort::graph

#endif // PREFSORT_GRAPH_WEIGHTED_DIGRAPH_H
