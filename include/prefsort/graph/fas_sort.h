// graph/fas_sort.h - Greedy feedback-arc-set ordering of a weighted digraph
// Part of the preference-sort library (C++20)
//
// ALGORITHM: Eades-Lin-Smyth greedy FAS heuristic, weighted.
// The result array is filled from both ends inward:
//   1. while some node has no remaining out weight (a sink), place it at
//      the rightmost free slot and remove it;
//   2. while some node has no remaining in weight (a source), place it at
//      the leftmost free slot and remove it;
//   3. otherwise place the node maximising (out - in) at the leftmost
//      free slot, ties going to the smaller (in + out), and remove it.
// Removing a node lowers its remaining neighbours' in/out totals.  Each
// round removes at least one node, so the loop ends after V rounds.
//
// The three "best node" queries share one multi_view_queue.  A weight
// change is delete-old-snapshot + push-new-snapshot.
//
// Determinism: every view ends its comparison on the node index, so the
// order is a strict total order and equal inputs give equal outputs.
// Sinks prefer the larger index (they are placed right to left), sources
// and scored nodes the smaller one, so untouched nodes keep their
// first-appearance order.
//
// Complexity: O((V + E) log(V + E)) heap work plus O(V + E) bookkeeping.

#ifndef PREFSORT_GRAPH_FAS_SORT_H
#define PREFSORT_GRAPH_FAS_SORT_H

#include "graph_concepts.h"
#include "weighted_digraph.h"
#include <prefsort/queue/multi_view_queue.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace prefsort::graph {

namespace detail {

enum class fas_view : std::size_t { out_weight = 0, in_weight = 1, score = 2 };

/// Snapshot of one node's remaining weights.
struct fas_entry {
    node_id node;
    double out_w;
    double in_w;
};

[[nodiscard]] constexpr double sign_of(double a, double b) noexcept {
    return a < b ? -1.0 : (b < a ? 1.0 : 0.0);
}

[[nodiscard]] constexpr double by_index(node_id a, node_id b) noexcept {
    return sign_of(static_cast<double>(a.value), static_cast<double>(b.value));
}

inline std::array<comparator_fn<fas_entry>, 3> fas_comparators() {
    return {
        // out_weight: smallest first; equal -> larger index first.
        [](fas_entry const& a, fas_entry const& b) {
            if (double c = sign_of(a.out_w, b.out_w); c != 0.0) return c;
            return by_index(b.node, a.node);
        },
        // in_weight: smallest first; equal -> smaller index first.
        [](fas_entry const& a, fas_entry const& b) {
            if (double c = sign_of(a.in_w, b.in_w); c != 0.0) return c;
            return by_index(a.node, b.node);
        },
        // score: largest (out - in) first, then smallest (in + out).
        [](fas_entry const& a, fas_entry const& b) {
            if (double c = sign_of(a.in_w - a.out_w, b.in_w - b.out_w); c != 0.0) return c;
            if (double c = sign_of(a.in_w + a.out_w, b.in_w + b.out_w); c != 0.0) return c;
            return by_index(a.node, b.node);
        },
    };
}

} // namespace detail

/// Order every node of g so that few (lightly weighted) arcs point
/// backwards.  For an acyclic g every arc points forwards.
///
/// Example:
/// ```cpp
/// weighted_digraph_builder b;
/// b.add_edge("a", "b", 1); b.add_edge("b", "c", 1); b.add_edge("c", "a", 10);
/// auto order = fas_sort(b.finalise());   // {c, a, b}: only b -> c points back
/// ```
[[nodiscard]] inline std::vector<token> fas_sort(weighted_digraph const& g) {
    using detail::fas_entry;
    using detail::fas_view;

    auto const V = g.node_count();
    multi_view_queue<fas_entry, fas_view, 3> q(detail::fas_comparators());

    std::vector<fas_entry> current(V);
    std::vector<std::uint64_t> queued(V);
    std::vector<bool> present(V, true);
    std::vector<std::size_t> out_left(V), in_left(V);

    for (std::size_t u = 0; u < V; ++u) {
        node_id const n{static_cast<std::uint32_t>(u)};
        current[u] = fas_entry{n, g.out_weight(n), g.in_weight(n)};
        out_left[u] = g.out_arcs(n).size();
        in_left[u] = g.in_arcs(n).size();
        queued[u] = q.push(current[u])->id;
    }

    auto resubmit = [&](std::size_t v) {
        q.erase(queued[v]);
        queued[v] = q.push(current[v])->id;
    };

    auto remove = [&](node_id n) {
        present[to_index(n)] = false;
        for (auto const& arc : g.out_arcs(n)) {
            auto const v = to_index(arc.to);
            if (!present[v]) continue;
            // No arcs left means exactly zero, whatever rounding did.
            current[v].in_w = --in_left[v] == 0 ? 0.0 : current[v].in_w - arc.weight;
            resubmit(v);
        }
        for (auto const& arc : g.in_arcs(n)) {
            auto const v = to_index(arc.to);
            if (!present[v]) continue;
            current[v].out_w = --out_left[v] == 0 ? 0.0 : current[v].out_w - arc.weight;
            resubmit(v);
        }
    };

    std::vector<token> order(V);
    std::size_t left = 0;
    std::size_t right = V;

    while (!q.empty()) {
        while (auto sink = q.peek(fas_view::out_weight)) {
            if (sink->out_w != 0.0) break;
            (void)q.pop(fas_view::out_weight);
            order[--right] = g.label(sink->node);
            remove(sink->node);
        }

        while (auto source = q.peek(fas_view::in_weight)) {
            if (source->in_w != 0.0) break;
            (void)q.pop(fas_view::in_weight);
            order[left++] = g.label(source->node);
            remove(source->node);
        }

        auto best = q.pop(fas_view::score);
        if (!best) break;
        order[left++] = g.label(best->node);
        remove(best->node);
    }

    return order;
}

/// Convenience overload: build the graph from an edge list first.
[[nodiscard]] inline std::vector<token> fas_sort(std::span<weighted_edge const> edges) {
    weighted_digraph_builder b;
    for (auto const& e : edges) b.add_edge(e);
    return fas_sort(b.finalise());
}

} // namespace prefsort::graph

#endif // PREFSORT_GRAPH_FAS_SORT_H
