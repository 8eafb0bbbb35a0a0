// graph/graph_concepts.h - Node descriptors and the labelled-graph concept
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// Graphs here are keyed by tokens, but algorithms work on dense indices.
// node_id is the opaque index handle; the token is the node's label.
// Every graph fixes its node set at construction, so a node_id stays valid
// for the lifetime of the graph that produced it.

#ifndef PREFSORT_GRAPH_CONCEPTS_H
#define PREFSORT_GRAPH_CONCEPTS_H

#include <prefsort/core/token.h>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace prefsort::graph {

// =============================================================================
// Descriptor Type
// =============================================================================

/// Opaque node identifier.
///
/// Valid only for the specific graph instance that produced it.
struct node_id {
    std::uint32_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Convert node_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

// =============================================================================
// Graph Concept
// =============================================================================

/// A labelled_graph provides adjacency queries and a token per node.
///
/// Requirements:
/// - node_count(): number of nodes
/// - out_neighbors(u): range of node_id
/// - label(u): the node's token
template<typename G>
concept labelled_graph =
    requires(G const& g, node_id u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) };
        { g.label(u) } -> std::convertible_to<token const&>;
    };

} // namespace prefsort::graph

#endif // PREFSORT_GRAPH_CONCEPTS_H
