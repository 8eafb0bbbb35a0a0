// graph/graph_io_dot.h - Graphviz DOT export
// Part of the preference-sort library (C++20)
//
// Writes labelled graphs in DOT format for visualisation with Graphviz.
// Nodes are written by token, quoted.  No parsing.

#ifndef PREFSORT_GRAPH_IO_DOT_H
#define PREFSORT_GRAPH_IO_DOT_H

#include "graph_concepts.h"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace prefsort::graph::io {

namespace detail {

inline void write_quoted(std::ostream& os, std::string_view s) {
    os << '"';
    for (char c : s) {
        if (c == '"' || c == '\\') os << '\\';
        os << c;
    }
    os << '"';
}

} // namespace detail

/// Write a labelled graph in Graphviz DOT format.
///
/// Example output:
/// ```dot
/// digraph G {
///   "key" -> "id";
///   "children";
/// }
/// ```
template<labelled_graph G>
void write_dot(std::ostream& os, G const& g, std::string_view graph_name = "G") {
    os << "digraph " << graph_name << " {\n";

    for (std::size_t u = 0; u < g.node_count(); ++u) {
        node_id const un{static_cast<std::uint32_t>(u)};
        auto const& nbrs = g.out_neighbors(un);
        if (nbrs.begin() == nbrs.end()) {
            // Isolated or sink node: emit standalone so it appears.
            os << "  ";
            detail::write_quoted(os, g.label(un));
            os << ";\n";
            continue;
        }
        for (auto v : nbrs) {
            os << "  ";
            detail::write_quoted(os, g.label(un));
            os << " -> ";
            detail::write_quoted(os, g.label(v));
            os << ";\n";
        }
    }

    os << "}\n";
}

} // namespace prefsort::graph::io

#endif // PREFSORT_GRAPH_IO_DOT_H
