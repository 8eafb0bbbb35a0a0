// graph/preference_dag.h - Acyclic precedence graph built from ordering hints
// Part of the preference-sort library (C++20)
//
// ALGORITHM:
// A hint is an ordered list of tokens or prefix patterns meaning "nothing
// here sorts after anything listed later".  add_edges() walks the hint
// keeping a frontier: the most recent matched nodes that have not yet been
// linked to a later element.  For the next matched group vs, every
// frontier node u gets an edge u -> v unless v already reaches u, in which
// case the edge would close a cycle and is dropped.  The new frontier is vs
// plus every u that was linked to nothing in vs.
//
// INVARIANT: the graph is acyclic after every add_edges() call.  Inserting
// u -> v when v cannot reach u never creates a cycle, so no check is needed
// after the fact.  Conflicting hints therefore accumulate: the earliest
// hint wins and later contradicting edges are silently dropped.
//
// The node set is fixed at construction.  Hint entries matching no node
// are skipped.
//
// topo_sort() is Kahn's algorithm with a priority queue of ready nodes
// ordered by a caller-supplied tie-breaker.

#ifndef PREFSORT_GRAPH_PREFERENCE_DAG_H
#define PREFSORT_GRAPH_PREFERENCE_DAG_H

#include "graph_concepts.h"
#include <prefsort/core/token.h>
#include <prefsort/queue/priority_queue.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prefsort::graph {

/// Edge bookkeeping for one add_edges() call.
struct edge_result {
    std::size_t added = 0;     ///< new edges inserted
    std::size_t rejected = 0;  ///< edges dropped because they would close a cycle
};

/// Directed acyclic graph over a fixed set of tokens.
///
/// Example:
/// ```cpp
/// std::vector<token> const nodes{"a", "b", "c"};
/// preference_dag dag(nodes);
/// dag.add_edges(nodes);                               // a -> b -> c
/// dag.add_edges(std::vector<token>{"c", "a"});        // dropped
/// auto order = dag.topo_sort([](token const& x, token const& y) {
///     return x.compare(y);
/// });                                                 // {a, b, c}
/// ```
class preference_dag {
public:
    /// Build a graph whose node set is `nodes`.  Repeated tokens
    /// collapse into one node (first occurrence keeps its position).
    explicit preference_dag(std::span<token const> nodes) {
        labels_.reserve(nodes.size());
        for (auto const& t : nodes) {
            if (index_.contains(t)) continue;
            index_.emplace(t, node_id{static_cast<std::uint32_t>(labels_.size())});
            labels_.push_back(t);
        }
        succ_.resize(labels_.size());
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return labels_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return E_; }

    [[nodiscard]] token const& label(node_id u) const { return labels_.at(to_index(u)); }
    [[nodiscard]] std::vector<token> const& labels() const noexcept { return labels_; }

    [[nodiscard]] std::vector<node_id> const& out_neighbors(node_id u) const {
        return succ_.at(to_index(u));
    }

    [[nodiscard]] std::optional<node_id> find(std::string_view t) const {
        auto it = index_.find(token(t));
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool has_edge(node_id u, node_id v) const {
        auto const& s = out_neighbors(u);
        return std::find(s.begin(), s.end(), v) != s.end();
    }

    /// Nodes matched by a hint entry, in node order.
    /// A prefix pattern matches every node starting with its prefix; an
    /// exact entry matches its node if present.
    [[nodiscard]] std::vector<node_id> match_nodes(token_pattern const& p) const {
        std::vector<node_id> out;
        if (p.empty()) return out;
        if (!p.is_prefix()) {
            if (auto n = find(p.text())) out.push_back(*n);
            return out;
        }
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            if (p.matches(labels_[i])) {
                out.push_back(node_id{static_cast<std::uint32_t>(i)});
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<node_id> match_nodes(std::string_view entry) const {
        return match_nodes(token_pattern::parse(entry));
    }

    /// For each destination, whether src reaches it (src reaches itself).
    /// Iterative DFS; stops once every destination has been seen.
    [[nodiscard]] std::vector<bool>
    has_path(node_id src, std::span<node_id const> dsts) const {
        std::vector<bool> wanted(labels_.size(), false);
        for (auto d : dsts) wanted[to_index(d)] = true;

        std::vector<bool> reached(labels_.size(), false);
        std::vector<bool> visited(labels_.size(), false);
        std::size_t remaining = std::count(wanted.begin(), wanted.end(), true);

        std::vector<node_id> stack{src};
        while (!stack.empty() && remaining > 0) {
            auto const u = stack.back();
            stack.pop_back();
            auto const ui = to_index(u);

            if (wanted[ui] && !reached[ui]) {
                reached[ui] = true;
                if (--remaining == 0) break;
            }
            if (visited[ui]) continue;
            visited[ui] = true;
            for (auto v : succ_[ui]) {
                if (!visited[to_index(v)]) stack.push_back(v);
            }
        }

        std::vector<bool> out;
        out.reserve(dsts.size());
        for (auto d : dsts) out.push_back(reached[to_index(d)]);
        return out;
    }

    /// True when no node reaches itself through at least one edge.
    [[nodiscard]] bool is_acyclic() const {
        for (std::size_t u = 0; u < labels_.size(); ++u) {
            for (auto v : succ_[u]) {
                node_id const self{static_cast<std::uint32_t>(u)};
                if (has_path(v, std::span<node_id const>(&self, 1)).front()) {
                    return false;
                }
            }
        }
        return true;
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Absorb one ordering hint.  See the header comment for the frontier
    /// rule.  Entries matching no node are skipped.
    edge_result add_edges(std::span<token const> hint) {
        edge_result result;
        std::size_t i = 0;
        std::size_t const n = hint.size();

        // Seed the frontier with the first entry that matches anything.
        std::vector<node_id> us;
        while (i < n && us.empty()) {
            us = match_nodes(hint[i++]);
        }

        while (i < n) {
            auto const vs = match_nodes(hint[i++]);
            if (vs.empty()) continue;

            std::vector<bool> linked(us.size(), false);
            for (auto v : vs) {
                auto const reaches = has_path(v, us);
                for (std::size_t j = 0; j < us.size(); ++j) {
                    if (!reaches[j]) {
                        if (insert_edge(us[j], v)) ++result.added;
                        linked[j] = true;
                    } else if (us[j] != v) {
                        ++result.rejected;
                    }
                }
            }

            std::vector<node_id> next;
            next.reserve(us.size() + vs.size());
            for (std::size_t j = 0; j < us.size(); ++j) {
                if (!linked[j]) next.push_back(us[j]);
            }
            for (auto v : vs) {
                if (std::find(next.begin(), next.end(), v) == next.end()) {
                    next.push_back(v);
                }
            }
            us = std::move(next);
        }
        return result;
    }

    // =========================================================================
    // Ordering
    // =========================================================================

    /// Kahn's algorithm.  Ready nodes leave in tie_breaker order
    /// (negative -> first argument first).  Every node appears exactly once.
    ///
    /// Throws std::logic_error if nodes remain unemitted, which would mean
    /// the acyclicity invariant was broken.
    template<typename Compare>
        requires three_way_comparator<Compare, token>
    [[nodiscard]] std::vector<token> topo_sort(Compare tie_breaker) const {
        auto const V = labels_.size();
        std::vector<std::size_t> in_degree(V, 0);
        for (auto const& s : succ_) {
            for (auto v : s) ++in_degree[to_index(v)];
        }

        auto by_label = [this, &tie_breaker](node_id a, node_id b) -> double {
            return static_cast<double>(tie_breaker(labels_[to_index(a)], labels_[to_index(b)]));
        };
        priority_queue<node_id, decltype(by_label)> ready(by_label);
        for (std::size_t u = 0; u < V; ++u) {
            if (in_degree[u] == 0) ready.push(node_id{static_cast<std::uint32_t>(u)});
        }

        std::vector<token> order;
        order.reserve(V);
        while (auto u = ready.pop()) {
            order.push_back(labels_[to_index(*u)]);
            for (auto v : succ_[to_index(*u)]) {
                if (--in_degree[to_index(v)] == 0) ready.push(v);
            }
        }

        if (order.size() != V)
            throw std::logic_error("preference_dag::topo_sort: graph contains a cycle");
        return order;
    }

private:
    bool insert_edge(node_id u, node_id v) {
        if (u == v || has_edge(u, v)) return false;
        succ_[to_index(u)].push_back(v);
        ++E_;
        return true;
    }

    std::vector<token> labels_;
    std::unordered_map<token, node_id> index_;
    std::vector<std::vector<node_id>> succ_;
    std::size_t E_ = 0;
};

static_assert(labelled_graph<preference_dag>);

} // namespace prefsort::graph

#endif // PREFSORT_GRAPH_PREFERENCE_DAG_H
