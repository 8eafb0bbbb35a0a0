// sorter/order_extractor.h - Suggest a precedence list from observed groups
// Part of the preference-sort library (C++20)
//
// Each observed group (for example the attribute list of one element in
// an existing code base) votes for every ordered pair it contains: for
// i < j the edge group[i] -> group[j] gains weight 1.  suggest() runs the
// greedy FAS sort over the accumulated weights, producing the order that
// contradicts the fewest observations.  The result can be fed back as a
// custom order.
//
// With folding on, tokens starting with a known family prefix ("data ",
// "aria ", "test ") collapse to the family pattern ("data *"), so the
// suggestion ranks the family rather than every member.  Pairs inside one
// family become self-edges and are dropped by the graph builder.

#ifndef PREFSORT_SORTER_ORDER_EXTRACTOR_H
#define PREFSORT_SORTER_ORDER_EXTRACTOR_H

#include <prefsort/core/token.h>
#include <prefsort/graph/fas_sort.h>
#include <prefsort/graph/weighted_digraph.h>

#include <array>
#include <cstddef>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prefsort {

struct extractor_options {
    /// Collapse family members ("data foo") to the family ("data *").
    bool fold_prefixes = true;

    /// Log each suggestion to std::cerr.
    bool verbose = false;
};

class order_extractor {
public:
    explicit order_extractor(extractor_options opts = {}) : opts_(opts) {}

    /// Family prefixes recognised by fold().
    static constexpr std::array<std::string_view, 3> family_prefixes = {"data ", "test ", "aria "};

    /// Map a token to its family pattern, or return it unchanged.
    [[nodiscard]] static token fold(token const& t) {
        for (auto prefix : family_prefixes) {
            if (t.size() > prefix.size() && t.starts_with(prefix)) {
                return token(prefix) + wildcard_marker;
            }
        }
        return t;
    }

    /// Record one group of normalized tokens.
    void add_group(std::span<token const> group) {
        std::vector<token> g;
        g.reserve(group.size());
        for (auto const& t : group) g.push_back(opts_.fold_prefixes ? fold(t) : t);

        for (std::size_t i = 0; i < g.size(); ++i) {
            auto& r = row_for(g[i]);
            for (std::size_t j = i + 1; j < g.size(); ++j) r.bump(g[j]);
        }
        ++groups_;
    }

    void add_group(std::vector<token> const& group) {
        add_group(std::span<token const>(group));
    }

    /// Record one group of raw names; each is normalized first.
    void add_names(std::span<std::string const> names) {
        std::vector<token> g;
        g.reserve(names.size());
        for (auto const& n : names) g.push_back(normalize(n));
        add_group(g);
    }

    [[nodiscard]] std::size_t group_count() const noexcept { return groups_; }

    /// Accumulated pair weights, grouped by source in first-seen order.
    /// Self pairs are included; the graph builder drops them.
    [[nodiscard]] std::vector<graph::weighted_edge> edges() const {
        std::vector<graph::weighted_edge> out;
        for (auto const& r : rows_) {
            for (auto const& [dst, w] : r.cells) out.push_back(graph::weighted_edge{r.src, dst, w});
        }
        return out;
    }

    /// Order with the least total weight pointing backwards.
    [[nodiscard]] std::vector<token> suggest() const {
        graph::weighted_digraph_builder b;
        for (auto const& r : rows_) b.add_node(r.src);
        for (auto const& e : edges()) b.add_edge(e);
        auto const g = b.finalise();
        auto order = graph::fas_sort(g);

        if (opts_.verbose) {
            std::cerr << "[extract] groups=" << groups_
                      << " nodes=" << g.node_count()
                      << " edges=" << g.edge_count() << "\n[extract]   ->";
            for (auto const& t : order) std::cerr << " [" << t << "]";
            std::cerr << "\n";
        }
        return order;
    }

    void clear() {
        rows_.clear();
        row_index_.clear();
        groups_ = 0;
    }

private:
    struct row {
        token src;
        std::vector<std::pair<token, double>> cells;
        std::unordered_map<token, std::size_t> cell_index;

        void bump(token const& dst) {
            auto it = cell_index.find(dst);
            if (it != cell_index.end()) {
                cells[it->second].second += 1.0;
                return;
            }
            cell_index.emplace(dst, cells.size());
            cells.emplace_back(dst, 1.0);
        }
    };

    row& row_for(token const& src) {
        auto it = row_index_.find(src);
        if (it != row_index_.end()) return rows_[it->second];
        row_index_.emplace(src, rows_.size());
        rows_.push_back(row{src, {}, {}});
        return rows_.back();
    }

    extractor_options opts_;
    std::vector<row> rows_;
    std::unordered_map<token, std::size_t> row_index_;
    std::size_t groups_ = 0;
};

} // namespace prefsort

#endif // PREFSORT_SORTER_ORDER_EXTRACTOR_H
