// sorter/preference_sorter.h - Hint-driven ordering of one group of tokens
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// A sort request runs in four stages:
//   1. Build a preference_dag over the distinct tokens.
//   2. Apply every configured hint (custom order first, then the
//      canonical order).  Conflicting edges from later hints are dropped.
//   3. Compute each token's hint rank: the index of the first hint with an
//      entry matching it, or the hint count when nothing matches.
//   4. Topologically sort.  Ready tokens leave by ascending hint rank and
//      then by the mode's tie-breaker:
//        direct      - the cached pairwise comparator;
//        off         - original input position;
//        stabilized  - Bradley-Terry strength (descending) fitted to the
//                      full matrix of raw model outcomes.
//      off and stabilized first add a stabilizing hint: the fallback order
//      grouped by hint rank.
//
// Hint rank keeps hinted tokens ahead of unhinted ones even when the two
// have no path between them in the graph, and keeps tokens no hint
// mentions in their fallback order.
//
// The comparator is called synchronously from inside topo_sort().  A
// model exception aborts the request and leaves the sorter reusable.
//
// THREAD SAFETY: none.  One sorter (and its cache) per thread.

#ifndef PREFSORT_SORTER_PREFERENCE_SORTER_H
#define PREFSORT_SORTER_PREFERENCE_SORTER_H

#include "canonical_order.h"
#include "sort_mode.h"
#include <prefsort/compare/comparison_cache.h>
#include <prefsort/compare/pairwise_comparator.h>
#include <prefsort/compare/pairwise_model.h>
#include <prefsort/core/limits.h>
#include <prefsort/core/sort_stats.h>
#include <prefsort/core/token.h>
#include <prefsort/graph/preference_dag.h>
#include <prefsort/rank/bradley_terry.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prefsort {

/// Replaceable rank estimator: win matrix -> strengths.
using rank_estimator = std::function<rank::bradley_terry_result(rank::win_matrix const&)>;

/// Per-sorter configuration.  Defaults come from limits.h.
struct sorter_options {
    sort_mode mode = sort_mode::stabilized;

    /// User precedence, raw names or prefix patterns ("data-*").
    /// Normalized on construction.  Applied before the canonical order.
    std::vector<std::string> custom_order;

    bool use_canonical_order = true;

    /// Log each request to std::cerr.
    bool verbose = false;

    std::size_t bradley_terry_max_iter = limits::bradley_terry_max_iter;

    /// Overrides Bradley-Terry in stabilized mode when set.
    rank_estimator estimator;
};

/// Orders groups of tokens by configured hints, then by the mode's
/// tie-breaker.
///
/// Example:
/// ```cpp
/// sorter_options opts;
/// opts.mode = sort_mode::off;
/// opts.custom_order = {"onClick", "key"};
/// preference_sorter s{opts};
/// auto out = s.sort({"title", "key", "on click"});   // {on click, key, title}
/// ```
class preference_sorter {
public:
    /// Throws std::invalid_argument if the mode is out of range, or if it
    /// needs a model and none is bound.
    explicit preference_sorter(sorter_options opts, compare::any_pairwise_model model = {})
        : opts_(std::move(opts)), model_(std::move(model)) {
        if (!is_valid(opts_.mode))
            throw std::invalid_argument("preference_sorter: invalid sort mode");
        if (opts_.mode != sort_mode::off && !model_)
            throw std::invalid_argument(
                std::string("preference_sorter: mode '") + std::string(to_string(opts_.mode)) +
                "' requires a pairwise model");

        if (!opts_.custom_order.empty()) {
            std::vector<token> custom;
            custom.reserve(opts_.custom_order.size());
            for (auto const& raw : opts_.custom_order) custom.push_back(normalize(raw));
            hints_.push_back(std::move(custom));
        }
        if (opts_.use_canonical_order) hints_.push_back(canonical_order());
    }

    // =========================================================================
    // Sorting
    // =========================================================================

    /// Reorder tokens.  The output is a permutation of the input; repeated
    /// tokens end up adjacent, in input order.  Groups of fewer than two
    /// items are returned unchanged.
    [[nodiscard]] std::vector<token> sort(std::span<token const> items) {
        last_ = sort_stats{};
        if (items.size() < 2) {
            last_.items = items.size();
            total_ += last_;
            return std::vector<token>(items.begin(), items.end());
        }

        std::vector<token> distinct;
        std::unordered_map<token, std::size_t> count;
        for (auto const& t : items) {
            if (count[t]++ == 0) distinct.push_back(t);
        }
        last_.items = distinct.size();

        auto const order = sort_distinct(distinct);

        std::vector<token> out;
        out.reserve(items.size());
        for (auto const& t : order) out.insert(out.end(), count[t], t);

        total_ += last_;
        if (opts_.verbose) log_result(order);
        return out;
    }

    [[nodiscard]] std::vector<token> sort(std::vector<token> const& items) {
        return sort(std::span<token const>(items));
    }

    /// Order raw names by their normalized tokens.  Returns a permutation
    /// of input positions: result[k] is the index of the name placed k-th.
    /// Names that normalize to the same token stay adjacent, in input order.
    [[nodiscard]] std::vector<std::size_t> sort_names(std::span<std::string const> names) {
        std::vector<token> tokens;
        tokens.reserve(names.size());
        for (auto const& n : names) tokens.push_back(normalize(n));

        std::vector<token> distinct;
        std::unordered_map<token, std::vector<std::size_t>> positions;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            auto& pos = positions[tokens[i]];
            if (pos.empty()) distinct.push_back(tokens[i]);
            pos.push_back(i);
        }

        std::vector<std::size_t> perm;
        perm.reserve(names.size());
        for (auto const& t : sort(distinct)) {
            auto const& pos = positions[t];
            perm.insert(perm.end(), pos.begin(), pos.end());
        }
        return perm;
    }

    [[nodiscard]] std::vector<std::size_t> sort_names(std::vector<std::string> const& names) {
        return sort_names(std::span<std::string const>(names));
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Counters of the most recent sort() call.
    [[nodiscard]] sort_stats const& last_stats() const noexcept { return last_; }

    /// Counters summed over every sort() call.
    [[nodiscard]] sort_stats const& total_stats() const noexcept { return total_; }

    /// Configured hints in application order, normalized.
    [[nodiscard]] std::vector<std::vector<token>> const& hints() const noexcept {
        return hints_;
    }

    [[nodiscard]] sorter_options const& options() const noexcept { return opts_; }

    /// Comparison memo shared by every request of this sorter.
    [[nodiscard]] compare::comparison_cache& cache() noexcept { return cache_; }

    /// Indices of items sorted by descending strength.  Items whose
    /// strength is NaN keep their slots; the others are stably sorted
    /// into the remaining slots.
    [[nodiscard]] static std::vector<std::size_t>
    strength_order(std::span<double const> strength) {
        std::vector<std::size_t> order(strength.size());
        std::vector<std::size_t> ranked;
        for (std::size_t i = 0; i < strength.size(); ++i) {
            order[i] = i;
            if (!std::isnan(strength[i])) ranked.push_back(i);
        }
        auto slots = ranked;
        std::stable_sort(ranked.begin(), ranked.end(), [&](std::size_t a, std::size_t b) {
            return strength[a] > strength[b];
        });
        for (std::size_t k = 0; k < slots.size(); ++k) order[slots[k]] = ranked[k];
        return order;
    }

private:
    std::vector<token> sort_distinct(std::vector<token> const& tokens) {
        graph::preference_dag dag(tokens);
        for (auto const& hint : hints_) apply_hint(dag, hint);

        auto const rank = hint_ranks(dag);

        if (opts_.mode == sort_mode::direct) return sort_direct(dag, rank);

        std::vector<std::size_t> fallback = opts_.mode == sort_mode::stabilized
            ? stabilized_order(tokens)
            : identity(tokens.size());
        std::stable_sort(fallback.begin(), fallback.end(), [&](std::size_t a, std::size_t b) {
            return rank[a] < rank[b];
        });

        std::vector<token> stabilizing;
        stabilizing.reserve(fallback.size());
        std::unordered_map<token, std::size_t> position;
        for (std::size_t k = 0; k < fallback.size(); ++k) {
            stabilizing.push_back(tokens[fallback[k]]);
            position.emplace(tokens[fallback[k]], k);
        }
        apply_hint(dag, stabilizing);

        return dag.topo_sort([this, &position](token const& a, token const& b) {
            ++last_.tie_breaks;
            auto const pa = position.at(a);
            auto const pb = position.at(b);
            return pa < pb ? -1.0 : (pb < pa ? 1.0 : 0.0);
        });
    }

    std::vector<token> sort_direct(graph::preference_dag const& dag,
                                   std::vector<std::size_t> const& rank) {
        compare::pairwise_comparator cmp(model_, cache_);
        auto const hits0 = cache_.hits();
        auto const misses0 = cache_.misses();

        std::unordered_map<token, std::size_t> rank_of;
        rank_of.reserve(dag.node_count());
        for (std::uint32_t u = 0; u < dag.node_count(); ++u)
            rank_of.emplace(dag.label(graph::node_id{u}), rank[u]);

        auto order = dag.topo_sort([&](token const& a, token const& b) {
            ++last_.tie_breaks;
            auto const ra = rank_of.at(a);
            auto const rb = rank_of.at(b);
            if (ra != rb) return ra < rb ? -1.0 : 1.0;
            return cmp.compare(a, b);
        });

        last_.model_calls += cmp.model_calls();
        last_.cache_hits += cache_.hits() - hits0;
        last_.cache_misses += cache_.misses() - misses0;
        return order;
    }

    /// Fallback order for stabilized mode: every unordered pair is scored
    /// once and the win matrix ranked by the estimator.
    std::vector<std::size_t> stabilized_order(std::vector<token> const& tokens) {
        compare::pairwise_comparator cmp(model_, cache_);
        auto const n = tokens.size();
        rank::win_matrix w(n, std::vector<double>(n, 0.0));
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                auto const s = cmp.raw_compare(tokens[i], tokens[j]);
                w[j][i] = s.cmp;
                w[i][j] = s.cmp_rev;
            }
        }
        last_.model_calls += cmp.model_calls();

        auto const fit = opts_.estimator
            ? opts_.estimator(w)
            : rank::bradley_terry(w, opts_.bradley_terry_max_iter);
        if (fit.strength.size() != n)
            throw std::logic_error("preference_sorter: estimator returned "
                                   + std::to_string(fit.strength.size()) + " strengths for "
                                   + std::to_string(n) + " items");
        last_.rank_iterations = fit.iterations;

        return strength_order(fit.strength);
    }

    void apply_hint(graph::preference_dag& dag, std::span<token const> hint) {
        auto const r = dag.add_edges(hint);
        ++last_.hints_applied;
        last_.edges_added += r.added;
        last_.edges_rejected += r.rejected;
    }

    std::vector<std::size_t> hint_ranks(graph::preference_dag const& dag) const {
        std::vector<std::size_t> rank(dag.node_count(), hints_.size());
        for (std::size_t h = hints_.size(); h-- > 0;) {
            for (auto const& entry : hints_[h]) {
                for (auto n : dag.match_nodes(entry)) rank[graph::to_index(n)] = h;
            }
        }
        return rank;
    }

    static std::vector<std::size_t> identity(std::size_t n) {
        std::vector<std::size_t> v(n);
        for (std::size_t i = 0; i < n; ++i) v[i] = i;
        return v;
    }

    void log_result(std::vector<token> const& order) const {
        std::cerr << "[sorter] mode=" << to_string(opts_.mode)
                  << " items=" << last_.items
                  << " hints=" << last_.hints_applied
                  << " edges=" << last_.edges_added
                  << " rejected=" << last_.edges_rejected
                  << " model_calls=" << last_.model_calls;
        if (opts_.mode == sort_mode::stabilized)
            std::cerr << " bt_iters=" << last_.rank_iterations;
        std::cerr << "\n[sorter]   ->";
        for (auto const& t : order) std::cerr << " [" << t << "]";
        std::cerr << "\n";
    }

    sorter_options opts_;
    compare::any_pairwise_model model_;
    compare::comparison_cache cache_;
    std::vector<std::vector<token>> hints_;
    sort_stats last_;
    sort_stats total_;
};

} // namespace prefsort

#endif // PREFSORT_SORTER_PREFERENCE_SORTER_H
