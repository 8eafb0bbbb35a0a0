// core/sort_stats.h - Statistics from one ordering request
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// sort_stats records what the orchestrator did for one group: how many
// hints it applied, how many precedence edges they produced, how many were
// dropped because they would have closed a cycle, and how much the
// pairwise comparator was consulted.
//
// The struct is a trivially copyable aggregate.  Different stages fill
// different fields; untouched fields stay 0.

#ifndef PREFSORT_CORE_SORT_STATS_H
#define PREFSORT_CORE_SORT_STATS_H

#include <cstddef>

namespace prefsort {

/// Counters collected while ordering one group of items.
///
/// Example:
/// ```cpp
/// preference_sorter s{opts};
/// auto out = s.sort(tokens);
/// auto const& st = s.last_stats();
/// std::cerr << st.edges_added << " edges, "
///           << st.edges_rejected << " rejected\n";
/// ```
struct sort_stats {
    // =============================================================================
    // Graph Metrics
    // =============================================================================

    /// Number of distinct items in the group.
    std::size_t items = 0;

    /// Hints applied to the preference graph, the stabilizing hint included.
    std::size_t hints_applied = 0;

    /// Edges inserted into the preference graph.
    std::size_t edges_added = 0;

    /// Candidate edges dropped because the target already reached the source.
    std::size_t edges_rejected = 0;

    // =============================================================================
    // Comparator Metrics
    // =============================================================================

    /// Calls into the tie-breaking comparator during topological sort.
    std::size_t tie_breaks = 0;

    /// Pairwise model evaluations (cache misses plus raw comparisons).
    std::size_t model_calls = 0;

    std::size_t cache_hits = 0;
    std::size_t cache_misses = 0;

    // =============================================================================
    // Rank Estimation
    // =============================================================================

    /// Bradley-Terry passes performed; 0 when the estimator was not used.
    std::size_t rank_iterations = 0;

    // =============================================================================
    // Aggregation Operations
    // =============================================================================

    /// Combine the counters of two requests (all fields sum).
    constexpr sort_stats operator+(sort_stats const& other) const {
        return sort_stats{
            .items = items + other.items,
            .hints_applied = hints_applied + other.hints_applied,
            .edges_added = edges_added + other.edges_added,
            .edges_rejected = edges_rejected + other.edges_rejected,
            .tie_breaks = tie_breaks + other.tie_breaks,
            .model_calls = model_calls + other.model_calls,
            .cache_hits = cache_hits + other.cache_hits,
            .cache_misses = cache_misses + other.cache_misses,
            .rank_iterations = rank_iterations + other.rank_iterations,
        };
    }

    constexpr sort_stats& operator+=(sort_stats const& other) {
        *this = *this + other;
        return *this;
    }

    /// Cache hit rate (0.0 to 1.0); 0.0 if the cache was never consulted.
    [[nodiscard]] constexpr double cache_hit_rate() const {
        std::size_t total = cache_hits + cache_misses;
        if (total == 0) return 0.0;
        return static_cast<double>(cache_hits) / static_cast<double>(total);
    }

    constexpr bool operator==(sort_stats const& other) const = default;
};

} // namespace prefsort

#endif // PREFSORT_CORE_SORT_STATS_H
