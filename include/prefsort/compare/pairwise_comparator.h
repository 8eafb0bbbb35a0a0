// compare/pairwise_comparator.h - Cached three-way comparator over tokens
// Part of the preference-sort library (C++20)
//
// Binds a pairwise model to a comparison_cache.  compare() is the
// tie-breaker handed to preference_dag::topo_sort in direct mode;
// raw_compare() bypasses the cache and feeds the win matrix in
// stabilized mode.  Model exceptions propagate unchanged.

#ifndef PREFSORT_COMPARE_PAIRWISE_COMPARATOR_H
#define PREFSORT_COMPARE_PAIRWISE_COMPARATOR_H

#include "comparison_cache.h"
#include "pairwise_model.h"

#include <cstddef>

namespace prefsort::compare {

class pairwise_comparator {
public:
    pairwise_comparator(any_pairwise_model& model, comparison_cache& cache) noexcept
        : model_(&model), cache_(&cache) {}

    /// Signed preference; negative -> a sorts first.  Equal tokens
    /// compare 0 without consulting the model.
    double compare(token const& a, token const& b) {
        if (a == b) return 0.0;
        if (auto hit = cache_->lookup(a, b)) return *hit;

        double const score = raw_compare(a, b).signed_score();
        cache_->insert(a, b, score);
        return score;
    }

    double operator()(token const& a, token const& b) { return compare(a, b); }

    /// One uncached model evaluation.
    raw_scores raw_compare(token const& a, token const& b) {
        ++model_calls_;
        return model_->raw_compare(a, b);
    }

    [[nodiscard]] std::size_t model_calls() const noexcept { return model_calls_; }
    [[nodiscard]] comparison_cache const& cache() const noexcept { return *cache_; }

private:
    any_pairwise_model* model_;
    comparison_cache* cache_;
    std::size_t model_calls_ = 0;
};

} // namespace prefsort::compare

#endif // PREFSORT_COMPARE_PAIRWISE_COMPARATOR_H
