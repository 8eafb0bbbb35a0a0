// compare/comparison_cache.h - Memo of signed pairwise preferences
// Part of the preference-sort library (C++20)
//
// Keyed by the unordered token pair.  The score is stored for the
// lexicographically ordered orientation (lo, hi) and negated when the
// pair is looked up the other way round, so compare(a, b) and
// compare(b, a) share one entry and are always exact negatives.
//
// The cache is an explicit object.  The caller decides whether it lives
// for one sort or is shared across many; nothing is process-wide.
// Not thread-safe.

#ifndef PREFSORT_COMPARE_COMPARISON_CACHE_H
#define PREFSORT_COMPARE_COMPARISON_CACHE_H

#include <prefsort/core/token.h>

#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace prefsort::compare {

class comparison_cache {
public:
    /// Signed score for (a, b), if cached.  Counts a hit or a miss.
    [[nodiscard]] std::optional<double> lookup(token const& a, token const& b) const {
        bool const flipped = b < a;
        auto it = store_.find(flipped ? key_type{b, a} : key_type{a, b});
        if (it != store_.end()) {
            ++hit_count_;
            return flipped ? -it->second : it->second;
        }
        ++miss_count_;
        return std::nullopt;
    }

    /// Record the signed score for (a, b); replaces any previous entry.
    void insert(token const& a, token const& b, double score) {
        if (b < a) {
            store_[key_type{b, a}] = -score;
        } else {
            store_[key_type{a, b}] = score;
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return store_.size(); }
    [[nodiscard]] std::size_t hits() const noexcept { return hit_count_; }
    [[nodiscard]] std::size_t misses() const noexcept { return miss_count_; }

    [[nodiscard]] double hit_rate() const noexcept {
        auto total = hit_count_ + miss_count_;
        if (total == 0) return 0.0;
        return static_cast<double>(hit_count_) / static_cast<double>(total);
    }

    void clear() {
        store_.clear();
        hit_count_ = 0;
        miss_count_ = 0;
    }

private:
    using key_type = std::pair<token, token>;

    std::map<key_type, double> store_;

    // Mutable: observational side-channel, not semantic state.
    mutable std::size_t hit_count_ = 0;
    mutable std::size_t miss_count_ = 0;
};

} // namespace prefsort::compare

#endif // PREFSORT_COMPARE_COMPARISON_CACHE_H
