// rank/bradley_terry.h - Bradley-Terry strengths from pairwise win counts
// Part of the preference-sort library (C++20)
//
// ALGORITHM: minorise-maximise fixed point (Zermelo / Hunter 2004).
//   p_i <- sum_j w_ij p_j / (p_i + p_j)  /  sum_j w_ji / (p_i + p_j)
// Updates are applied in place in index order, so item i already sees the
// new values of items 0..i-1 within the same pass (Gauss-Seidel style).
// After each pass all strengths are divided by their geometric mean.
// Iteration stops when that mean changes by less than `tolerance`
// between passes, or after `max_iter` passes.
//
// Degenerate input is not an error.  An item whose numerator and
// denominator are both zero gets NaN, and NaN spreads through the
// normalisation.  Callers must treat NaN strengths as "no preference".

#ifndef PREFSORT_RANK_BRADLEY_TERRY_H
#define PREFSORT_RANK_BRADLEY_TERRY_H

#include <prefsort/core/limits.h>

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace prefsort::rank {

/// w[i][j]: observed preference of item i over item j.  Diagonal unused.
using win_matrix = std::vector<std::vector<double>>;

/// Strengths (higher = preferred earlier) plus the passes performed.
struct bradley_terry_result {
    std::vector<double> strength;
    std::size_t iterations = 0;
};

/// Fit Bradley-Terry strengths to a square win matrix.
///
/// Throws std::invalid_argument if w is not square.
///
/// Example:
/// ```cpp
/// win_matrix w = {{0, 100}, {1, 0}};
/// auto r = bradley_terry(w);   // strength ~ {10, 0.1}
/// ```
[[nodiscard]] inline bradley_terry_result
bradley_terry(win_matrix const& w,
              std::size_t max_iter = limits::bradley_terry_max_iter,
              double tolerance = limits::bradley_terry_tolerance)
{
    auto const n = w.size();
    for (auto const& row : w) {
        if (row.size() != n)
            throw std::invalid_argument("bradley_terry: win matrix must be square");
    }

    bradley_terry_result result;
    result.strength.assign(n, 1.0);
    if (n == 0) return result;

    auto& p = result.strength;
    double last_norm = 0.0;
    for (std::size_t iter = 0; iter < max_iter; ++iter) {
        double log_sum = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            double num = 0.0;
            double den = 0.0;
            for (std::size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                double const sum = p[i] + p[j];
                num += w[i][j] * p[j] / sum;
                den += w[j][i] / sum;
            }
            p[i] = num / den;
            log_sum += std::log(p[i]);
        }
        ++result.iterations;

        double const norm = std::exp(log_sum / static_cast<double>(n));
        for (auto& x : p) x /= norm;

        if (std::abs(last_norm - norm) < tolerance) break;
        last_norm = norm;
    }
    return result;
}

} // namespace prefsort::rank

#endif // PREFSORT_RANK_BRADLEY_TERRY_H
