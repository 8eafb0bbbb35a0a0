// core/limits.h - Default tuning constants
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// Each iterative algorithm has a ceiling and a convergence threshold.
// Defaults live here as inline constexpr values; every algorithm takes
// them as default arguments so callers override per call:
//
//   auto p = bradley_terry(w);                      // 10 iterations
//   auto q = bradley_terry(w, 50);                  // override
//
// No global mutable configuration.  Runtime choices (mode, custom order,
// verbosity) travel in sorter_options.

#ifndef PREFSORT_CORE_LIMITS_H
#define PREFSORT_CORE_LIMITS_H

#include <cstddef>

namespace prefsort::limits {

// =============================================================================
// Rank estimation
// =============================================================================

/// Maximum Bradley-Terry passes.
inline constexpr std::size_t bradley_terry_max_iter = 10;

/// Stop once successive normalisation factors differ by less than this.
inline constexpr double bradley_terry_tolerance = 1e-3;

// =============================================================================
// Pairwise model input
// =============================================================================

/// Fixed input length of the pairwise model.  Longer tokens are truncated.
inline constexpr std::size_t model_sequence_length = 25;

} // namespace prefsort::limits

#endif // PREFSORT_CORE_LIMITS_H
