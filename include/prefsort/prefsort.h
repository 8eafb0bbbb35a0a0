// prefsort.h - Umbrella header for the preference-sort library
// Part of the preference-sort library (C++20)
//
// Single-include convenience header.  Pulls in every component: tokens,
// queues, graphs, rank estimation, pairwise comparison, and the sorter.
//
// Usage:
//   #include <prefsort/prefsort.h>
//
// For compilation-time-sensitive translation units, prefer including
// individual headers.

#ifndef PREFSORT_PREFSORT_H
#define PREFSORT_PREFSORT_H

// --- Core ---
#include "core/limits.h"
#include "core/sort_stats.h"
#include "core/token.h"

// --- Queues ---
#include "queue/priority_queue.h"
#include "queue/multi_view_queue.h"

// --- Graphs ---
#include "graph/graph_concepts.h"
#include "graph/preference_dag.h"
#include "graph/weighted_digraph.h"
#include "graph/fas_sort.h"
#include "graph/graph_io_dot.h"

// --- Rank estimation ---
#include "rank/bradley_terry.h"

// --- Pairwise comparison ---
#include "compare/pairwise_model.h"
#include "compare/comparison_cache.h"
#include "compare/pairwise_comparator.h"

// --- Sorting ---
#include "sorter/sort_mode.h"
#include "sorter/canonical_order.h"
#include "sorter/preference_sorter.h"
#include "sorter/order_extractor.h"

#endif // PREFSORT_PREFSORT_H
