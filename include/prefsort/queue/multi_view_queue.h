// queue/multi_view_queue.h - One item set, several priority orders
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// The greedy FAS sort repeatedly needs "the node with the smallest out
// weight", "the node with the smallest in weight" and "the node with the
// best score", while weights change after every removal.  One heap per
// view keeps each query O(log n).
//
// Removal is lazy.  erase(id) only clears the id from the liveness set;
// stale wrappers stay in every heap until that heap surfaces them in a
// later pop or peek, where they are discarded.  Popping through one view
// likewise only marks the item dead for the others.  Deletion is O(1) and
// cleanup is amortised per view.
//
// Views are a closed set fixed at construction: an enum whose underlying
// values are 0..N-1, with a comparator table indexed by it.
//
// Each pushed payload is wrapped once in a queued_item and shared (not
// copied) between the heaps.

#ifndef PREFSORT_QUEUE_MULTI_VIEW_QUEUE_H
#define PREFSORT_QUEUE_MULTI_VIEW_QUEUE_H

#include "priority_queue.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace prefsort {

/// Immutable wrapper shared by every view of a multi_view_queue.
template<typename T>
struct queued_item {
    std::uint64_t id;
    T data;
};

// =============================================================================
// multi_view_queue<T, View, N>
// =============================================================================

/// Priority queue exposing N independent orderings of one live item set.
///
/// Template parameters:
/// - T: payload type
/// - View: enum naming the views; underlying values must be 0..N-1
/// - N: number of views
///
/// Example:
/// ```cpp
/// enum class by { weight, name };
/// multi_view_queue<item, by, 2> q({by_weight_cmp, by_name_cmp});
/// auto h = q.push(item{...});
/// q.erase(h->id);          // invisible to both views
/// auto x = q.pop(by::name);
/// ```
template<typename T, typename View, std::size_t N>
    requires std::is_enum_v<View> && (N > 0)
class multi_view_queue {
public:
    using item_type = queued_item<T>;
    using handle = std::shared_ptr<item_type const>;

    explicit multi_view_queue(std::array<comparator_fn<T>, N> cmps)
        : views_(make_views(std::move(cmps), std::make_index_sequence<N>{})) {}

    /// Number of live items.
    [[nodiscard]] std::size_t size() const noexcept { return live_.size(); }
    [[nodiscard]] bool empty() const noexcept { return live_.empty(); }

    /// Wrap data under a fresh id and push it into every view.
    handle push(T data) {
        handle item = std::make_shared<item_type>(item_type{next_id_++, std::move(data)});
        live_.insert(item->id);
        for (auto& q : views_) {
            q.push(item);
        }
        return item;
    }

    /// Pop the best live item of one view.  The item becomes dead in
    /// every view.  Stale entries met on the way are discarded.
    [[nodiscard]] std::optional<T> pop(View v) {
        auto& q = view(v);
        while (auto top = q.pop()) {
            if (live_.erase((*top)->id) != 0) {
                return (*top)->data;
            }
        }
        return std::nullopt;
    }

    /// Best live item of one view, left in place.  Dead entries at the
    /// top of that view are physically removed.
    [[nodiscard]] std::optional<T> peek(View v) {
        auto& q = view(v);
        while (auto const* top = q.peek()) {
            if (live_.contains((*top)->id)) {
                return (*top)->data;
            }
            (void)q.pop();
        }
        return std::nullopt;
    }

    /// Mark an id dead.  No heap is touched.
    void erase(std::uint64_t id) { live_.erase(id); }

    [[nodiscard]] bool contains(std::uint64_t id) const { return live_.contains(id); }

private:
    struct by_payload {
        comparator_fn<T> cmp;
        double operator()(handle const& a, handle const& b) const {
            return cmp(a->data, b->data);
        }
    };
    using heap_type = priority_queue<handle, by_payload>;

    template<std::size_t... I>
    static std::array<heap_type, N>
    make_views(std::array<comparator_fn<T>, N> cmps, std::index_sequence<I...>) {
        for (auto const& c : cmps) {
            if (!c) throw std::invalid_argument("multi_view_queue: empty comparator");
        }
        return {heap_type(by_payload{std::move(cmps[I])})...};
    }

    heap_type& view(View v) {
        auto const idx = static_cast<std::size_t>(v);
        if (idx >= N) throw std::out_of_range("multi_view_queue: unknown view");
        return views_[idx];
    }

    std::array<heap_type, N> views_;
    std::unordered_set<std::uint64_t> live_;
    std::uint64_t next_id_ = 0;
};

} // namespace prefsort

#endif // PREFSORT_QUEUE_MULTI_VIEW_QUEUE_H
