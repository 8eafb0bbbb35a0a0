// queue/priority_queue.h - Binary min-heap driven by a three-way comparator
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// std::priority_queue takes a strict-weak "less" predicate.  The ordering
// sources here (a learned pairwise model, rank indices, weight deltas)
// naturally produce a signed score, so the heap takes a three-way
// comparator: negative -> first argument pops first, positive -> second,
// zero (or NaN) -> either.
//
// The comparator may be expensive (a model evaluation).  Each sift step
// calls it exactly once per level and no more, and the heap never calls it
// while inside a peek.  There is no internal locking: one instance belongs
// to one caller for the length of a push or pop.

#ifndef PREFSORT_QUEUE_PRIORITY_QUEUE_H
#define PREFSORT_QUEUE_PRIORITY_QUEUE_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace prefsort {

/// A callable returning a signed score for (a, b).
template<typename C, typename T>
concept three_way_comparator = requires(C& c, T const& a, T const& b) {
    { c(a, b) } -> std::convertible_to<double>;
};

/// Type-erased three-way comparator.
template<typename T>
using comparator_fn = std::function<double(T const&, T const&)>;

// =============================================================================
// priority_queue<T, Compare>
// =============================================================================

/// Array-backed binary min-heap under a three-way comparator.
///
/// Elements that compare equal come out in unspecified relative order.
///
/// Example:
/// ```cpp
/// priority_queue<int> pq([](int a, int b) { return a - b; });
/// pq.push(5); pq.push(1); pq.push(3);
/// pq.pop();   // 1
/// pq.peek();  // 3
/// ```
template<typename T, typename Compare = comparator_fn<T>>
    requires three_way_comparator<Compare, T>
class priority_queue {
public:
    explicit priority_queue(Compare cmp) : cmp_(std::move(cmp)) {}

    [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }
    [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }

    void push(T item) {
        heap_.push_back(std::move(item));
        sift_up(heap_.size() - 1);
    }

    /// Remove and return the minimum; std::nullopt when empty.
    [[nodiscard]] std::optional<T> pop() {
        if (heap_.empty()) return std::nullopt;

        T top = std::move(heap_.front());
        T last = std::move(heap_.back());
        heap_.pop_back();
        if (!heap_.empty()) {
            heap_.front() = std::move(last);
            sift_down(0);
        }
        return top;
    }

    /// The minimum without removing it; nullptr when empty.
    /// Invalidated by the next push or pop.
    [[nodiscard]] T const* peek() const noexcept {
        return heap_.empty() ? nullptr : &heap_.front();
    }

private:
    [[nodiscard]] bool before(std::size_t a, std::size_t b) {
        return static_cast<double>(cmp_(heap_[a], heap_[b])) < 0.0;
    }

    void sift_up(std::size_t idx) {
        while (idx > 0) {
            std::size_t const parent = (idx - 1) / 2;
            if (!before(idx, parent)) break;
            std::swap(heap_[idx], heap_[parent]);
            idx = parent;
        }
    }

    void sift_down(std::size_t idx) {
        std::size_t const n = heap_.size();
        while (true) {
            std::size_t const left = 2 * idx + 1;
            std::size_t const right = left + 1;
            std::size_t min = idx;

            if (left < n && before(left, min)) min = left;
            if (right < n && before(right, min)) min = right;

            if (min == idx) break;
            std::swap(heap_[idx], heap_[min]);
            idx = min;
        }
    }

    Compare cmp_;
    std::vector<T> heap_;
};

} // namespace prefsort

#endif // PREFSORT_QUEUE_PRIORITY_QUEUE_H
