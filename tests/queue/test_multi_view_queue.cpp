// tests/queue/test_multi_view_queue.cpp
// Tests for queue/multi_view_queue.h (views, lazy deletion, liveness)

#include <prefsort/queue/multi_view_queue.h>
#include <gtest/gtest.h>

#include <array>
#include <stdexcept>
#include <string>

using namespace prefsort;

namespace {

struct item {
    int id;
    int p1;
    std::string p2;
};

enum class by { p1 = 0, p2 = 1 };

using queue_t = multi_view_queue<item, by, 2>;

std::array<comparator_fn<item>, 2> comparators() {
    return {
        [](item const& a, item const& b) { return static_cast<double>(a.p1 - b.p1); },
        [](item const& a, item const& b) { return static_cast<double>(a.p2.compare(b.p2)); },
    };
}

item const item1{1, 10, "apple"};
item const item2{2, 5, "banana"};
item const item3{3, 10, "cherry"};
item const item4{4, 1, "banana"};

} // namespace

// =====================================================================
// Views
// =====================================================================

TEST(MultiViewQueue, EachViewHasItsOwnOrder) {
    queue_t q(comparators());
    for (auto const& i : {item1, item2, item3, item4}) (void)q.push(i);

    EXPECT_EQ(q.pop(by::p1)->id, 4);
    EXPECT_EQ(q.pop(by::p1)->id, 2);
    auto const a = q.pop(by::p1)->id;
    auto const b = q.pop(by::p1)->id;
    EXPECT_TRUE((a == 1 && b == 3) || (a == 3 && b == 1));
    EXPECT_FALSE(q.pop(by::p1).has_value());

    queue_t q2(comparators());
    for (auto const& i : {item1, item2, item3, item4}) (void)q2.push(i);
    EXPECT_EQ(q2.pop(by::p2)->id, 1);
    auto const c = q2.pop(by::p2)->id;
    auto const d = q2.pop(by::p2)->id;
    EXPECT_TRUE((c == 2 && d == 4) || (c == 4 && d == 2));
    EXPECT_EQ(q2.pop(by::p2)->id, 3);
    EXPECT_FALSE(q2.pop(by::p2).has_value());
}

TEST(MultiViewQueue, PeekDoesNotRemove) {
    queue_t q(comparators());
    for (auto const& i : {item1, item2, item3, item4}) (void)q.push(i);

    EXPECT_EQ(q.peek(by::p1)->id, 4);
    EXPECT_EQ(q.size(), 4u);
    EXPECT_EQ(q.peek(by::p2)->id, 1);
    EXPECT_EQ(q.size(), 4u);

    (void)q.pop(by::p1);
    EXPECT_EQ(q.peek(by::p1)->id, 2);
    EXPECT_EQ(q.peek(by::p2)->id, 1);
}

// =====================================================================
// Liveness
// =====================================================================

TEST(MultiViewQueue, SizeCountsLiveItems) {
    queue_t q(comparators());
    EXPECT_EQ(q.size(), 0u);
    (void)q.push(item1);
    EXPECT_EQ(q.size(), 1u);
    (void)q.push(item2);
    EXPECT_EQ(q.size(), 2u);
    (void)q.pop(by::p1);
    EXPECT_EQ(q.size(), 1u);
    (void)q.pop(by::p2);
    EXPECT_EQ(q.size(), 0u);
    EXPECT_TRUE(q.empty());
}

TEST(MultiViewQueue, PopInOneViewHidesItemInOthers) {
    queue_t q(comparators());
    for (auto const& i : {item1, item2, item3, item4}) (void)q.push(i);
    for (int k = 0; k < 4; ++k) (void)q.pop(by::p1);

    EXPECT_FALSE(q.pop(by::p1).has_value());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_FALSE(q.peek(by::p2).has_value());
    EXPECT_FALSE(q.pop(by::p2).has_value());
}

TEST(MultiViewQueue, EraseHidesItemFromEveryView) {
    queue_t q(comparators());
    (void)q.push(item1);
    auto h2 = q.push(item2);
    (void)q.push(item3);
    (void)q.push(item4);

    q.erase(h2->id);
    EXPECT_FALSE(q.contains(h2->id));
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.peek(by::p1)->id, 4);
    EXPECT_EQ(q.peek(by::p2)->id, 1);

    EXPECT_EQ(q.pop(by::p1)->id, 4);
    EXPECT_EQ(q.peek(by::p2)->id, 1);
    EXPECT_EQ(q.peek(by::p1)->p1, 10);
}

TEST(MultiViewQueue, MixedOperations) {
    queue_t q(comparators());
    (void)q.push(item1);
    auto h2 = q.push(item2);
    (void)q.push(item3);
    (void)q.push(item4);

    EXPECT_EQ(q.pop(by::p1)->id, 4);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.peek(by::p1)->id, 2);
    EXPECT_EQ(q.peek(by::p2)->id, 1);

    EXPECT_EQ(q.pop(by::p2)->id, 1);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.peek(by::p1)->id, 2);
    EXPECT_EQ(q.peek(by::p2)->id, 2);

    q.erase(h2->id);
    EXPECT_EQ(q.size(), 1u);
    EXPECT_EQ(q.peek(by::p1)->id, 3);
    EXPECT_EQ(q.peek(by::p2)->id, 3);
    EXPECT_EQ(q.pop(by::p1)->id, 3);
    EXPECT_TRUE(q.empty());
}

TEST(MultiViewQueue, EraseUnknownIdIsHarmless) {
    queue_t q(comparators());
    (void)q.push(item1);
    q.erase(999);
    EXPECT_EQ(q.size(), 1u);
}

TEST(MultiViewQueue, HandlesHaveDistinctIds) {
    queue_t q(comparators());
    auto a = q.push(item1);
    auto b = q.push(item1);
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(q.size(), 2u);
}

// =====================================================================
// Errors
// =====================================================================

TEST(MultiViewQueue, EmptyComparatorRejected) {
    std::array<comparator_fn<item>, 2> cmps{comparators()[0], comparator_fn<item>{}};
    EXPECT_THROW(queue_t{cmps}, std::invalid_argument);
}

TEST(MultiViewQueue, UnknownViewRejected) {
    queue_t q(comparators());
    (void)q.push(item1);
    EXPECT_THROW((void)q.pop(static_cast<by>(7)), std::out_of_range);
    EXPECT_THROW((void)q.peek(static_cast<by>(2)), std::out_of_range);
}
