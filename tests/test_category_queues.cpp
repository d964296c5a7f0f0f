/**
 * @file test_category_queues.cpp
 * @brief Test: per-category consultation queues (push, duplicate guard, removal, lengths).
 */

#include <cstdio>
#include <stdexcept>

#include "roles/category_queues.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

static void testPushAndLengths() {
    CategoryQueues q;
    check(q.empty() && q.total() == 0, "starts empty");
    q.push(TriageCategory::Yellow, 1);
    q.push(TriageCategory::Red, 2);
    q.push(TriageCategory::Yellow, 3);

    check(q.total() == 3 && !q.empty(), "three queued");
    check(q.size(TriageCategory::Yellow) == 2, "two YELLOW");
    check(q.size(TriageCategory::Red) == 1, "one RED");
    check(q.size(TriageCategory::Blue) == 0, "no BLUE");
    CategoryTable<int> lengths = q.lengths();
    check(lengths[0] == 1 && lengths[1] == 0 && lengths[2] == 2 && lengths[3] == 0 && lengths[4] == 0,
          "lengths by category");
    check(q.contains(3) && !q.contains(4), "membership");
}

static void testDuplicatePush() {
    CategoryQueues q;
    q.push(TriageCategory::Green, 7);
    bool threw = false;
    try {
        q.push(TriageCategory::Red, 7);
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "patient queued twice rejected");
    check(q.total() == 1 && q.size(TriageCategory::Red) == 0, "rejected push left queues unchanged");
}

static void testRemove() {
    CategoryQueues q;
    q.push(TriageCategory::Orange, 1);
    q.push(TriageCategory::Orange, 2);
    q.push(TriageCategory::Blue, 3);

    check(q.remove(2), "queued patient removed");
    check(!q.contains(2) && q.size(TriageCategory::Orange) == 1, "removed from its category");
    check(!q.remove(2), "second removal reports absence");
    check(!q.remove(42), "unknown patient reports absence");

    // A removed patient may be queued again, e.g. under a new category.
    q.push(TriageCategory::Red, 2);
    check(q.size(TriageCategory::Red) == 1 && q.total() == 3, "requeued after removal");

    check(q.remove(1) && q.remove(2) && q.remove(3), "drain");
    check(q.empty(), "empty after draining");
}

int main() {
    printf("[test_category_queues] START\n");
    testPushAndLengths();
    testDuplicatePush();
    testRemove();
    if (failures > 0) {
        printf("[test_category_queues] FAIL\n");
        return 1;
    }
    printf("[test_category_queues] PASS\n");
    return 0;
}
