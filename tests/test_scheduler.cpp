/**
 * @file test_scheduler.cpp
 * @brief Test: virtual clock ordering, ties, cancellation and horizon handling.
 */

#include <cstdio>
#include <stdexcept>
#include <vector>

#include "sim/scheduler.hpp"
#include "util/random.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

static void testTimeOrder() {
    SimulationContext ctx;
    std::vector<int> order;
    ctx.scheduleAfter(5.0, [&]() { order.push_back(5); });
    ctx.scheduleAfter(1.0, [&]() { order.push_back(1); });
    ctx.scheduleAfter(3.0, [&]() { order.push_back(3); });
    ctx.runUntil(10.0);
    check(order == std::vector<int>({1, 3, 5}), "events run in time order");
    check(ctx.now() == 10.0, "clock moves to horizon");
    check(ctx.lastEventTime() == 5.0, "last event time is 5");
    check(ctx.processedCount() == 3, "three events processed");
}

static void testTiesKeepScheduleOrder() {
    SimulationContext ctx;
    std::vector<char> order;
    ctx.scheduleAfter(2.0, [&]() { order.push_back('a'); });
    ctx.scheduleAfter(2.0, [&]() { order.push_back('b'); });
    ctx.scheduleAfter(2.0, [&]() { order.push_back('c'); });
    ctx.runUntil(2.0);
    check(order == std::vector<char>({'a', 'b', 'c'}), "same-time events run FIFO");
}

static void testCancel() {
    SimulationContext ctx;
    bool ran = false;
    EventId id = ctx.scheduleAfter(1.0, [&]() { ran = true; });
    check(ctx.isPending(id), "event pending after schedule");
    check(ctx.cancel(id), "first cancel succeeds");
    check(!ctx.cancel(id), "second cancel fails");
    check(ctx.pendingCount() == 0, "no pending events after cancel");
    ctx.runUntil(5.0);
    check(!ran, "cancelled event never runs");
}

static void testHorizon() {
    SimulationContext ctx;
    bool ran = false;
    ctx.scheduleAfter(10.0, [&]() { ran = true; });
    ctx.runUntil(5.0);
    check(!ran, "event beyond horizon not run");
    check(ctx.now() == 5.0, "clock at horizon");
    check(ctx.pendingCount() == 1, "event still pending");
    ctx.runUntil(20.0);
    check(ran, "event runs once horizon covers it");

    bool threw = false;
    try {
        ctx.runUntil(1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "horizon in the past rejected");
}

static void testNestedScheduling() {
    SimulationContext ctx;
    std::vector<double> times;
    ctx.scheduleAfter(1.0, [&]() {
        times.push_back(ctx.now());
        ctx.scheduleAfter(1.0, [&]() { times.push_back(ctx.now()); });
        ctx.scheduleAfter(0.0, [&]() { times.push_back(ctx.now()); });
    });
    ctx.runUntil(5.0);
    check(times == std::vector<double>({1.0, 1.0, 2.0}), "events scheduled while running are honoured");
}

static void testInvalidDelay() {
    SimulationContext ctx;
    bool threw = false;
    try {
        ctx.scheduleAfter(-1.0, []() {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "negative delay rejected");
}

static void testMonotonicClock() {
    SimulationContext ctx;
    RandomGenerator rng(7);
    std::vector<double> seen;
    for (int i = 0; i < 200; ++i) {
        double delay = rng.uniformReal(0.0, 100.0);
        ctx.scheduleAfter(delay, [&]() {
            seen.push_back(ctx.now());
            if (seen.size() < 400) {
                double more = rng.uniformReal(0.0, 10.0);
                ctx.scheduleAfter(more, [&]() { seen.push_back(ctx.now()); });
            }
        });
    }
    ctx.runUntil(1000.0);
    bool monotonic = true;
    for (size_t i = 1; i < seen.size(); ++i) {
        if (seen[i] < seen[i - 1]) monotonic = false;
    }
    check(seen.size() == 400, "all events processed");
    check(monotonic, "processed event times never decrease");
}

int main() {
    printf("[test_scheduler] START\n");
    testTimeOrder();
    testTiesKeepScheduleOrder();
    testCancel();
    testHorizon();
    testNestedScheduling();
    testInvalidDelay();
    testMonotonicClock();
    if (failures > 0) {
        printf("[test_scheduler] FAIL\n");
        return 1;
    }
    printf("[test_scheduler] PASS\n");
    return 0;
}
