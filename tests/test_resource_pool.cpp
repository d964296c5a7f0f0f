/**
 * @file test_resource_pool.cpp
 * @brief Test: pool capacity invariant, FIFO hand-over, withdraw and utilization.
 */

#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

#include "sim/resource_pool.hpp"
#include "sim/scheduler.hpp"
#include "util/random.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

static void testCapacityValidation() {
    SimulationContext ctx;
    bool threw = false;
    try {
        ResourcePool pool(ctx, "doctor", 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "capacity 0 rejected");
}

static void testFifoHandOver() {
    SimulationContext ctx;
    ResourcePool pool(ctx, "nurse", 2);
    std::vector<int> granted;
    TicketId a = pool.acquire([&]() { granted.push_back(1); });
    TicketId b = pool.acquire([&]() { granted.push_back(2); });
    TicketId c = pool.acquire([&]() { granted.push_back(3); });
    TicketId d = pool.acquire([&]() { granted.push_back(4); });
    check(pool.held() == 2, "two units held at once");
    check(pool.queueLength() == 2, "two requests queued");
    check(granted.empty(), "grant callbacks deferred to the scheduler");
    ctx.runUntil(0.0);
    check(granted == std::vector<int>({1, 2}), "first two granted in order");

    ctx.scheduleAfter(1.0, [&]() { pool.release(b); });
    ctx.scheduleAfter(2.0, [&]() { pool.release(a); });
    ctx.runUntil(3.0);
    check(granted == std::vector<int>({1, 2, 3, 4}), "queued requests served FIFO");
    check(pool.held() == 2, "hand-over keeps units held");
    check(pool.queueLength() == 0, "queue empty");
    check(pool.holds(c) && pool.holds(d), "late requests hold units");

    pool.release(c);
    pool.release(d);
    check(pool.held() == 0, "all units returned");

    bool threw = false;
    try {
        pool.release(c);
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "double release rejected");
}

static void testWithdraw() {
    SimulationContext ctx;
    ResourcePool pool(ctx, "bed", 1);
    bool firstRan = false;
    bool secondRan = false;
    bool thirdRan = false;
    TicketId first = pool.acquire([&]() { firstRan = true; });
    TicketId second = pool.acquire([&]() { secondRan = true; });
    TicketId third = pool.acquire([&]() { thirdRan = true; });
    ctx.runUntil(0.0);
    check(firstRan, "first request granted");

    check(pool.withdraw(second), "queued request withdrawn");
    check(pool.queueLength() == 1, "queue shrinks after withdraw");
    check(!pool.withdraw(first), "owned unit cannot be withdrawn");

    // Release hands the unit to the third request, which leaves before resuming.
    pool.release(first);
    check(pool.held() == 1, "unit handed to the next in line");
    check(pool.withdraw(third), "granted but not resumed request withdrawn");
    check(pool.held() == 0, "withdrawn grant returns its unit");
    ctx.runUntil(1.0);
    check(!secondRan && !thirdRan, "withdrawn callbacks never run");
    check(!pool.withdraw(12345), "unknown ticket");
}

static void testTryTake() {
    SimulationContext ctx;
    ResourcePool pool(ctx, "cubicle", 1);
    TicketId t = pool.tryTake();
    check(t != 0, "tryTake succeeds on a free pool");
    check(pool.tryTake() == 0, "tryTake fails on a full pool");
    pool.release(t);
    check(pool.available(), "pool free again");
}

static void testUtilization() {
    SimulationContext ctx;
    ResourcePool pool(ctx, "doctor", 2);
    TicketId t = pool.acquire([]() {});
    ctx.scheduleAfter(5.0, [&]() { pool.release(t); });
    ctx.runUntil(10.0);
    // One of two units busy for half the time.
    check(std::fabs(pool.averageUtilization() - 0.25) < 1e-9, "time-averaged utilization");
    check(pool.peakHeld() == 1, "peak held");
    check(pool.utilization() == 0.0, "instantaneous utilization");
}

static void testInvariantUnderChurn() {
    SimulationContext ctx;
    ResourcePool pool(ctx, "doctor", 3);
    RandomGenerator rng(99);
    bool withinBounds = true;
    int completed = 0;
    for (int i = 0; i < 100; ++i) {
        double arrival = rng.uniformReal(0.0, 200.0);
        ctx.scheduleAfter(arrival, [&]() {
            auto ticket = std::make_shared<TicketId>(0);
            *ticket = pool.acquire([&, ticket]() {
                if (pool.held() < 0 || pool.held() > pool.capacity()) withinBounds = false;
                ctx.scheduleAfter(rng.uniformReal(1.0, 15.0), [&, ticket]() {
                    int before = pool.held();
                    pool.release(*ticket);
                    if (pool.held() != before && pool.held() != before - 1) withinBounds = false;
                    ++completed;
                });
            });
            if (pool.held() > pool.capacity()) withinBounds = false;
        });
    }
    ctx.runUntil(10000.0);
    check(withinBounds, "0 <= held <= capacity throughout");
    check(completed == 100, "every request eventually served");
    check(pool.held() == 0 && pool.queueLength() == 0, "pool drained");
}

int main() {
    printf("[test_resource_pool] START\n");
    testCapacityValidation();
    testFifoHandOver();
    testWithdraw();
    testTryTake();
    testUtilization();
    testInvariantUnderChurn();
    if (failures > 0) {
        printf("[test_resource_pool] FAIL\n");
        return 1;
    }
    printf("[test_resource_pool] PASS\n");
    return 0;
}
