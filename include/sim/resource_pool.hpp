#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sim/scheduler.hpp"

/** @brief Handle of one unit request; 0 is never issued. */
using TicketId = std::uint64_t;

/**
 * @brief Capacity-limited resource with a FIFO wait queue.
 *
 * acquire() never fails: if no unit is free the request waits. A granted
 * unit is counted as held immediately and the requester's callback runs in
 * a zero-delay event, so grants never re-enter the caller's stack.
 */
class ResourcePool {
public:
    using Grant = std::function<void()>;
    using ReleaseListener = std::function<void()>;

    /**
     * @brief Create a pool.
     * @throws std::invalid_argument when capacity <= 0.
     */
    ResourcePool(SimulationContext& ctx, std::string name, int capacity);

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    const std::string& name() const { return name_; }
    int capacity() const { return capacity_; }
    int held() const { return held_; }
    int queueLength() const { return static_cast<int>(queue_.size()); }

    /** @brief True when a unit is free and nobody is queued ahead. */
    bool available() const { return held_ < capacity_ && queue_.empty(); }

    /** @brief Instantaneous held / capacity. */
    double utilization() const;

    /** @brief Time-averaged utilization since construction up to now. */
    double averageUtilization() const;

    /** @brief Highest held count observed. */
    int peakHeld() const { return peakHeld_; }

    /**
     * @brief Request one unit; onGranted runs once the unit is held.
     * @return ticket used for release() or withdraw().
     */
    TicketId acquire(Grant onGranted);

    /**
     * @brief Take a unit synchronously if available().
     * @return ticket of the held unit, or 0 when none is free.
     */
    TicketId tryTake();

    /**
     * @brief Return the unit held by ticket. The next queued request, if
     * any, receives it in the same time step.
     * @throws std::logic_error if the ticket does not hold a unit.
     */
    void release(TicketId ticket);

    /**
     * @brief Cancel a request whose owner no longer wants it.
     *
     * A queued request is removed. A granted request whose callback has not
     * run yet gives its unit back and the callback is dropped.
     * @return false if the callback already ran (the caller owns the unit
     *         and must release it) or the ticket is unknown.
     */
    bool withdraw(TicketId ticket);

    /** @brief True if the ticket currently holds a unit. */
    bool holds(TicketId ticket) const;

    /**
     * @brief Called whenever a unit becomes free with no queued request to
     * take it. Used by JointAcquirer to retry compound requests.
     */
    void addReleaseListener(ReleaseListener listener);

private:
    enum class TicketState { Queued, Granted, Owned };

    struct Ticket {
        TicketState state;
        Grant onGranted;
        EventId resumeEvent;
    };

    void changeHeld(int delta);
    void grant(TicketId id);
    void resume(TicketId id);
    void dispatch();

    SimulationContext& ctx_;
    std::string name_;
    int capacity_;
    int held_ = 0;
    int peakHeld_ = 0;
    std::deque<TicketId> queue_;
    std::unordered_map<TicketId, Ticket> tickets_;
    std::vector<ReleaseListener> listeners_;
    TicketId nextTicket_ = 1;
    double createdAt_;
    double lastChange_;
    double busyArea_ = 0.0;
};
