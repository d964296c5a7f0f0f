#pragma once

#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

/** @brief Handle of a scheduled event, used for cancellation. */
using EventId = std::uint64_t;

/**
 * @brief Virtual clock plus time-ordered event queue.
 *
 * One context per run; every component receives it explicitly. Events at the
 * same time execute in the order they were scheduled.
 */
class SimulationContext {
public:
    using Action = std::function<void()>;

    SimulationContext() = default;

    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;

    /** @brief Current simulated time (minutes). */
    double now() const { return now_; }

    /**
     * @brief Run action after delay minutes.
     * @throws std::invalid_argument when delay is negative or not finite.
     */
    EventId scheduleAfter(double delay, Action action);

    /** @brief Run action at an absolute time, which must not lie in the past. */
    EventId scheduleAt(double time, Action action);

    /**
     * @brief Drop a pending event.
     * @return false if the event already ran or was cancelled.
     */
    bool cancel(EventId id);

    /** @brief True while the event is queued and not cancelled. */
    bool isPending(EventId id) const;

    /**
     * @brief Process every event with time <= horizon, then move the clock to horizon.
     *
     * Events scheduled during processing are honoured if they fall within horizon.
     */
    void runUntil(double horizon);

    /**
     * @brief Process the single earliest event.
     * @return false if the queue was empty.
     */
    bool step();

    /** @brief Number of pending (non-cancelled) events. */
    std::size_t pendingCount() const { return pending_.size(); }

    std::uint64_t processedCount() const { return processed_; }

    /** @brief Time of the most recently processed event. */
    double lastEventTime() const { return lastEventTime_; }

private:
    struct Scheduled {
        double time;
        std::uint64_t seq;
        EventId id;
        Action action;
    };

    struct Later {
        bool operator()(const Scheduled& a, const Scheduled& b) const {
            if (a.time != b.time) return a.time > b.time;
            return a.seq > b.seq;
        }
    };

    bool popNext(Scheduled& out);

    std::priority_queue<Scheduled, std::vector<Scheduled>, Later> queue_;
    std::unordered_set<EventId> pending_;
    double now_ = 0.0;
    double lastEventTime_ = 0.0;
    std::uint64_t nextSeq_ = 0;
    EventId nextId_ = 1;
    std::uint64_t processed_ = 0;
};
