#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sim/resource_pool.hpp"
#include "sim/scheduler.hpp"

using JointTicket = std::uint64_t;

/**
 * @brief Atomic acquisition of one unit from each of several pools.
 *
 * A request is granted only when every pool can hand over a unit at the
 * same instant; nobody ever holds a partial set. Waiting requests are served
 * by ascending rank, FIFO among equal ranks.
 */
class JointAcquirer {
public:
    using Grant = std::function<void()>;

    /**
     * @throws std::invalid_argument when pools is empty or holds a nullptr.
     */
    JointAcquirer(SimulationContext& ctx, std::vector<ResourcePool*> pools);

    JointAcquirer(const JointAcquirer&) = delete;
    JointAcquirer& operator=(const JointAcquirer&) = delete;

    /**
     * @brief Request one unit of every pool.
     * @param rank lower ranks are served first (triage priority 1..5).
     * @param onGranted runs in a zero-delay event once all units are held.
     */
    JointTicket request(int rank, Grant onGranted);

    /**
     * @brief Return all units held by the ticket.
     * @throws std::logic_error if the ticket holds nothing.
     */
    void release(JointTicket ticket);

    /**
     * @brief Cancel a request not yet resumed (queued or granted-pending).
     * @return false if the grant callback already ran or the ticket is unknown.
     */
    bool withdraw(JointTicket ticket);

    int waitingCount() const { return static_cast<int>(waiting_.size()); }

    /** @brief Waiting requests of one rank. */
    int waitingCount(int rank) const;

    bool holds(JointTicket ticket) const;

    const std::vector<ResourcePool*>& pools() const { return pools_; }

private:
    enum class State { Waiting, Granted, Owned };

    struct Request {
        State state;
        std::pair<int, std::uint64_t> key;   // (rank, seq)
        Grant onGranted;
        std::vector<TicketId> units;         // parallel to pools_
        EventId resumeEvent;
    };

    bool allAvailable() const;
    void tryDispatch();
    void resume(JointTicket id);
    void returnUnits(Request& req);

    SimulationContext& ctx_;
    std::vector<ResourcePool*> pools_;
    std::map<std::pair<int, std::uint64_t>, JointTicket> waiting_;
    std::unordered_map<JointTicket, Request> requests_;
    JointTicket nextTicket_ = 1;
    std::uint64_t nextSeq_ = 0;
};
