#include "sim/joint_acquirer.hpp"

#include <stdexcept>

JointAcquirer::JointAcquirer(SimulationContext& ctx, std::vector<ResourcePool*> pools)
    : ctx_(ctx), pools_(std::move(pools)) {
    if (pools_.empty()) {
        throw std::invalid_argument("JointAcquirer needs at least one pool");
    }
    for (ResourcePool* pool : pools_) {
        if (!pool) {
            throw std::invalid_argument("JointAcquirer pool is null");
        }
        pool->addReleaseListener([this]() { tryDispatch(); });
    }
}

int JointAcquirer::waitingCount(int rank) const {
    int count = 0;
    for (const auto& entry : waiting_) {
        if (entry.first.first == rank) ++count;
    }
    return count;
}

bool JointAcquirer::allAvailable() const {
    for (const ResourcePool* pool : pools_) {
        if (!pool->available()) return false;
    }
    return true;
}

JointTicket JointAcquirer::request(int rank, Grant onGranted) {
    JointTicket id = nextTicket_++;
    Request req{State::Waiting, {rank, nextSeq_++}, std::move(onGranted), {}, 0};
    waiting_.emplace(req.key, id);
    requests_.emplace(id, std::move(req));
    tryDispatch();
    return id;
}

void JointAcquirer::tryDispatch() {
    while (!waiting_.empty() && allAvailable()) {
        auto head = waiting_.begin();
        JointTicket id = head->second;
        waiting_.erase(head);
        Request& req = requests_.at(id);
        req.units.clear();
        for (ResourcePool* pool : pools_) {
            // allAvailable() held above and tryTake() fires no listeners.
            req.units.push_back(pool->tryTake());
        }
        req.state = State::Granted;
        req.resumeEvent = ctx_.scheduleAfter(0.0, [this, id]() { resume(id); });
    }
}

void JointAcquirer::resume(JointTicket id) {
    auto it = requests_.find(id);
    if (it == requests_.end() || it->second.state != State::Granted) {
        return;
    }
    it->second.state = State::Owned;
    Grant cb = std::move(it->second.onGranted);
    it->second.onGranted = nullptr;
    if (cb) {
        cb();
    }
}

void JointAcquirer::returnUnits(Request& req) {
    std::vector<TicketId> units = std::move(req.units);
    req.units.clear();
    for (size_t i = 0; i < units.size(); ++i) {
        pools_[i]->release(units[i]);
    }
}

void JointAcquirer::release(JointTicket ticket) {
    auto it = requests_.find(ticket);
    if (it == requests_.end() || it->second.state == State::Waiting) {
        throw std::logic_error("JointAcquirer release of a ticket that holds nothing");
    }
    if (it->second.state == State::Granted) {
        ctx_.cancel(it->second.resumeEvent);
    }
    Request req = std::move(it->second);
    requests_.erase(it);
    returnUnits(req);
}

bool JointAcquirer::withdraw(JointTicket ticket) {
    auto it = requests_.find(ticket);
    if (it == requests_.end()) {
        return false;
    }
    switch (it->second.state) {
        case State::Waiting:
            waiting_.erase(it->second.key);
            requests_.erase(it);
            return true;
        case State::Granted: {
            ctx_.cancel(it->second.resumeEvent);
            Request req = std::move(it->second);
            requests_.erase(it);
            returnUnits(req);
            return true;
        }
        case State::Owned:
            return false;
    }
    return false;
}

bool JointAcquirer::holds(JointTicket ticket) const {
    auto it = requests_.find(ticket);
    return it != requests_.end() && it->second.state != State::Waiting;
}
