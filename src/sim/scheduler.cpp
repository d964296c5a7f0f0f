#include "sim/scheduler.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

EventId SimulationContext::scheduleAfter(double delay, Action action) {
    if (!std::isfinite(delay) || delay < 0.0) {
        throw std::invalid_argument("scheduleAfter: delay must be finite and >= 0, got " +
                                    std::to_string(delay));
    }
    EventId id = nextId_++;
    queue_.push(Scheduled{now_ + delay, nextSeq_++, id, std::move(action)});
    pending_.insert(id);
    return id;
}

EventId SimulationContext::scheduleAt(double time, Action action) {
    return scheduleAfter(time - now_, std::move(action));
}

bool SimulationContext::cancel(EventId id) {
    return pending_.erase(id) > 0;
}

bool SimulationContext::isPending(EventId id) const {
    return pending_.count(id) > 0;
}

bool SimulationContext::popNext(Scheduled& out) {
    // Cancelled entries stay in the heap until they surface here.
    while (!queue_.empty()) {
        Scheduled top = queue_.top();
        queue_.pop();
        if (pending_.erase(top.id) == 0) {
            continue;
        }
        out = std::move(top);
        return true;
    }
    return false;
}

bool SimulationContext::step() {
    Scheduled ev;
    if (!popNext(ev)) {
        return false;
    }
    now_ = ev.time;
    lastEventTime_ = ev.time;
    ++processed_;
    ev.action();
    return true;
}

void SimulationContext::runUntil(double horizon) {
    if (horizon < now_) {
        throw std::invalid_argument("runUntil: horizon lies in the past");
    }
    while (!queue_.empty()) {
        const Scheduled& top = queue_.top();
        if (pending_.count(top.id) == 0) {
            queue_.pop();
            continue;
        }
        if (top.time > horizon) {
            break;
        }
        step();
    }
    now_ = horizon;
}
