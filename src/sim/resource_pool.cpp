#include "sim/resource_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

ResourcePool::ResourcePool(SimulationContext& ctx, std::string name, int capacity)
    : ctx_(ctx),
      name_(std::move(name)),
      capacity_(capacity),
      createdAt_(ctx.now()),
      lastChange_(ctx.now()) {
    if (capacity_ <= 0) {
        throw std::invalid_argument("pool '" + name_ + "' capacity must be > 0");
    }
}

double ResourcePool::utilization() const {
    return static_cast<double>(held_) / capacity_;
}

double ResourcePool::averageUtilization() const {
    double elapsed = ctx_.now() - createdAt_;
    if (elapsed <= 0.0) {
        return utilization();
    }
    double area = busyArea_ + held_ * (ctx_.now() - lastChange_);
    return area / (capacity_ * elapsed);
}

void ResourcePool::changeHeld(int delta) {
    double now = ctx_.now();
    busyArea_ += held_ * (now - lastChange_);
    lastChange_ = now;
    held_ += delta;
    if (held_ < 0 || held_ > capacity_) {
        throw std::logic_error("pool '" + name_ + "' held count out of range");
    }
    peakHeld_ = std::max(peakHeld_, held_);
}

TicketId ResourcePool::acquire(Grant onGranted) {
    TicketId id = nextTicket_++;
    tickets_[id] = Ticket{TicketState::Queued, std::move(onGranted), 0};
    if (available()) {
        grant(id);
    } else {
        queue_.push_back(id);
    }
    return id;
}

TicketId ResourcePool::tryTake() {
    if (!available()) {
        return 0;
    }
    TicketId id = nextTicket_++;
    tickets_[id] = Ticket{TicketState::Owned, nullptr, 0};
    changeHeld(+1);
    return id;
}

void ResourcePool::grant(TicketId id) {
    Ticket& t = tickets_.at(id);
    changeHeld(+1);
    t.state = TicketState::Granted;
    t.resumeEvent = ctx_.scheduleAfter(0.0, [this, id]() { resume(id); });
}

void ResourcePool::resume(TicketId id) {
    auto it = tickets_.find(id);
    if (it == tickets_.end() || it->second.state != TicketState::Granted) {
        return;
    }
    it->second.state = TicketState::Owned;
    Grant cb = std::move(it->second.onGranted);
    it->second.onGranted = nullptr;
    if (cb) {
        cb();
    }
}

void ResourcePool::dispatch() {
    if (!queue_.empty() && held_ < capacity_) {
        TicketId next = queue_.front();
        queue_.pop_front();
        grant(next);
        return;
    }
    if (held_ < capacity_) {
        // Copy: a listener may register further listeners while we iterate.
        std::vector<ReleaseListener> listeners = listeners_;
        for (auto& l : listeners) {
            l();
        }
    }
}

void ResourcePool::release(TicketId ticket) {
    auto it = tickets_.find(ticket);
    if (it == tickets_.end() || it->second.state == TicketState::Queued) {
        throw std::logic_error("pool '" + name_ + "' release of a ticket that holds no unit");
    }
    if (it->second.state == TicketState::Granted) {
        ctx_.cancel(it->second.resumeEvent);
    }
    tickets_.erase(it);
    changeHeld(-1);
    dispatch();
}

bool ResourcePool::withdraw(TicketId ticket) {
    auto it = tickets_.find(ticket);
    if (it == tickets_.end()) {
        return false;
    }
    switch (it->second.state) {
        case TicketState::Queued:
            queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
            tickets_.erase(it);
            return true;
        case TicketState::Granted:
            ctx_.cancel(it->second.resumeEvent);
            tickets_.erase(it);
            changeHeld(-1);
            dispatch();
            return true;
        case TicketState::Owned:
            return false;
    }
    return false;
}

bool ResourcePool::holds(TicketId ticket) const {
    auto it = tickets_.find(ticket);
    return it != tickets_.end() && it->second.state != TicketState::Queued;
}

void ResourcePool::addReleaseListener(ReleaseListener listener) {
    listeners_.push_back(std::move(listener));
}
