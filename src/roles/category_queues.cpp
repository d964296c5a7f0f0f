#include "roles/category_queues.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

void CategoryQueues::push(TriageCategory category, int patientId) {
    if (contains(patientId)) {
        throw std::logic_error("patient " + std::to_string(patientId) + " is already queued");
    }
    queues_[categoryIndex(category)].push_back(patientId);
    where_[patientId] = category;
}

bool CategoryQueues::remove(int patientId) {
    auto it = where_.find(patientId);
    if (it == where_.end()) {
        return false;
    }
    auto& q = queues_[categoryIndex(it->second)];
    q.erase(std::find(q.begin(), q.end(), patientId));
    where_.erase(it);
    return true;
}

int CategoryQueues::size(TriageCategory category) const {
    return static_cast<int>(queues_[categoryIndex(category)].size());
}

CategoryTable<int> CategoryQueues::lengths() const {
    CategoryTable<int> out{};
    for (int i = 0; i < kCategoryCount; ++i) {
        out[i] = static_cast<int>(queues_[i].size());
    }
    return out;
}
