#pragma once

#include <deque>
#include <unordered_map>

#include "model/types.hpp"

/**
 * @brief One FIFO per triage category holding patients awaiting consultation.
 *
 * A patient id is in at most one queue at a time.
 */
class CategoryQueues {
public:
    /**
     * @brief Append a patient to the queue of its category.
     * @throws std::logic_error if the patient is already queued.
     */
    void push(TriageCategory category, int patientId);

    /** @brief Remove a patient wherever it is queued; false if absent. */
    bool remove(int patientId);

    bool contains(int patientId) const { return where_.count(patientId) > 0; }

    int size(TriageCategory category) const;
    int total() const { return static_cast<int>(where_.size()); }
    bool empty() const { return where_.empty(); }

    CategoryTable<int> lengths() const;

private:
    CategoryTable<std::deque<int>> queues_;
    std::unordered_map<int, TriageCategory> where_;
};
