#pragma once

#include "model/events.hpp"
#include "model/patient.hpp"

/**
 * @brief Sink for everything the department reports while running.
 */
class EventRecorder {
public:
    virtual ~EventRecorder() = default;

    /** @brief One journey milestone. */
    virtual void recordEvent(const EventRecord& event) = 0;

    /** @brief Periodic utilization / queue snapshot. */
    virtual void recordSnapshot(const SystemSnapshot& snapshot) = 0;

    /** @brief Patient reached a terminal state; all timestamps are final. */
    virtual void recordCompletion(const Patient& patient) = 0;
};
