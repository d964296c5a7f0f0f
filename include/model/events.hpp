#pragma once

#include <array>
#include <string>
#include <vector>

#include "types.hpp"

/**
 * @brief One journey milestone as seen by the event recorder.
 */
struct EventRecord {
    EventType type;
    double time;        // simulated minutes
    int patientId;
    int category;       // categoryIndex() of the verdict, -1 before triage
    double value;       // duration or wait attached to the event, 0 if none
    std::string detail; // flowchart, disposition, ...
};

/** @brief Holding of one resource pool at snapshot time. */
struct PoolUsage {
    std::string name;
    int held{0};
    int capacity{0};
    int queueLength{0};
};

/**
 * @brief Periodic view of the department taken by the orchestrator.
 */
struct SystemSnapshot {
    double time{0.0};
    int patientsInSystem{0};
    int completed{0};
    std::array<int, kPatientStatusCount> statusCounts{};
    std::vector<PoolUsage> pools;
    CategoryTable<int> queueLengths{};
};
