#pragma once

#include <unordered_set>
#include <vector>

#include "metrics/event_recorder.hpp"
#include "metrics/summary.hpp"
#include "model/config.hpp"

/**
 * @brief EventRecorder that accumulates the run statistics.
 *
 * Patients arriving before the warm-up period ends are excluded from every
 * statistic; their events are still kept in the raw event list.
 */
class MetricsCollector : public EventRecorder {
public:
    explicit MetricsCollector(const Config& cfg);

    void recordEvent(const EventRecord& event) override;
    void recordSnapshot(const SystemSnapshot& snapshot) override;
    void recordCompletion(const Patient& patient) override;

    int arrivals() const { return arrivals_; }
    int admitted() const { return admitted_; }
    int discharged() const { return discharged_; }
    int leftWithoutBeingSeen() const { return lwbs_; }
    int departures() const { return admitted_ + discharged_ + lwbs_; }
    const CategoryTable<int>& triaged() const { return triaged_; }

    /** @brief Consultation waits of one category, in recording order. */
    const std::vector<double>& waits(TriageCategory category) const { return waits_[categoryIndex(category)]; }

    const std::vector<EventRecord>& events() const { return events_; }
    const std::vector<SystemSnapshot>& snapshots() const { return snapshots_; }

    /**
     * @brief Fill the statistical part of a summary.
     *
     * Run-level fields (seed, pools, triage system, patients still inside)
     * are left for the caller.
     */
    SummaryPayload buildPayload() const;

private:
    bool counted(int patientId) const { return included_.count(patientId) > 0; }

    CategoryTable<double> waitTargets_;
    double warmup_;
    std::unordered_set<int> included_;
    std::vector<EventRecord> events_;
    std::vector<SystemSnapshot> snapshots_;
    int arrivals_ = 0;
    int admitted_ = 0;
    int discharged_ = 0;
    int lwbs_ = 0;
    int fourHourBreaches_ = 0;
    CategoryTable<int> triaged_{};
    CategoryTable<int> breaches_{};
    CategoryTable<std::vector<double>> waits_;
    std::vector<double> consultations_;
    std::vector<double> systemTimes_;
};
