#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "model/types.hpp"

/**
 * @brief Outcome of a triage assessment. Immutable once attached to a Patient.
 */
struct TriageVerdict {
    TriageCategory category{TriageCategory::Blue};
    int priority{5};                 // 1 = most urgent
    double targetWaitMinutes{240.0};
    double fuzzyScore{5.0};          // crisp score in [1, 5]
    std::string flowchart;
    double confidence{0.0};          // firing strength of the chosen category
};

/**
 * @brief Raw patient description handed over by a PatientSource.
 *
 * Vitals and history are optional; missing entries degrade to "none".
 */
struct PatientRecord {
    int age{-1};                     // -1 when unknown
    std::string gender;
    std::string chiefComplaint;
    std::map<std::string, double> vitals;              // e.g. "pain_score" -> 7
    std::vector<std::string> history;                  // e.g. "asthma"
    std::map<std::string, std::string> reportedSymptoms;  // symptom -> linguistic word
};

/**
 * @brief Timestamps of the journey milestones (simulated minutes).
 */
struct JourneyTimes {
    double arrival{0.0};
    std::optional<double> triageCompleted;
    std::optional<double> consultationStart;
    std::optional<double> consultationEnd;
    std::optional<double> departure;
};

/**
 * @brief One patient moving through the department.
 */
class Patient {
public:
    Patient(int id, double arrivalTime, PatientRecord record);

    int id() const { return id_; }
    const PatientRecord& record() const { return record_; }
    int age() const { return record_.age; }
    const std::string& chiefComplaint() const { return record_.chiefComplaint; }

    /** @brief Vital sign value if present. */
    std::optional<double> vital(const std::string& name) const;

    PatientStatus status() const { return status_; }
    /** @brief Simulated time at which the current status was entered. */
    double statusSince() const { return statusSince_; }
    const std::vector<std::pair<PatientStatus, double>>& statusHistory() const { return history_; }

    /**
     * @brief Move to the next lifecycle state.
     * @return false (state unchanged) if the transition is not allowed.
     */
    bool updateStatus(PatientStatus next, double now);

    bool hasVerdict() const { return verdict_.has_value(); }
    /** @brief Triage verdict; only valid when hasVerdict(). */
    const TriageVerdict& verdict() const { return *verdict_; }

    /**
     * @brief Attach the triage verdict.
     * @return false if a verdict is already set (the first one is kept).
     */
    bool setVerdict(const TriageVerdict& verdict);

    double estimatedConsultationMinutes() const { return estimatedConsultation_; }
    void setEstimatedConsultationMinutes(double minutes) { estimatedConsultation_ = minutes; }

    Disposition disposition() const { return disposition_; }
    void setDisposition(Disposition d) { disposition_ = d; }

    JourneyTimes& times() { return times_; }
    const JourneyTimes& times() const { return times_; }

    /** @brief Wait between triage completion and consultation start, if both happened. */
    std::optional<double> consultationWait() const;

    /** @brief Arrival to departure, if departed. */
    std::optional<double> timeInSystem() const;

private:
    int id_;
    PatientRecord record_;
    PatientStatus status_;
    double statusSince_;
    std::vector<std::pair<PatientStatus, double>> history_;
    std::optional<TriageVerdict> verdict_;
    double estimatedConsultation_;
    Disposition disposition_;
    JourneyTimes times_;
};

/** @brief True if the lifecycle allows moving from one status to the other. */
bool isAllowedTransition(PatientStatus from, PatientStatus to);
