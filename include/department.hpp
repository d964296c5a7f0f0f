#pragma once

#include <map>
#include <memory>
#include <vector>

#include "logging/logger.hpp"
#include "metrics/metrics_collector.hpp"
#include "metrics/summary.hpp"
#include "model/config.hpp"
#include "model/events.hpp"
#include "model/patient.hpp"
#include "roles/abandonment.hpp"
#include "roles/category_queues.hpp"
#include "roles/patient_generator.hpp"
#include "roles/patient_journey.hpp"
#include "roles/patient_source.hpp"
#include "sim/joint_acquirer.hpp"
#include "sim/resource_pool.hpp"
#include "sim/scheduler.hpp"
#include "triage/external_triage.hpp"
#include "triage/manchester_triage.hpp"
#include "triage/service_time.hpp"
#include "util/random.hpp"

/**
 * @brief One emergency department run: clock, pools, triage, arrivals, monitors.
 *
 * Every Department owns its own SimulationContext, so several can run side
 * by side in one process. Nothing is scheduled until start().
 */
class Department {
public:
    /**
     * @brief Build the department for a configuration.
     * @param source patient records; a SyntheticPatientSource when null.
     * @param abandonment walk-out policy; PatienceAbandonment(cfg) when null.
     * @throws std::invalid_argument when cfg fails validateConfig().
     */
    explicit Department(const Config& cfg,
                        std::unique_ptr<PatientSource> source = nullptr,
                        std::unique_ptr<AbandonmentPolicy> abandonment = nullptr);

    Department(const Department&) = delete;
    Department& operator=(const Department&) = delete;

    /**
     * @brief Route triage through an external collaborator, falling back to
     * the fuzzy Manchester system on malformed answers.
     * @throws std::logic_error once a patient has arrived.
     */
    void useExternalTriage(ExternalTriage::Callback callback);

    /** @brief Schedule arrivals, snapshots and the abandonment monitor (once). */
    void start();

    /** @brief start(), then advance the clock to the configured horizon. */
    void run();

    /** @brief start(), then advance the clock to horizon. */
    void runUntil(double horizon);

    /**
     * @brief A patient walks in now.
     * @return id of the new patient.
     */
    int admit(PatientRecord record);

    /** @brief A patient walks in at an absolute time (not in the past). */
    void scheduleArrival(double time, PatientRecord record);

    /**
     * @brief Deliver the abandonment signal to one patient.
     * @return false if the patient is unknown or not in a WAITING_* state.
     */
    bool abandon(int patientId);

    /** @brief Current view of the department. */
    SystemSnapshot status() const;

    /** @brief Collected statistics plus run-level fields. */
    SummaryPayload summary() const;

    /** @brief Pool and queue pointers for log lines. */
    LogMetricsContext logMetricsContext() const;

    /** @brief Patient by id, active or completed; nullptr if unknown. */
    const Patient* findPatient(int patientId) const;

    /** @brief Patients still inside (not yet in a terminal state). */
    int patientsInSystem() const;

    /** @brief Patients in a terminal state, in completion order. */
    const std::vector<std::unique_ptr<Patient>>& completed() const { return completed_; }

    const Config& config() const { return cfg_; }
    SimulationContext& context() { return ctx_; }
    const SimulationContext& context() const { return ctx_; }
    const ResourcePool& nurses() const { return nurses_; }
    const ResourcePool& doctors() const { return doctors_; }
    const ResourcePool& cubicles() const { return cubicles_; }
    const ResourcePool& beds() const { return beds_; }
    const JointAcquirer& consultation() const { return consultation_; }
    const CategoryQueues& queues() const { return queues_; }
    const MetricsCollector& metrics() const { return metrics_; }
    const TriageSystem& triage() const { return *triage_; }
    const ArrivalProcess& arrivals() const { return arrivals_; }

private:
    void rebuildJourneyContext();
    void retire(int patientId);
    void takeSnapshot();
    void checkAbandonment();

    Config cfg_;
    SimulationContext ctx_;
    RandomGenerator rng_;
    ResourcePool nurses_;
    ResourcePool doctors_;
    ResourcePool cubicles_;
    ResourcePool beds_;
    JointAcquirer consultation_;
    CategoryQueues queues_;
    ServiceTimeModel serviceTimes_;
    ManchesterTriage manchester_;
    std::unique_ptr<ExternalTriage> external_;
    TriageSystem* triage_;
    MetricsCollector metrics_;
    std::unique_ptr<PatientSource> source_;
    std::unique_ptr<AbandonmentPolicy> abandonment_;
    std::unique_ptr<JourneyContext> env_;
    ArrivalProcess arrivals_;
    std::map<int, std::unique_ptr<PatientJourney>> journeys_;
    std::vector<std::unique_ptr<Patient>> completed_;
    int nextPatientId_ = 1;
    bool started_ = false;
};
