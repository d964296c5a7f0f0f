#pragma once

#include <functional>
#include <memory>
#include <string>

#include "metrics/event_recorder.hpp"
#include "model/config.hpp"
#include "model/patient.hpp"
#include "roles/category_queues.hpp"
#include "sim/joint_acquirer.hpp"
#include "sim/resource_pool.hpp"
#include "sim/scheduler.hpp"
#include "triage/service_time.hpp"
#include "triage/triage_system.hpp"
#include "util/random.hpp"

/**
 * @brief Everything a journey touches, owned by the department.
 *
 * All members must outlive every journey created with the context.
 */
struct JourneyContext {
    SimulationContext& ctx;
    ResourcePool& nurses;
    JointAcquirer& consultation;   // doctor + cubicle
    ResourcePool& beds;
    CategoryQueues& queues;
    TriageSystem& triage;
    const ServiceTimeModel& serviceTimes;
    RandomGenerator& rng;
    EventRecorder& recorder;
    const Config& cfg;
};

/**
 * @brief State machine driving one patient from arrival to a terminal state.
 *
 * Each step runs inside a scheduler event and ends by arming the next
 * suspension (timer or resource request). Steps:
 * - WAITING_TRIAGE: wait for a triage nurse, then the triage delay.
 * - IN_TRIAGE: obtain the verdict, release the nurse.
 * - WAITING_CONSULTATION: queued by category, compound request doctor + cubicle.
 * - IN_CONSULTATION: sampled duration, then release both units.
 * - Disposition: admission draw; admitted patients wait for a bed.
 */
class PatientJourney {
public:
    using DoneCallback = std::function<void(PatientJourney&)>;

    /**
     * @param env shared department context.
     * @param patient patient in ARRIVED state.
     * @param onDone called once when the patient reaches a terminal state;
     *        the journey must not be destroyed from inside the callback.
     */
    PatientJourney(JourneyContext& env, std::unique_ptr<Patient> patient, DoneCallback onDone);

    PatientJourney(const PatientJourney&) = delete;
    PatientJourney& operator=(const PatientJourney&) = delete;

    /** @brief Record the arrival and join the triage queue. */
    void start();

    /**
     * @brief Leave without being seen.
     *
     * Only honoured in a WAITING_* state: pending timers are cancelled and
     * requests withdrawn; a nurse already held is returned.
     * @return false if the patient is not waiting.
     */
    bool abandon();

    const Patient& patient() const { return *patient_; }

    /** @brief Hand the patient over once finished; the journey is inert afterwards. */
    std::unique_ptr<Patient> takePatient();

    bool finished() const { return finished_; }

private:
    void moveTo(PatientStatus next);
    void record(EventType type, double value, const std::string& detail);
    void log(Role role, const std::string& text) const;

    void onNurseGranted();
    void performTriage();
    void onConsultationGranted();
    void endConsultation();
    void onBedGranted();
    void finish(Disposition disposition);

    JourneyContext& env_;
    std::unique_ptr<Patient> patient_;
    DoneCallback onDone_;
    TicketId nurseTicket_ = 0;
    JointTicket consultTicket_ = 0;
    TicketId bedTicket_ = 0;
    EventId timer_ = 0;
    bool finished_ = false;
};
