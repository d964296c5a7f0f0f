#include "roles/patient_journey.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

#include "logging/logger.hpp"

namespace {
std::string formatMinutes(double minutes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", minutes);
    return buf;
}
} // namespace

PatientJourney::PatientJourney(JourneyContext& env, std::unique_ptr<Patient> patient, DoneCallback onDone)
    : env_(env), patient_(std::move(patient)), onDone_(std::move(onDone)) {
    if (!patient_) {
        throw std::invalid_argument("PatientJourney needs a patient");
    }
}

void PatientJourney::moveTo(PatientStatus next) {
    PatientStatus from = patient_->status();
    if (!patient_->updateStatus(next, env_.ctx.now())) {
        throw std::logic_error("patient " + std::to_string(patient_->id()) + ": illegal transition " +
                               statusName(from) + " -> " + statusName(next));
    }
}

void PatientJourney::record(EventType type, double value, const std::string& detail) {
    int category = patient_->hasVerdict() ? categoryIndex(patient_->verdict().category) : -1;
    env_.recorder.recordEvent({type, env_.ctx.now(), patient_->id(), category, value, detail});
}

void PatientJourney::log(Role role, const std::string& text) const {
    logEvent(role, env_.ctx.now(), "Patient " + std::to_string(patient_->id()) + " " + text);
}

void PatientJourney::start() {
    if (patient_->status() != PatientStatus::Arrived) {
        throw std::logic_error("journey already started for patient " + std::to_string(patient_->id()));
    }
    const PatientRecord& r = patient_->record();
    record(EventType::PatientArrived, 0.0, r.chiefComplaint);
    log(Role::Patient, "arrived (complaint=" + r.chiefComplaint + ", age=" + std::to_string(r.age) + ")");

    moveTo(PatientStatus::WaitingTriage);
    nurseTicket_ = env_.nurses.acquire([this]() { onNurseGranted(); });
}

void PatientJourney::onNurseGranted() {
    const Config& cfg = env_.cfg;
    double delay = std::max(cfg.triageDelayMin, env_.rng.normal(cfg.triageDelayMean, cfg.triageDelayStd));
    timer_ = env_.ctx.scheduleAfter(delay, [this]() {
        timer_ = 0;
        performTriage();
    });
}

void PatientJourney::performTriage() {
    moveTo(PatientStatus::InTriage);
    TriageVerdict verdict = env_.triage.assess(*patient_);
    patient_->setVerdict(verdict);
    patient_->setEstimatedConsultationMinutes(env_.serviceTimes.estimate(verdict.category));
    double now = env_.ctx.now();
    patient_->times().triageCompleted = now;

    env_.nurses.release(nurseTicket_);
    nurseTicket_ = 0;

    record(EventType::TriageCompleted, patient_->estimatedConsultationMinutes(), verdict.flowchart);
    log(Role::Triage, std::string("triaged ") + categoryName(verdict.category) +
        " (flowchart=" + verdict.flowchart + ", score=" + formatMinutes(verdict.fuzzyScore) +
        ", via " + env_.triage.name() + ")");

    moveTo(PatientStatus::WaitingConsultation);
    env_.queues.push(verdict.category, patient_->id());
    consultTicket_ = env_.consultation.request(verdict.priority, [this]() { onConsultationGranted(); });
}

void PatientJourney::onConsultationGranted() {
    env_.queues.remove(patient_->id());
    moveTo(PatientStatus::InConsultation);
    double now = env_.ctx.now();
    patient_->times().consultationStart = now;
    double waited = patient_->consultationWait().value_or(0.0);
    record(EventType::ConsultationStarted, waited, "");
    log(Role::Consultation, "consultation started after " + formatMinutes(waited) + " min");

    double duration = env_.serviceTimes.sample(*patient_, patient_->verdict().category, env_.rng);
    timer_ = env_.ctx.scheduleAfter(duration, [this]() {
        timer_ = 0;
        endConsultation();
    });
}

void PatientJourney::endConsultation() {
    env_.consultation.release(consultTicket_);
    consultTicket_ = 0;
    double now = env_.ctx.now();
    patient_->times().consultationEnd = now;
    double duration = now - patient_->times().consultationStart.value_or(now);
    record(EventType::ConsultationCompleted, duration, "");
    log(Role::Consultation, "consultation finished (" + formatMinutes(duration) + " min)");

    TriageCategory category = patient_->verdict().category;
    if (env_.rng.bernoulli(env_.cfg.admitProbability[categoryIndex(category)])) {
        moveTo(PatientStatus::WaitingAdmission);
        log(Role::Disposition, "waiting for a bed");
        bedTicket_ = env_.beds.acquire([this]() { onBedGranted(); });
        return;
    }
    moveTo(PatientStatus::Discharged);
    finish(Disposition::Discharged);
}

void PatientJourney::onBedGranted() {
    moveTo(PatientStatus::Admitted);
    const Config& cfg = env_.cfg;
    double hold = env_.rng.clampedNormal(cfg.bedHoldMean, cfg.bedHoldStd, 0.0,
                                         std::numeric_limits<double>::max());
    // The bed stays occupied for the handover after the patient has left the department.
    ResourcePool& beds = env_.beds;
    TicketId ticket = bedTicket_;
    bedTicket_ = 0;
    env_.ctx.scheduleAfter(hold, [&beds, ticket]() { beds.release(ticket); });
    finish(Disposition::Admitted);
}

void PatientJourney::finish(Disposition disposition) {
    double now = env_.ctx.now();
    patient_->setDisposition(disposition);
    patient_->times().departure = now;
    double inSystem = now - patient_->times().arrival;
    if (disposition == Disposition::LeftWithoutBeingSeen) {
        record(EventType::PatientAbandoned, inSystem, dispositionName(disposition));
    } else {
        record(EventType::PatientDeparted, inSystem, dispositionName(disposition));
    }
    log(Role::Disposition, std::string("departed: ") + dispositionName(disposition) +
        " after " + formatMinutes(inSystem) + " min");
    env_.recorder.recordCompletion(*patient_);
    finished_ = true;
    if (onDone_) {
        onDone_(*this);
    }
}

bool PatientJourney::abandon() {
    if (finished_ || !isWaitingStatus(patient_->status())) {
        return false;
    }
    PatientStatus from = patient_->status();
    if (timer_ != 0) {
        env_.ctx.cancel(timer_);
        timer_ = 0;
    }
    if (nurseTicket_ != 0) {
        // Owned while the triage delay runs; otherwise still queued or pending.
        if (!env_.nurses.withdraw(nurseTicket_)) {
            env_.nurses.release(nurseTicket_);
        }
        nurseTicket_ = 0;
    }
    if (consultTicket_ != 0) {
        if (!env_.consultation.withdraw(consultTicket_)) {
            throw std::logic_error("consultation already started for waiting patient " +
                                   std::to_string(patient_->id()));
        }
        consultTicket_ = 0;
    }
    if (bedTicket_ != 0) {
        if (!env_.beds.withdraw(bedTicket_)) {
            throw std::logic_error("bed already assigned to waiting patient " + std::to_string(patient_->id()));
        }
        bedTicket_ = 0;
    }
    env_.queues.remove(patient_->id());
    moveTo(PatientStatus::LeftWithoutBeingSeen);
    log(Role::Monitor, std::string("left without being seen from ") + statusName(from));
    finish(Disposition::LeftWithoutBeingSeen);
    return true;
}

std::unique_ptr<Patient> PatientJourney::takePatient() {
    if (!finished_) {
        throw std::logic_error("patient " + std::to_string(patient_->id()) + " is still in the department");
    }
    return std::move(patient_);
}
