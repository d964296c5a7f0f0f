#include "department.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
const Config& validated(const Config& cfg) {
    std::string err;
    if (!validateConfig(cfg, err)) {
        throw std::invalid_argument("invalid configuration: " + err);
    }
    return cfg;
}
} // namespace

Department::Department(const Config& cfg,
                       std::unique_ptr<PatientSource> source,
                       std::unique_ptr<AbandonmentPolicy> abandonment)
    : cfg_(validated(cfg)),
      rng_(cfg_.randomSeed),
      nurses_(ctx_, "triage_nurse", cfg_.triageNurses),
      doctors_(ctx_, "doctor", cfg_.doctors),
      cubicles_(ctx_, "cubicle", cfg_.cubicles),
      beds_(ctx_, "bed", cfg_.beds),
      consultation_(ctx_, {&doctors_, &cubicles_}),
      serviceTimes_(cfg_),
      manchester_(cfg_),
      triage_(&manchester_),
      metrics_(cfg_),
      source_(source ? std::move(source) : std::make_unique<SyntheticPatientSource>()),
      abandonment_(abandonment ? std::move(abandonment)
                               : std::make_unique<PatienceAbandonment>(cfg_.abandonPatienceMinutes)),
      arrivals_(ctx_, cfg_, *source_, rng_, [this](PatientRecord record) { admit(std::move(record)); }) {
    rebuildJourneyContext();
}

void Department::rebuildJourneyContext() {
    env_ = std::make_unique<JourneyContext>(JourneyContext{ctx_, nurses_, consultation_, beds_, queues_,
                                                           *triage_, serviceTimes_, rng_, metrics_, cfg_});
}

void Department::useExternalTriage(ExternalTriage::Callback callback) {
    if (nextPatientId_ != 1) {
        throw std::logic_error("triage system cannot change once patients have arrived");
    }
    external_ = std::make_unique<ExternalTriage>(std::move(callback), manchester_, cfg_.waitTargetMinutes);
    triage_ = external_.get();
    rebuildJourneyContext();
}

void Department::start() {
    if (started_) {
        return;
    }
    started_ = true;
    logEvent(Role::Director, ctx_.now(),
             std::string("Department open (nurses=") + std::to_string(cfg_.triageNurses) +
             ", doctors=" + std::to_string(cfg_.doctors) +
             ", cubicles=" + std::to_string(cfg_.cubicles) +
             ", beds=" + std::to_string(cfg_.beds) +
             ", triage=" + triage_->name() +
             ", abandonment=" + abandonment_->name() + ")");
    arrivals_.start();
    ctx_.scheduleAfter(cfg_.snapshotIntervalMinutes, [this]() { takeSnapshot(); });
    ctx_.scheduleAfter(cfg_.abandonCheckIntervalMinutes, [this]() { checkAbandonment(); });
}

void Department::run() {
    runUntil(cfg_.simulationDurationMinutes);
}

void Department::runUntil(double horizon) {
    start();
    ctx_.runUntil(horizon);
}

int Department::admit(PatientRecord record) {
    int id = nextPatientId_++;
    auto patient = std::make_unique<Patient>(id, ctx_.now(), std::move(record));
    auto journey = std::make_unique<PatientJourney>(*env_, std::move(patient), [this](PatientJourney& done) {
        int doneId = done.patient().id();
        // The journey is still on the stack here; drop it from a fresh event.
        ctx_.scheduleAfter(0.0, [this, doneId]() { retire(doneId); });
    });
    PatientJourney& ref = *journey;
    journeys_.emplace(id, std::move(journey));
    ref.start();
    return id;
}

void Department::scheduleArrival(double time, PatientRecord record) {
    ctx_.scheduleAt(time, [this, record]() { admit(record); });
}

bool Department::abandon(int patientId) {
    auto it = journeys_.find(patientId);
    if (it == journeys_.end() || it->second->finished()) {
        return false;
    }
    return it->second->abandon();
}

void Department::retire(int patientId) {
    auto it = journeys_.find(patientId);
    if (it == journeys_.end()) {
        return;
    }
    completed_.push_back(it->second->takePatient());
    journeys_.erase(it);
}

void Department::takeSnapshot() {
    SystemSnapshot snapshot = status();
    metrics_.recordSnapshot(snapshot);
    logEvent(Role::Monitor, ctx_.now(),
             "Snapshot: in_system=" + std::to_string(snapshot.patientsInSystem) +
             " completed=" + std::to_string(snapshot.completed));
    ctx_.scheduleAfter(cfg_.snapshotIntervalMinutes, [this]() { takeSnapshot(); });
}

void Department::checkAbandonment() {
    double now = ctx_.now();
    std::vector<int> leaving;
    for (const auto& entry : journeys_) {
        const PatientJourney& journey = *entry.second;
        if (journey.finished() || !isWaitingStatus(journey.patient().status())) {
            continue;
        }
        if (abandonment_->shouldLeave(journey.patient(), now)) {
            leaving.push_back(entry.first);
        }
    }
    for (int id : leaving) {
        journeys_.at(id)->abandon();
    }
    ctx_.scheduleAfter(cfg_.abandonCheckIntervalMinutes, [this]() { checkAbandonment(); });
}

int Department::patientsInSystem() const {
    int count = 0;
    for (const auto& entry : journeys_) {
        if (!entry.second->finished()) {
            ++count;
        }
    }
    return count;
}

const Patient* Department::findPatient(int patientId) const {
    auto it = journeys_.find(patientId);
    if (it != journeys_.end()) {
        return &it->second->patient();
    }
    for (const auto& p : completed_) {
        if (p->id() == patientId) {
            return p.get();
        }
    }
    return nullptr;
}

SystemSnapshot Department::status() const {
    SystemSnapshot s;
    s.time = ctx_.now();
    for (const auto& entry : journeys_) {
        const PatientJourney& journey = *entry.second;
        ++s.statusCounts[static_cast<int>(journey.patient().status())];
        if (journey.finished()) {
            ++s.completed;
        } else {
            ++s.patientsInSystem;
        }
    }
    for (const auto& p : completed_) {
        ++s.statusCounts[static_cast<int>(p->status())];
        ++s.completed;
    }
    int consultWaiting = consultation_.waitingCount();
    s.pools.push_back({nurses_.name(), nurses_.held(), nurses_.capacity(), nurses_.queueLength()});
    s.pools.push_back({doctors_.name(), doctors_.held(), doctors_.capacity(), consultWaiting});
    s.pools.push_back({cubicles_.name(), cubicles_.held(), cubicles_.capacity(), consultWaiting});
    s.pools.push_back({beds_.name(), beds_.held(), beds_.capacity(), beds_.queueLength()});
    s.queueLengths = queues_.lengths();
    return s;
}

SummaryPayload Department::summary() const {
    SummaryPayload payload = metrics_.buildPayload();
    payload.simulationDurationMinutes = cfg_.simulationDurationMinutes;
    payload.randomSeed = cfg_.randomSeed;
    payload.triageSystem = triage_->name();
    payload.arrivalPattern = arrivalPatternName(cfg_.arrivalPattern);
    payload.arrivalRatePerHour = cfg_.arrivalRatePerHour;
    payload.stillInSystem = patientsInSystem();
    for (const ResourcePool* pool : {&nurses_, &doctors_, &cubicles_, &beds_}) {
        payload.pools.push_back({pool->name(), pool->capacity(), pool->peakHeld(), pool->averageUtilization()});
    }
    return payload;
}

LogMetricsContext Department::logMetricsContext() const {
    return {&nurses_, &doctors_, &cubicles_, &beds_, &queues_};
}
