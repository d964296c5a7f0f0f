#include "metrics/metrics_collector.hpp"

#include <algorithm>

namespace {
constexpr double kFourHoursMinutes = 240.0;
} // namespace

MetricsCollector::MetricsCollector(const Config& cfg)
    : waitTargets_(cfg.waitTargetMinutes), warmup_(cfg.warmupMinutes) {}

void MetricsCollector::recordEvent(const EventRecord& event) {
    events_.push_back(event);
    if (event.type == EventType::PatientArrived) {
        if (event.time >= warmup_) {
            included_.insert(event.patientId);
            ++arrivals_;
        }
        return;
    }
    if (!counted(event.patientId) || event.category < 0) {
        return;
    }
    switch (event.type) {
        case EventType::TriageCompleted:
            ++triaged_[event.category];
            break;
        case EventType::ConsultationStarted:
            waits_[event.category].push_back(event.value);
            if (event.value > waitTargets_[event.category]) {
                ++breaches_[event.category];
            }
            break;
        case EventType::ConsultationCompleted:
            consultations_.push_back(event.value);
            break;
        default:
            break;
    }
}

void MetricsCollector::recordSnapshot(const SystemSnapshot& snapshot) {
    snapshots_.push_back(snapshot);
}

void MetricsCollector::recordCompletion(const Patient& patient) {
    if (!counted(patient.id())) {
        return;
    }
    switch (patient.disposition()) {
        case Disposition::Admitted: ++admitted_; break;
        case Disposition::Discharged: ++discharged_; break;
        case Disposition::LeftWithoutBeingSeen: ++lwbs_; return;
        case Disposition::Pending: return;
    }
    auto inSystem = patient.timeInSystem();
    if (inSystem) {
        systemTimes_.push_back(*inSystem);
        if (*inSystem > kFourHoursMinutes) {
            ++fourHourBreaches_;
        }
    }
}

SummaryPayload MetricsCollector::buildPayload() const {
    SummaryPayload payload;
    payload.warmupMinutes = warmup_;
    payload.totalArrivals = arrivals_;
    payload.totalDepartures = departures();
    payload.admitted = admitted_;
    payload.discharged = discharged_;
    payload.leftWithoutBeingSeen = lwbs_;
    int seen = admitted_ + discharged_;
    payload.admissionRate = seen > 0 ? static_cast<double>(admitted_) / seen : 0.0;
    payload.lwbsRate = arrivals_ > 0 ? static_cast<double>(lwbs_) / arrivals_ : 0.0;
    payload.triaged = triaged_;
    payload.waitTargetBreaches = breaches_;
    payload.waitTargetMinutes = waitTargets_;
    for (int i = 0; i < kCategoryCount; ++i) {
        payload.waitByCategory[i] = summarizeDistribution(waits_[i]);
    }
    payload.consultation = summarizeDistribution(consultations_);
    payload.systemTime = summarizeDistribution(systemTimes_);
    payload.fourHourBreaches = fourHourBreaches_;
    payload.snapshotCount = static_cast<int>(snapshots_.size());
    for (const auto& s : snapshots_) {
        payload.peakPatientsInSystem = std::max(payload.peakPatientsInSystem, s.patientsInSystem);
        for (int i = 0; i < kCategoryCount; ++i) {
            payload.peakQueueLengths[i] = std::max(payload.peakQueueLengths[i], s.queueLengths[i]);
        }
    }
    return payload;
}
