#include "model/patient.hpp"

Patient::Patient(int id, double arrivalTime, PatientRecord record)
    : id_(id),
      record_(std::move(record)),
      status_(PatientStatus::Arrived),
      statusSince_(arrivalTime),
      estimatedConsultation_(0.0),
      disposition_(Disposition::Pending) {
    times_.arrival = arrivalTime;
    history_.emplace_back(status_, arrivalTime);
}

std::optional<double> Patient::vital(const std::string& name) const {
    auto it = record_.vitals.find(name);
    if (it == record_.vitals.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool isAllowedTransition(PatientStatus from, PatientStatus to) {
    if (to == PatientStatus::LeftWithoutBeingSeen) {
        return isWaitingStatus(from);
    }
    switch (from) {
        case PatientStatus::Arrived: return to == PatientStatus::WaitingTriage;
        case PatientStatus::WaitingTriage: return to == PatientStatus::InTriage;
        case PatientStatus::InTriage: return to == PatientStatus::WaitingConsultation;
        case PatientStatus::WaitingConsultation: return to == PatientStatus::InConsultation;
        case PatientStatus::InConsultation:
            return to == PatientStatus::WaitingAdmission || to == PatientStatus::Discharged;
        case PatientStatus::WaitingAdmission: return to == PatientStatus::Admitted;
        default: return false;
    }
}

bool Patient::updateStatus(PatientStatus next, double now) {
    if (!isAllowedTransition(status_, next)) {
        return false;
    }
    status_ = next;
    statusSince_ = now;
    history_.emplace_back(next, now);
    return true;
}

bool Patient::setVerdict(const TriageVerdict& verdict) {
    if (verdict_) {
        return false;
    }
    verdict_ = verdict;
    return true;
}

std::optional<double> Patient::consultationWait() const {
    if (!times_.triageCompleted || !times_.consultationStart) {
        return std::nullopt;
    }
    return *times_.consultationStart - *times_.triageCompleted;
}

std::optional<double> Patient::timeInSystem() const {
    if (!times_.departure) {
        return std::nullopt;
    }
    return *times_.departure - times_.arrival;
}
