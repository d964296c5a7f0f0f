#include "roles/abandonment.hpp"

bool PatienceAbandonment::shouldLeave(const Patient& patient, double now) const {
    if (patience_ <= 0.0) {
        return false;
    }
    PatientStatus s = patient.status();
    if (s != PatientStatus::WaitingTriage && s != PatientStatus::WaitingConsultation) {
        return false;
    }
    if (patient.hasVerdict()) {
        TriageCategory c = patient.verdict().category;
        if (c == TriageCategory::Red || c == TriageCategory::Orange) {
            return false;
        }
    }
    return now - patient.statusSince() > patience_;
}
