#include "model/types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

TriageCategory categoryFromIndex(int index) {
    switch (index) {
        case 0: return TriageCategory::Red;
        case 1: return TriageCategory::Orange;
        case 2: return TriageCategory::Yellow;
        case 3: return TriageCategory::Green;
        case 4: return TriageCategory::Blue;
        default: break;
    }
    throw std::out_of_range("category index out of range: " + std::to_string(index));
}

const char* categoryName(TriageCategory c) {
    switch (c) {
        case TriageCategory::Red: return "RED";
        case TriageCategory::Orange: return "ORANGE";
        case TriageCategory::Yellow: return "YELLOW";
        case TriageCategory::Green: return "GREEN";
        case TriageCategory::Blue: return "BLUE";
    }
    return "UNKNOWN";
}

bool parseCategory(const std::string& text, TriageCategory& out) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    for (int i = 0; i < kCategoryCount; ++i) {
        TriageCategory c = categoryFromIndex(i);
        if (upper == categoryName(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

const char* statusName(PatientStatus s) {
    switch (s) {
        case PatientStatus::Arrived: return "ARRIVED";
        case PatientStatus::WaitingTriage: return "WAITING_TRIAGE";
        case PatientStatus::InTriage: return "IN_TRIAGE";
        case PatientStatus::WaitingConsultation: return "WAITING_CONSULTATION";
        case PatientStatus::InConsultation: return "IN_CONSULTATION";
        case PatientStatus::WaitingAdmission: return "WAITING_ADMISSION";
        case PatientStatus::Admitted: return "ADMITTED";
        case PatientStatus::Discharged: return "DISCHARGED";
        case PatientStatus::LeftWithoutBeingSeen: return "LEFT_WITHOUT_BEING_SEEN";
    }
    return "UNKNOWN";
}

bool isWaitingStatus(PatientStatus s) {
    return s == PatientStatus::WaitingTriage ||
           s == PatientStatus::WaitingConsultation ||
           s == PatientStatus::WaitingAdmission;
}

bool isTerminalStatus(PatientStatus s) {
    return s == PatientStatus::Admitted ||
           s == PatientStatus::Discharged ||
           s == PatientStatus::LeftWithoutBeingSeen;
}

const char* severityName(Severity s) {
    switch (s) {
        case Severity::None: return "none";
        case Severity::Mild: return "mild";
        case Severity::Moderate: return "moderate";
        case Severity::Severe: return "severe";
        case Severity::VerySevere: return "very_severe";
    }
    return "none";
}

const char* dispositionName(Disposition d) {
    switch (d) {
        case Disposition::Pending: return "pending";
        case Disposition::Admitted: return "admitted";
        case Disposition::Discharged: return "discharged";
        case Disposition::LeftWithoutBeingSeen: return "lwbs";
    }
    return "unknown";
}

const char* roleLabel(Role role) {
    switch (role) {
        case Role::Director: return "director";
        case Role::ArrivalProcess: return "arrivals";
        case Role::Patient: return "patient";
        case Role::Triage: return "triage";
        case Role::Consultation: return "consultation";
        case Role::Disposition: return "disposition";
        case Role::Monitor: return "monitor";
    }
    return "unknown";
}
