#pragma once

#include <array>
#include <cstdint>
#include <string>

/**
 * @brief Manchester triage categories ordered by urgency (Red is most urgent).
 */
enum class TriageCategory {
    Red,
    Orange,
    Yellow,
    Green,
    Blue
};

constexpr int kCategoryCount = 5;

/**
 * @brief Lifecycle of a patient inside the department.
 *
 * Transitions only move forward, except the side exit to LeftWithoutBeingSeen
 * which is reachable from any Waiting* state.
 */
enum class PatientStatus {
    Arrived,
    WaitingTriage,
    InTriage,
    WaitingConsultation,
    InConsultation,
    WaitingAdmission,
    Admitted,
    Discharged,
    LeftWithoutBeingSeen
};

constexpr int kPatientStatusCount = 9;

/** @brief Linguistic severity of a single symptom. */
enum class Severity {
    None,
    Mild,
    Moderate,
    Severe,
    VerySevere
};

constexpr int kSeverityCount = 5;

enum class Disposition {
    Pending,
    Admitted,
    Discharged,
    LeftWithoutBeingSeen
};

enum class ArrivalPattern {
    Constant,
    DayNight
};

enum class EventType {
    PatientArrived = 1,
    TriageCompleted = 2,
    ConsultationStarted = 3,
    ConsultationCompleted = 4,
    PatientDeparted = 5,
    PatientAbandoned = 6
};

enum class Role {
    Director,
    ArrivalProcess,
    Patient,
    Triage,
    Consultation,
    Disposition,
    Monitor
};

/** @brief Per-category table indexed by static_cast<int>(TriageCategory). */
template <typename T>
using CategoryTable = std::array<T, kCategoryCount>;

inline int categoryIndex(TriageCategory c) { return static_cast<int>(c); }

/** @brief Priority rank 1..5 (1 = most urgent). */
inline int categoryPriority(TriageCategory c) { return static_cast<int>(c) + 1; }

/** @brief Category for an index 0..4; throws std::out_of_range otherwise. */
TriageCategory categoryFromIndex(int index);

/** @brief Upper-case label ("RED", "ORANGE", ...). */
const char* categoryName(TriageCategory c);

/**
 * @brief Parse a category label (case-insensitive).
 * @return true and set out on success, false for unknown labels.
 */
bool parseCategory(const std::string& text, TriageCategory& out);

const char* statusName(PatientStatus s);

/** @brief True for the Waiting* states from which a patient may abandon. */
bool isWaitingStatus(PatientStatus s);

/** @brief True for Admitted, Discharged and LeftWithoutBeingSeen. */
bool isTerminalStatus(PatientStatus s);

const char* severityName(Severity s);

const char* dispositionName(Disposition d);

const char* roleLabel(Role role);
