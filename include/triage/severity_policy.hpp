#pragma once

#include <map>
#include <string>
#include <vector>

#include "model/patient.hpp"
#include "model/types.hpp"

/**
 * @brief Threshold band mapping a vital sign reading to a severity.
 *
 * Bands are checked in order; the first whose predicate holds wins.
 */
struct VitalBand {
    enum class Direction { Below, AtLeast };

    Direction direction;
    double threshold;
    Severity severity;
};

/** @brief How one symptom is read from one vital sign. */
struct VitalRule {
    std::string vital;             // key in PatientRecord::vitals
    std::vector<VitalBand> bands;  // first match wins, otherwise none
};

/**
 * @brief Table-driven mapping from a patient's record to symptom severities.
 *
 * Resolution order for a symptom: explicitly reported severity word, then
 * the vital-sign rule registered for that symptom, then "none".
 */
class SeverityPolicy {
public:
    /** @brief Empty policy: only reported symptoms count. */
    SeverityPolicy() = default;

    /** @brief Pain, SpO2, temperature, GCS, blood pressure and heart-rate bands. */
    static SeverityPolicy standard();

    /** @brief Register (or replace) the vital rule of a symptom. */
    void map(const std::string& symptom, VitalRule rule);

    /** @brief Severity of one symptom for the given record. */
    Severity assess(const std::string& symptom, const PatientRecord& record) const;

    /** @brief Severity of a single vital reading, none if the rule has no band for it. */
    static Severity classify(const VitalRule& rule, double value);

private:
    std::map<std::string, VitalRule> rules_;
};
