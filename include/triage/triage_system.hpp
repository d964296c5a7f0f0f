#pragma once

#include "model/patient.hpp"

/**
 * @brief Anything that can turn a patient into a triage verdict.
 *
 * Implementations must always return a verdict; bad input degrades to a
 * documented default instead of failing the patient.
 */
class TriageSystem {
public:
    virtual ~TriageSystem() = default;

    virtual TriageVerdict assess(const Patient& patient) = 0;

    /** @brief Short label used in logs and summaries. */
    virtual const char* name() const = 0;
};
