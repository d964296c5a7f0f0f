#pragma once

#include "model/patient.hpp"

/**
 * @brief Decides whether a waiting patient walks out.
 */
class AbandonmentPolicy {
public:
    virtual ~AbandonmentPolicy() = default;

    /** @brief Only asked for patients in a Waiting* state. */
    virtual bool shouldLeave(const Patient& patient, double now) const = 0;

    virtual const char* name() const = 0;
};

/** @brief Patients never leave. */
class NeverAbandon : public AbandonmentPolicy {
public:
    bool shouldLeave(const Patient&, double) const override { return false; }
    const char* name() const override { return "never"; }
};

/**
 * @brief Leave after waiting longer than a fixed patience in the current state.
 *
 * Applies to WAITING_TRIAGE and WAITING_CONSULTATION only; RED and ORANGE
 * patients always stay. A patience of 0 disables abandonment.
 */
class PatienceAbandonment : public AbandonmentPolicy {
public:
    explicit PatienceAbandonment(double patienceMinutes) : patience_(patienceMinutes) {}

    bool shouldLeave(const Patient& patient, double now) const override;
    const char* name() const override { return "patience"; }

    double patience() const { return patience_; }

private:
    double patience_;
};
