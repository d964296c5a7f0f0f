#pragma once

#include <functional>

#include "model/config.hpp"
#include "model/patient.hpp"
#include "roles/patient_source.hpp"
#include "sim/scheduler.hpp"
#include "util/random.hpp"

/**
 * @brief Poisson arrival stream, optionally modulated by time of day.
 *
 * Inter-arrival gaps are drawn at the peak rate and thinned down to the
 * rate of the current hour, so the stream stays a non-homogeneous Poisson
 * process. Arrivals stop at arrivalEndMinutes (the horizon when 0).
 */
class ArrivalProcess {
public:
    using Spawn = std::function<void(PatientRecord)>;

    /**
     * @param ctx simulation context.
     * @param cfg rate, pattern and stop time.
     * @param source provider of patient records.
     * @param rng random stream shared with the department.
     * @param spawn receives the record of every patient at its arrival time.
     */
    ArrivalProcess(SimulationContext& ctx, const Config& cfg, PatientSource& source,
                   RandomGenerator& rng, Spawn spawn);

    ArrivalProcess(const ArrivalProcess&) = delete;
    ArrivalProcess& operator=(const ArrivalProcess&) = delete;

    /** @brief Schedule the first arrival; a rate of 0 schedules nothing. */
    void start();

    /** @brief Patients created so far. */
    int generated() const { return generated_; }

    /** @brief Time after which no patient arrives. */
    double endTime() const;

    /**
     * @brief Rate multiplier at simulated minute t.
     *
     * 1 for the constant pattern; peakFactor inside [peakStartHour,
     * peakEndHour) and offPeakFactor outside for day_night. A window whose
     * start is after its end wraps around midnight.
     */
    static double rateFactor(const Config& cfg, double t);

private:
    double maxFactor() const;
    void scheduleNext();
    void onCandidate();

    SimulationContext& ctx_;
    const Config& cfg_;
    PatientSource& source_;
    RandomGenerator& rng_;
    Spawn spawn_;
    int generated_ = 0;
};
