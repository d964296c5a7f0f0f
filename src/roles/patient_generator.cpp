#include "roles/patient_generator.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "logging/logger.hpp"

ArrivalProcess::ArrivalProcess(SimulationContext& ctx, const Config& cfg, PatientSource& source,
                               RandomGenerator& rng, Spawn spawn)
    : ctx_(ctx), cfg_(cfg), source_(source), rng_(rng), spawn_(std::move(spawn)) {}

double ArrivalProcess::rateFactor(const Config& cfg, double t) {
    if (cfg.arrivalPattern == ArrivalPattern::Constant) {
        return 1.0;
    }
    double hour = std::fmod(t / 60.0, 24.0);
    bool peak;
    if (cfg.peakStartHour <= cfg.peakEndHour) {
        peak = hour >= cfg.peakStartHour && hour < cfg.peakEndHour;
    } else {
        peak = hour >= cfg.peakStartHour || hour < cfg.peakEndHour;
    }
    return peak ? cfg.peakFactor : cfg.offPeakFactor;
}

double ArrivalProcess::maxFactor() const {
    if (cfg_.arrivalPattern == ArrivalPattern::Constant) {
        return 1.0;
    }
    return std::max(cfg_.peakFactor, cfg_.offPeakFactor);
}

double ArrivalProcess::endTime() const {
    return cfg_.arrivalEndMinutes > 0 ? cfg_.arrivalEndMinutes : cfg_.simulationDurationMinutes;
}

void ArrivalProcess::start() {
    if (cfg_.arrivalRatePerHour <= 0.0 || maxFactor() <= 0.0) {
        logEvent(Role::ArrivalProcess, ctx_.now(), "ArrivalProcess idle (rate 0)");
        return;
    }
    logEvent(Role::ArrivalProcess, ctx_.now(),
             std::string("ArrivalProcess running (pattern=") + arrivalPatternName(cfg_.arrivalPattern) +
             ", rate=" + std::to_string(cfg_.arrivalRatePerHour) + "/h)");
    scheduleNext();
}

void ArrivalProcess::scheduleNext() {
    double ratePerMinute = cfg_.arrivalRatePerHour * maxFactor() / 60.0;
    double gap = rng_.exponential(ratePerMinute);
    if (ctx_.now() + gap >= endTime()) {
        logEvent(Role::ArrivalProcess, ctx_.now(),
                 "ArrivalProcess stopping after " + std::to_string(generated_) + " patients");
        return;
    }
    ctx_.scheduleAfter(gap, [this]() { onCandidate(); });
}

void ArrivalProcess::onCandidate() {
    double now = ctx_.now();
    // Thinning: keep the candidate with probability rate(now) / peak rate.
    if (rng_.bernoulli(rateFactor(cfg_, now) / maxFactor())) {
        ++generated_;
        spawn_(source_.next(rng_));
    }
    scheduleNext();
}
