#pragma once

#include "model/config.hpp"
#include "model/patient.hpp"
#include "util/random.hpp"

/** @brief Shortest consultation ever sampled (minutes). */
constexpr double kMinConsultationMinutes = 5.0;

/**
 * @brief Consultation length per triage category, adjusted for patient complexity.
 */
class ServiceTimeModel {
public:
    explicit ServiceTimeModel(const Config& cfg);
    ServiceTimeModel(CategoryTable<double> means, CategoryTable<double> stddevs);

    /** @brief Base mean for the category (RED 45 ... BLUE 15 by default). */
    double estimate(TriageCategory category) const;

    /**
     * @brief Multiplier >= 1: +0.3 under 2 years, +0.2 over 75, +0.1 with any
     * history, +0.2 for chest pain, difficulty breathing, abdominal pain or head injury.
     */
    static double complexity(const Patient& patient);

    /** @brief max(5, normal(mean, std) * complexity). */
    double sample(const Patient& patient, TriageCategory category, RandomGenerator& rng) const;

private:
    CategoryTable<double> means_;
    CategoryTable<double> stddevs_;
};
