#pragma once

#include <vector>

#include "model/types.hpp"
#include "triage/fuzzy_variables.hpp"
#include "triage/rule_base.hpp"

/** @brief Everything the engine computed for one symptom vector. */
struct InferenceResult {
    std::vector<double> inputs;        // padded to kSymptomInputs
    FuzzifiedInputs memberships{};
    CategoryTable<double> strengths{}; // aggregated per category
    double score{0.0};                 // centroid in [1, 5]
    TriageCategory category{TriageCategory::Blue};
    double confidence{0.0};            // strengths[category]
};

/**
 * @brief Fuzzify, fire rules, aggregate, defuzzify (centroid), map to category.
 *
 * Stateless after construction; safe to share between patients.
 */
class FuzzyInferenceEngine {
public:
    /**
     * @param outputStep spacing of the discretized output universe [1, 5].
     *        It is adjusted so the grid ends exactly at 5. Urgency is
     *        monotonic in the inputs only on the integer grid (step 1),
     *        which is the only step a validated Config carries.
     * @throws std::invalid_argument when outputStep is not in (0, 4].
     */
    explicit FuzzyInferenceEngine(double outputStep = 1.0);

    FuzzyInferenceEngine(RuleBase rules, double outputStep);

    /**
     * @brief Crisp score for up to five symptom values (missing ones are none).
     * @throws std::logic_error if no rule fires (rule base incomplete).
     */
    double infer(const std::vector<double>& symptoms) const;

    /** @brief Full trace of one inference. */
    InferenceResult evaluate(const std::vector<double>& symptoms) const;

    /** @brief Category for a crisp score: clamp(round(score) - 1, 0, 4). */
    static TriageCategory categoryForScore(double score);

    const RuleBase& rules() const { return rules_; }
    const std::vector<double>& outputGrid() const { return grid_; }

private:
    double defuzzify(const CategoryTable<double>& strengths) const;

    RuleBase rules_;
    FuzzyVariable output_;
    std::vector<double> grid_;
};
