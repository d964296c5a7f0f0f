#include "triage/inference_engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "triage/linguistic.hpp"

namespace {
// Scores landing exactly on .5 (e.g. 1.5) must round towards the less
// urgent category consistently despite floating-point noise.
constexpr double kRoundingTolerance = 1e-9;

std::vector<double> buildGrid(const FuzzyVariable& output, double step) {
    if (!(step > 0.0) || step > output.hi() - output.lo()) {
        throw std::invalid_argument("fuzzy output step must be in (0, 4]");
    }
    double span = output.hi() - output.lo();
    int intervals = std::max(1, static_cast<int>(std::lround(span / step)));
    std::vector<double> grid;
    grid.reserve(intervals + 1);
    for (int i = 0; i <= intervals; ++i) {
        grid.push_back(output.lo() + span * i / intervals);
    }
    return grid;
}
} // namespace

FuzzyInferenceEngine::FuzzyInferenceEngine(double outputStep)
    : FuzzyInferenceEngine(RuleBase::manchester(), outputStep) {}

FuzzyInferenceEngine::FuzzyInferenceEngine(RuleBase rules, double outputStep)
    : rules_(std::move(rules)),
      output_(makeTriageScoreVariable()),
      grid_(buildGrid(output_, outputStep)) {}

TriageCategory FuzzyInferenceEngine::categoryForScore(double score) {
    int rounded = static_cast<int>(std::floor(score + 0.5 + kRoundingTolerance));
    return categoryFromIndex(std::clamp(rounded - 1, 0, kCategoryCount - 1));
}

double FuzzyInferenceEngine::defuzzify(const CategoryTable<double>& strengths) const {
    double num = 0.0;
    double den = 0.0;
    for (double u : grid_) {
        double mu = 0.0;
        for (int k = 0; k < kCategoryCount; ++k) {
            // Mamdani implication (min) then aggregation (max).
            mu = std::max(mu, std::min(strengths[k], output_.degree(k, u)));
        }
        num += mu * u;
        den += mu;
    }
    if (den <= 0.0) {
        throw std::logic_error("fuzzy inference produced an empty output surface");
    }
    return num / den;
}

InferenceResult FuzzyInferenceEngine::evaluate(const std::vector<double>& symptoms) const {
    InferenceResult r;
    r.inputs = padSymptoms(symptoms);
    r.memberships = fuzzifySymptoms(r.inputs);
    r.strengths = rules_.fire(r.memberships);
    r.score = defuzzify(r.strengths);
    r.category = categoryForScore(r.score);
    r.confidence = r.strengths[categoryIndex(r.category)];
    return r;
}

double FuzzyInferenceEngine::infer(const std::vector<double>& symptoms) const {
    return evaluate(symptoms).score;
}
