#include "triage/fuzzy_variables.hpp"

#include <algorithm>
#include <stdexcept>

MembershipFunction MembershipFunction::triangle(double a, double b, double c) {
    return MembershipFunction{Shape::Triangle, a, b, c, c};
}

MembershipFunction MembershipFunction::trapezoid(double a, double b, double c, double d) {
    return MembershipFunction{Shape::Trapezoid, a, b, c, d};
}

double MembershipFunction::degree(double x) const {
    if (shape == Shape::Triangle) {
        if (x == b) return 1.0;
        if (x < a || x > c) return 0.0;
        if (x < b) return (x - a) / (b - a);
        return (c - x) / (c - b);
    }
    if (x < a || x > d) return 0.0;
    if (x >= b && x <= c) return 1.0;
    if (x < b) return (x - a) / (b - a);
    return (d - x) / (d - c);
}

FuzzyVariable::FuzzyVariable(std::string name, double lo, double hi, std::vector<FuzzyTerm> terms)
    : name_(std::move(name)), lo_(lo), hi_(hi), terms_(std::move(terms)) {
    if (!(lo_ < hi_)) {
        throw std::invalid_argument("fuzzy variable '" + name_ + "' has an empty universe");
    }
}

std::vector<double> FuzzyVariable::degrees(double x) const {
    double clamped = std::clamp(x, lo_, hi_);
    std::vector<double> out;
    out.reserve(terms_.size());
    for (const auto& t : terms_) {
        out.push_back(t.function.degree(clamped));
    }
    return out;
}

double FuzzyVariable::degree(size_t term, double x) const {
    return terms_.at(term).function.degree(std::clamp(x, lo_, hi_));
}

FuzzyVariable makeSymptomVariable(const std::string& name) {
    const double step = (kSymptomMax - kSymptomMin) / (kSeverityCount - 1);
    std::vector<FuzzyTerm> terms;
    for (int i = 0; i < kSeverityCount; ++i) {
        double center = kSymptomMin + i * step;
        MembershipFunction mf = MembershipFunction::triangle(center - step, center, center + step);
        if (i == 0) {
            mf = MembershipFunction::trapezoid(kSymptomMin, kSymptomMin, kSymptomMin, center + step);
        } else if (i == kSeverityCount - 1) {
            mf = MembershipFunction::trapezoid(center - step, kSymptomMax, kSymptomMax, kSymptomMax);
        }
        terms.push_back(FuzzyTerm{severityName(static_cast<Severity>(i)), mf});
    }
    return FuzzyVariable(name, kSymptomMin, kSymptomMax, std::move(terms));
}

FuzzyVariable makeTriageScoreVariable() {
    std::vector<FuzzyTerm> terms;
    for (int i = 0; i < kCategoryCount; ++i) {
        double peak = 1.0 + i;
        double left = std::max(1.0, peak - 1.0);
        double right = std::min(5.0, peak + 1.0);
        terms.push_back(FuzzyTerm{categoryName(categoryFromIndex(i)),
                                  MembershipFunction::triangle(left, peak, right)});
    }
    return FuzzyVariable("triage_score", 1.0, 5.0, std::move(terms));
}

FuzzifiedInputs fuzzifySymptoms(const std::vector<double>& padded) {
    static const FuzzyVariable symptom = makeSymptomVariable("symptom");
    if (padded.size() != static_cast<size_t>(kSymptomInputs)) {
        throw std::invalid_argument("fuzzifySymptoms expects exactly " +
                                    std::to_string(kSymptomInputs) + " values");
    }
    FuzzifiedInputs out{};
    for (int i = 0; i < kSymptomInputs; ++i) {
        std::vector<double> d = symptom.degrees(padded[i]);
        for (int s = 0; s < kSeverityCount; ++s) {
            out[i][s] = d[s];
        }
    }
    return out;
}
