#pragma once

#include <array>
#include <string>
#include <vector>

#include "model/types.hpp"
#include "triage/linguistic.hpp"

/**
 * @brief Triangular or trapezoidal membership function.
 *
 * Triangles use (a, b, c) with peak at b; a == b or b == c give a
 * right-angled shoulder. Trapezoids use (a, b, c, d) with plateau [b, c].
 */
struct MembershipFunction {
    enum class Shape { Triangle, Trapezoid };

    Shape shape;
    double a;
    double b;
    double c;
    double d;

    static MembershipFunction triangle(double a, double b, double c);
    static MembershipFunction trapezoid(double a, double b, double c, double d);

    /** @brief Degree of membership in [0, 1]. */
    double degree(double x) const;
};

/** @brief One named set of a fuzzy variable. */
struct FuzzyTerm {
    std::string name;
    MembershipFunction function;
};

/**
 * @brief Variable over a bounded universe with named fuzzy sets.
 */
class FuzzyVariable {
public:
    FuzzyVariable(std::string name, double lo, double hi, std::vector<FuzzyTerm> terms);

    const std::string& name() const { return name_; }
    double lo() const { return lo_; }
    double hi() const { return hi_; }
    const std::vector<FuzzyTerm>& terms() const { return terms_; }

    /** @brief Degree of every term at x; x is clamped into the universe first. */
    std::vector<double> degrees(double x) const;

    /**
     * @brief Degree of one term.
     * @throws std::out_of_range for an unknown term index.
     */
    double degree(size_t term, double x) const;

private:
    std::string name_;
    double lo_;
    double hi_;
    std::vector<FuzzyTerm> terms_;
};

/** @brief Memberships of every symptom input, indexed [input][Severity]. */
using FuzzifiedInputs = std::array<std::array<double, kSeverityCount>, kSymptomInputs>;

/**
 * @brief Symptom input over [0, 10] with five evenly spaced sets
 * none/mild/moderate/severe/very_severe (shoulders at the extremes).
 */
FuzzyVariable makeSymptomVariable(const std::string& name);

/**
 * @brief Output "triage score" over [1, 5]: one triangle per category,
 * RED peaking at 1 through BLUE peaking at 5.
 */
FuzzyVariable makeTriageScoreVariable();

/** @brief Fuzzify a padded 5-value symptom vector. */
FuzzifiedInputs fuzzifySymptoms(const std::vector<double>& padded);
