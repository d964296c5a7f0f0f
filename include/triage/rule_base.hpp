#pragma once

#include <string>
#include <vector>

#include "model/types.hpp"
#include "triage/fuzzy_variables.hpp"

/**
 * @brief Small fuzzy-logic expression tree.
 *
 * AND = min, OR = max, NOT = 1 - x over the memberships "symptom i is term".
 */
class RuleExpr {
public:
    enum class Op { Is, And, Or, Not };

    /** @brief Leaf: degree to which input `symptom` is `term`. */
    static RuleExpr is(int symptom, Severity term);
    static RuleExpr allOf(std::vector<RuleExpr> children);
    static RuleExpr anyOf(std::vector<RuleExpr> children);
    static RuleExpr negate(RuleExpr child);

    Op op() const { return op_; }
    const std::vector<RuleExpr>& children() const { return children_; }

    /** @brief Firing strength in [0, 1]. */
    double evaluate(const FuzzifiedInputs& in) const;

private:
    RuleExpr(Op op, int symptom, Severity term, std::vector<RuleExpr> children);

    Op op_;
    int symptom_;
    Severity term_;
    std::vector<RuleExpr> children_;
};

/** @brief IF antecedent THEN triage score is consequent. */
struct FuzzyRule {
    std::string name;
    RuleExpr antecedent;
    TriageCategory consequent;
};

/**
 * @brief Ordered collection of fuzzy rules with max aggregation per category.
 */
class RuleBase {
public:
    RuleBase() = default;

    /**
     * @brief Manchester triage rule set.
     *
     * RED: any very_severe, or any three severe.
     * ORANGE: any two severe.
     * YELLOW: any severe, or any three moderate.
     * GREEN: any moderate.
     * BLUE: any mild, or all none.
     * Every rule of a category is gated by NOT(any antecedent of a more
     * urgent category), so a more alarming input can only raise urgency.
     */
    static RuleBase manchester();

    void add(FuzzyRule rule);

    const std::vector<FuzzyRule>& rules() const { return rules_; }

    /** @brief Rules whose consequent is c. */
    std::vector<const FuzzyRule*> rulesFor(TriageCategory c) const;

    /** @brief Aggregated firing strength per category (max over its rules). */
    CategoryTable<double> fire(const FuzzifiedInputs& in) const;

private:
    std::vector<FuzzyRule> rules_;
};
