#include "triage/rule_base.hpp"

#include <algorithm>
#include <stdexcept>

RuleExpr::RuleExpr(Op op, int symptom, Severity term, std::vector<RuleExpr> children)
    : op_(op), symptom_(symptom), term_(term), children_(std::move(children)) {}

RuleExpr RuleExpr::is(int symptom, Severity term) {
    if (symptom < 0 || symptom >= kSymptomInputs) {
        throw std::out_of_range("rule refers to symptom " + std::to_string(symptom));
    }
    return RuleExpr(Op::Is, symptom, term, {});
}

RuleExpr RuleExpr::allOf(std::vector<RuleExpr> children) {
    if (children.empty()) {
        throw std::invalid_argument("AND needs at least one operand");
    }
    return RuleExpr(Op::And, -1, Severity::None, std::move(children));
}

RuleExpr RuleExpr::anyOf(std::vector<RuleExpr> children) {
    if (children.empty()) {
        throw std::invalid_argument("OR needs at least one operand");
    }
    return RuleExpr(Op::Or, -1, Severity::None, std::move(children));
}

RuleExpr RuleExpr::negate(RuleExpr child) {
    std::vector<RuleExpr> children;
    children.push_back(std::move(child));
    return RuleExpr(Op::Not, -1, Severity::None, std::move(children));
}

double RuleExpr::evaluate(const FuzzifiedInputs& in) const {
    switch (op_) {
        case Op::Is:
            return in[symptom_][static_cast<int>(term_)];
        case Op::And: {
            double v = 1.0;
            for (const auto& c : children_) v = std::min(v, c.evaluate(in));
            return v;
        }
        case Op::Or: {
            double v = 0.0;
            for (const auto& c : children_) v = std::max(v, c.evaluate(in));
            return v;
        }
        case Op::Not:
            return 1.0 - children_.front().evaluate(in);
    }
    throw std::logic_error("unknown rule operator");
}

namespace {
std::vector<std::vector<int>> combinations(int n, int k) {
    std::vector<std::vector<int>> out;
    // Lexicographic k-subsets of [0, n).
    std::vector<int> idx(k);
    for (int i = 0; i < k; ++i) idx[i] = i;
    while (true) {
        out.push_back(idx);
        int i = k - 1;
        while (i >= 0 && idx[i] == n - k + i) --i;
        if (i < 0) break;
        ++idx[i];
        for (int j = i + 1; j < k; ++j) idx[j] = idx[j - 1] + 1;
    }
    return out;
}

RuleExpr anySymptom(Severity term) {
    std::vector<RuleExpr> leaves;
    for (int i = 0; i < kSymptomInputs; ++i) leaves.push_back(RuleExpr::is(i, term));
    return RuleExpr::anyOf(std::move(leaves));
}

RuleExpr allSymptoms(Severity term) {
    std::vector<RuleExpr> leaves;
    for (int i = 0; i < kSymptomInputs; ++i) leaves.push_back(RuleExpr::is(i, term));
    return RuleExpr::allOf(std::move(leaves));
}

RuleExpr combination(const std::vector<int>& symptoms, Severity term) {
    std::vector<RuleExpr> leaves;
    for (int s : symptoms) leaves.push_back(RuleExpr::is(s, term));
    return RuleExpr::allOf(std::move(leaves));
}

std::string comboName(const char* prefix, const std::vector<int>& symptoms) {
    std::string out = prefix;
    for (int s : symptoms) out += "_" + std::to_string(s);
    return out;
}

struct RawRule {
    std::string name;
    RuleExpr expr;
};
} // namespace

RuleBase RuleBase::manchester() {
    CategoryTable<std::vector<RawRule>> raw;
    auto& red = raw[categoryIndex(TriageCategory::Red)];
    auto& orange = raw[categoryIndex(TriageCategory::Orange)];
    auto& yellow = raw[categoryIndex(TriageCategory::Yellow)];
    auto& green = raw[categoryIndex(TriageCategory::Green)];
    auto& blue = raw[categoryIndex(TriageCategory::Blue)];

    red.push_back({"any_very_severe", anySymptom(Severity::VerySevere)});
    for (const auto& c : combinations(kSymptomInputs, 3)) {
        red.push_back({comboName("severe", c), combination(c, Severity::Severe)});
    }
    for (const auto& c : combinations(kSymptomInputs, 2)) {
        orange.push_back({comboName("severe", c), combination(c, Severity::Severe)});
    }
    yellow.push_back({"any_severe", anySymptom(Severity::Severe)});
    for (const auto& c : combinations(kSymptomInputs, 3)) {
        yellow.push_back({comboName("moderate", c), combination(c, Severity::Moderate)});
    }
    green.push_back({"any_moderate", anySymptom(Severity::Moderate)});
    blue.push_back({"any_mild", anySymptom(Severity::Mild)});
    blue.push_back({"all_none", allSymptoms(Severity::None)});

    RuleBase base;
    std::vector<RuleExpr> moreUrgent;
    for (int k = 0; k < kCategoryCount; ++k) {
        TriageCategory cat = categoryFromIndex(k);
        for (const auto& r : raw[k]) {
            if (moreUrgent.empty()) {
                base.add(FuzzyRule{r.name, r.expr, cat});
            } else {
                RuleExpr gated = RuleExpr::allOf({r.expr, RuleExpr::negate(RuleExpr::anyOf(moreUrgent))});
                base.add(FuzzyRule{r.name, std::move(gated), cat});
            }
        }
        for (const auto& r : raw[k]) {
            moreUrgent.push_back(r.expr);
        }
    }
    return base;
}

void RuleBase::add(FuzzyRule rule) {
    rules_.push_back(std::move(rule));
}

std::vector<const FuzzyRule*> RuleBase::rulesFor(TriageCategory c) const {
    std::vector<const FuzzyRule*> out;
    for (const auto& r : rules_) {
        if (r.consequent == c) out.push_back(&r);
    }
    return out;
}

CategoryTable<double> RuleBase::fire(const FuzzifiedInputs& in) const {
    CategoryTable<double> strength{};
    for (const auto& r : rules_) {
        int k = categoryIndex(r.consequent);
        strength[k] = std::max(strength[k], r.antecedent.evaluate(in));
    }
    return strength;
}
