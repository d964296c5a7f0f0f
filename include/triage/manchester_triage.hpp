#pragma once

#include <map>
#include <string>

#include "model/config.hpp"
#include "model/patient.hpp"
#include "triage/flowchart.hpp"
#include "triage/inference_engine.hpp"
#include "triage/severity_policy.hpp"
#include "triage/triage_system.hpp"

/**
 * @brief Fuzzy Manchester triage: flowchart, symptom severities, inference.
 */
class ManchesterTriage : public TriageSystem {
public:
    /** @brief Default flowcharts, standard severity policy, targets from cfg. */
    explicit ManchesterTriage(const Config& cfg);

    ManchesterTriage(FuzzyInferenceEngine engine,
                     FlowchartSelector selector,
                     SeverityPolicy policy,
                     CategoryTable<double> waitTargets);

    TriageVerdict assess(const Patient& patient) override;

    const char* name() const override { return "manchester_fuzzy"; }

    /**
     * @brief Triage from an explicit flowchart and linguistic symptom inputs.
     *
     * Unknown flowchart names use the fallback flowchart; symptoms that are
     * missing or carry unknown words count as none.
     */
    TriageVerdict assessSymptoms(const std::string& flowchart,
                                 const std::map<std::string, std::string>& symptoms) const;

    /** @brief Verdict for a numeric symptom vector (padded to five). */
    TriageVerdict verdictFor(const std::vector<double>& values, const std::string& flowchart) const;

    const FuzzyInferenceEngine& engine() const { return engine_; }
    const FlowchartSelector& selector() const { return selector_; }
    const SeverityPolicy& policy() const { return policy_; }

private:
    FuzzyInferenceEngine engine_;
    FlowchartSelector selector_;
    SeverityPolicy policy_;
    CategoryTable<double> waitTargets_;
};

/** @brief Verdict fields that follow from the category alone. */
TriageVerdict makeVerdict(TriageCategory category, const CategoryTable<double>& waitTargets);
