#include "triage/manchester_triage.hpp"

#include "triage/linguistic.hpp"

TriageVerdict makeVerdict(TriageCategory category, const CategoryTable<double>& waitTargets) {
    TriageVerdict v;
    v.category = category;
    v.priority = categoryPriority(category);
    v.targetWaitMinutes = waitTargets[categoryIndex(category)];
    v.fuzzyScore = static_cast<double>(v.priority);
    v.confidence = 1.0;
    return v;
}

ManchesterTriage::ManchesterTriage(const Config& cfg)
    : ManchesterTriage(FuzzyInferenceEngine(cfg.fuzzyOutputStep),
                       FlowchartSelector(),
                       SeverityPolicy::standard(),
                       cfg.waitTargetMinutes) {}

ManchesterTriage::ManchesterTriage(FuzzyInferenceEngine engine,
                                   FlowchartSelector selector,
                                   SeverityPolicy policy,
                                   CategoryTable<double> waitTargets)
    : engine_(std::move(engine)),
      selector_(std::move(selector)),
      policy_(std::move(policy)),
      waitTargets_(waitTargets) {}

TriageVerdict ManchesterTriage::verdictFor(const std::vector<double>& values,
                                           const std::string& flowchart) const {
    InferenceResult r = engine_.evaluate(values);
    TriageVerdict v = makeVerdict(r.category, waitTargets_);
    v.fuzzyScore = r.score;
    v.confidence = r.confidence;
    v.flowchart = flowchart;
    return v;
}

TriageVerdict ManchesterTriage::assess(const Patient& patient) {
    const Flowchart& chart = selector_.select(patient.chiefComplaint(), patient.age());
    std::vector<double> values;
    values.reserve(chart.symptoms.size());
    for (const auto& symptom : chart.symptoms) {
        values.push_back(severityValue(policy_.assess(symptom, patient.record())));
    }
    return verdictFor(values, chart.name);
}

TriageVerdict ManchesterTriage::assessSymptoms(const std::string& flowchart,
                                               const std::map<std::string, std::string>& symptoms) const {
    const Flowchart* chart = selector_.find(flowchart);
    if (!chart) {
        chart = &selector_.fallback();
    }
    std::vector<double> values;
    values.reserve(chart->symptoms.size());
    for (const auto& symptom : chart->symptoms) {
        auto it = symptoms.find(symptom);
        values.push_back(it == symptoms.end() ? 0.0 : linguisticToNumeric(it->second));
    }
    return verdictFor(values, chart->name);
}
