#include "triage/severity_policy.hpp"

#include "triage/linguistic.hpp"

namespace {
VitalBand below(double threshold, Severity s) {
    return VitalBand{VitalBand::Direction::Below, threshold, s};
}

VitalBand atLeast(double threshold, Severity s) {
    return VitalBand{VitalBand::Direction::AtLeast, threshold, s};
}

VitalRule painRule() {
    return VitalRule{"pain_score",
                     {atLeast(8, Severity::VerySevere), atLeast(6, Severity::Severe),
                      atLeast(3, Severity::Moderate), atLeast(1, Severity::Mild)}};
}

VitalRule oxygenRule() {
    return VitalRule{"oxygen_saturation",
                     {below(85, Severity::VerySevere), below(90, Severity::Severe),
                      below(94, Severity::Moderate), below(96, Severity::Mild)}};
}

VitalRule temperatureRule() {
    return VitalRule{"temperature",
                     {atLeast(40.0, Severity::VerySevere), atLeast(39.5, Severity::Severe),
                      below(35.0, Severity::Severe), atLeast(38.5, Severity::Moderate),
                      atLeast(37.5, Severity::Mild)}};
}

VitalRule consciousnessRule() {
    return VitalRule{"gcs",
                     {below(9, Severity::VerySevere), below(13, Severity::Severe),
                      below(15, Severity::Moderate)}};
}

VitalRule bloodPressureRule() {
    return VitalRule{"systolic_bp",
                     {below(70, Severity::VerySevere), below(90, Severity::Severe),
                      below(100, Severity::Moderate)}};
}

VitalRule heartRateRule() {
    return VitalRule{"heart_rate",
                     {below(40, Severity::Severe), atLeast(150, Severity::Severe),
                      below(50, Severity::Moderate), atLeast(130, Severity::Moderate),
                      atLeast(110, Severity::Mild)}};
}

VitalRule respiratoryRateRule() {
    return VitalRule{"respiratory_rate",
                     {below(8, Severity::VerySevere), atLeast(35, Severity::Severe),
                      below(10, Severity::Severe), atLeast(25, Severity::Moderate),
                      atLeast(21, Severity::Mild)}};
}
} // namespace

SeverityPolicy SeverityPolicy::standard() {
    SeverityPolicy policy;
    for (const char* s : {"severe_pain", "pain", "pain_severity", "pain_intensity", "back_pain",
                          "neck_pain", "loin_pain", "chest_discomfort", "abdominal_pain"}) {
        policy.map(s, painRule());
    }
    for (const char* s : {"difficulty_breathing", "breathless", "breathlessness", "breathing_difficulty",
                          "low_sao2", "cyanosis", "breathing"}) {
        policy.map(s, oxygenRule());
    }
    for (const char* s : {"fever", "temperature", "rigors"}) {
        policy.map(s, temperatureRule());
    }
    for (const char* s : {"confusion", "altered_consciousness", "gcs_score", "consciousness_level",
                          "consciousness", "loss_of_consciousness", "unconscious"}) {
        policy.map(s, consciousnessRule());
    }
    for (const char* s : {"shock", "syncope", "pulse_quality", "pallor"}) {
        policy.map(s, bloodPressureRule());
    }
    policy.map("irregular_pulse", heartRateRule());
    for (const char* s : {"breathing_pattern", "respiratory_depression"}) {
        policy.map(s, respiratoryRateRule());
    }
    return policy;
}

void SeverityPolicy::map(const std::string& symptom, VitalRule rule) {
    rules_[symptom] = std::move(rule);
}

Severity SeverityPolicy::classify(const VitalRule& rule, double value) {
    for (const auto& band : rule.bands) {
        bool hit = band.direction == VitalBand::Direction::Below ? value < band.threshold
                                                                  : value >= band.threshold;
        if (hit) {
            return band.severity;
        }
    }
    return Severity::None;
}

Severity SeverityPolicy::assess(const std::string& symptom, const PatientRecord& record) const {
    auto reported = record.reportedSymptoms.find(symptom);
    if (reported != record.reportedSymptoms.end()) {
        Severity s = Severity::None;
        if (parseSeverity(reported->second, s)) {
            return s;
        }
    }
    auto rule = rules_.find(symptom);
    if (rule == rules_.end()) {
        return Severity::None;
    }
    auto vital = record.vitals.find(rule->second.vital);
    if (vital == record.vitals.end()) {
        return Severity::None;
    }
    return classify(rule->second, vital->second);
}
