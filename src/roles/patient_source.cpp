#include "roles/patient_source.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
struct AgeBand {
    double weight;
    double mean;
    double stddev;
    double min;
    double max;
};

const AgeBand kAgeBands[] = {
    {0.15, 5.0, 2.0, 0.0, 18.0},     // paediatric
    {0.50, 35.0, 15.0, 18.0, 65.0},  // adult
    {0.35, 75.0, 8.0, 65.0, 100.0},  // elderly
};

struct VitalProfile {
    const char* name;
    double normalMean;
    double normalStd;
    double abnormalProb;
    double highMean;
    double highStd;
    double lowMean;
    double lowStd;
};

const VitalProfile kVitals[] = {
    {"systolic_bp", 120.0, 15.0, 0.25, 160.0, 20.0, 85.0, 10.0},
    {"heart_rate", 75.0, 12.0, 0.20, 110.0, 15.0, 55.0, 8.0},
    {"respiratory_rate", 16.0, 3.0, 0.15, 24.0, 4.0, 10.0, 2.0},
    {"temperature", 36.8, 0.5, 0.30, 38.5, 0.8, 35.5, 0.5},
    {"oxygen_saturation", 98.0, 2.0, 0.10, 102.0, 0.0, 92.0, 3.0},
};

constexpr double kHistoryProbability = 0.40;

// Children and the elderly have different resting vitals.
double adjustForAge(const std::string& vital, double value, int age) {
    if (age < 18) {
        if (vital == "heart_rate") {
            if (age < 2) return value + 40;
            if (age < 12) return value + 20;
        } else if (vital == "respiratory_rate") {
            if (age < 2) return value + 14;
            if (age < 12) return value + 6;
        } else if (vital == "systolic_bp" && age < 12) {
            return value - 20;
        }
    } else if (age > 65 && vital == "systolic_bp") {
        return value + 10;
    }
    return value;
}
} // namespace

SyntheticPatientSource::SyntheticPatientSource()
    : complaints_{
          {"chest pain", 0.15},
          {"difficulty breathing", 0.12},
          {"abdominal pain", 0.10},
          {"head injury", 0.08},
          {"fever", 0.08},
          {"nausea and vomiting", 0.07},
          {"back pain", 0.06},
          {"wound/laceration", 0.06},
          {"dizziness", 0.05},
          {"allergic reaction", 0.04},
          {"anxiety", 0.04},
          {"cold symptoms", 0.03},
          {"skin rash", 0.03},
          {"joint pain", 0.03},
          {"other", 0.06},
      },
      conditions_{
          {"diabetes", 0.174},
          {"hypertension", 0.261},
          {"heart disease", 0.116},
          {"asthma", 0.145},
          {"copd", 0.087},
          {"cancer", 0.058},
          {"kidney disease", 0.043},
          {"mental health", 0.116},
      } {}

int SyntheticPatientSource::drawAge(RandomGenerator& rng) const {
    std::vector<double> weights;
    for (const auto& band : kAgeBands) weights.push_back(band.weight);
    const AgeBand& band = kAgeBands[rng.weightedIndex(weights)];
    return static_cast<int>(rng.clampedNormal(band.mean, band.stddev, band.min, band.max));
}

void SyntheticPatientSource::drawVitals(PatientRecord& record, RandomGenerator& rng) const {
    for (const auto& v : kVitals) {
        double value;
        if (rng.bernoulli(v.abnormalProb)) {
            // SpO2 has no high abnormal range: its "high" draw is a fixed 102, capped to 100 below.
            value = rng.bernoulli(0.5) ? rng.normal(v.highMean, v.highStd)
                                       : rng.normal(v.lowMean, v.lowStd);
        } else {
            value = rng.normal(v.normalMean, v.normalStd);
        }
        value = adjustForAge(v.name, value, record.age);
        std::string name = v.name;
        if (name == "temperature") {
            value = std::round(value * 10.0) / 10.0;
        } else {
            value = std::round(value);
        }
        if (name == "oxygen_saturation") {
            value = std::min(value, 100.0);
        }
        record.vitals[name] = value;
    }
    record.vitals["pain_score"] = std::round(rng.clampedNormal(4.0, 2.5, 0.0, 10.0));
}

void SyntheticPatientSource::drawHistory(PatientRecord& record, RandomGenerator& rng) const {
    if (!rng.bernoulli(kHistoryProbability)) {
        return;
    }
    std::vector<double> weights;
    for (const auto& c : conditions_) weights.push_back(c.second);
    int count = 1 + rng.weightedIndex({0.6, 0.3, 0.1});
    for (int i = 0; i < count; ++i) {
        const std::string& condition = conditions_[rng.weightedIndex(weights)].first;
        if (std::find(record.history.begin(), record.history.end(), condition) == record.history.end()) {
            record.history.push_back(condition);
        }
    }
}

PatientRecord SyntheticPatientSource::next(RandomGenerator& rng) {
    PatientRecord record;
    record.age = drawAge(rng);
    record.gender = rng.bernoulli(0.48) ? "male" : "female";
    std::vector<double> weights;
    for (const auto& c : complaints_) weights.push_back(c.second);
    record.chiefComplaint = complaints_[rng.weightedIndex(weights)].first;
    drawVitals(record, rng);
    drawHistory(record, rng);
    return record;
}

ScriptedPatientSource::ScriptedPatientSource(std::vector<PatientRecord> records)
    : records_(std::move(records)) {
    if (records_.empty()) {
        throw std::invalid_argument("ScriptedPatientSource needs at least one record");
    }
}

PatientRecord ScriptedPatientSource::next(RandomGenerator&) {
    PatientRecord r = records_[cursor_];
    cursor_ = (cursor_ + 1) % records_.size();
    return r;
}
