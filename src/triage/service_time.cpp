#include "triage/service_time.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace {
const char* const kComplexComplaints[] = {
    "chest pain", "difficulty breathing", "abdominal pain", "head injury",
};
} // namespace

ServiceTimeModel::ServiceTimeModel(const Config& cfg)
    : ServiceTimeModel(cfg.consultMeanMinutes, cfg.consultStdMinutes) {}

ServiceTimeModel::ServiceTimeModel(CategoryTable<double> means, CategoryTable<double> stddevs)
    : means_(means), stddevs_(stddevs) {}

double ServiceTimeModel::estimate(TriageCategory category) const {
    return means_[categoryIndex(category)];
}

double ServiceTimeModel::complexity(const Patient& patient) {
    double multiplier = 1.0;
    int age = patient.age();
    if (age >= 0 && age < 2) {
        multiplier += 0.3;
    } else if (age > 75) {
        multiplier += 0.2;
    }
    if (!patient.record().history.empty()) {
        multiplier += 0.1;
    }
    std::string complaint = patient.chiefComplaint();
    std::transform(complaint.begin(), complaint.end(), complaint.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (const char* term : kComplexComplaints) {
        if (complaint.find(term) != std::string::npos) {
            multiplier += 0.2;
            break;
        }
    }
    return multiplier;
}

double ServiceTimeModel::sample(const Patient& patient, TriageCategory category, RandomGenerator& rng) const {
    int idx = categoryIndex(category);
    double base = rng.normal(means_[idx], stddevs_[idx]);
    return std::max(kMinConsultationMinutes, base * complexity(patient));
}
