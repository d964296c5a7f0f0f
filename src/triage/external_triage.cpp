#include "triage/external_triage.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "logging/logger.hpp"

bool parseWaitMinutes(const std::string& text, double& minutes) {
    std::string s;
    for (unsigned char ch : text) {
        s.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (s.find("immediate") != std::string::npos) {
        minutes = 0.0;
        return true;
    }
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &used);
    } catch (const std::exception&) {
        return false;
    }
    if (value < 0) {
        return false;
    }
    std::string unit = s.substr(used);
    unit.erase(std::remove_if(unit.begin(), unit.end(),
                              [](unsigned char ch) { return std::isspace(ch) != 0; }),
               unit.end());
    if (unit.empty() || unit.rfind("min", 0) == 0 || unit == "m") {
        minutes = value;
        return true;
    }
    if (unit.rfind("h", 0) == 0) {
        minutes = value * 60.0;
        return true;
    }
    return false;
}

ExternalTriage::ExternalTriage(Callback callback, TriageSystem& fallback, CategoryTable<double> waitTargets)
    : callback_(std::move(callback)), fallback_(fallback), waitTargets_(waitTargets) {}

TriageVerdict ExternalTriage::fallbackVerdict(const Patient& patient, const std::string& reason) {
    ++fallbacks_;
    logEvent(Role::Triage, patient.statusSince(),
             "External triage rejected for patient " + std::to_string(patient.id()) + ": " + reason +
             "; using " + fallback_.name());
    return fallback_.assess(patient);
}

TriageVerdict ExternalTriage::assess(const Patient& patient) {
    if (!callback_) {
        return fallbackVerdict(patient, "no callback");
    }
    ExternalVerdict raw;
    try {
        raw = callback_(patient);
    } catch (const std::exception& e) {
        return fallbackVerdict(patient, std::string("callback failed: ") + e.what());
    }

    TriageCategory category;
    if (!parseCategory(raw.category, category)) {
        return fallbackVerdict(patient, "unknown category '" + raw.category + "'");
    }
    if (raw.priority < 1 || raw.priority > kCategoryCount) {
        return fallbackVerdict(patient, "priority out of range: " + std::to_string(raw.priority));
    }
    if (raw.priority != categoryPriority(category)) {
        return fallbackVerdict(patient, "priority " + std::to_string(raw.priority) +
                                        " contradicts category " + categoryName(category));
    }

    TriageVerdict v;
    v.category = category;
    v.priority = raw.priority;
    v.fuzzyScore = static_cast<double>(raw.priority);
    v.flowchart = name();
    v.confidence = 1.0;
    double wait = 0.0;
    v.targetWaitMinutes = parseWaitMinutes(raw.waitTime, wait) ? wait : waitTargets_[categoryIndex(category)];
    return v;
}
