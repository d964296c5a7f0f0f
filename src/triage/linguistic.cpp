#include "triage/linguistic.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

double severityValue(Severity s) {
    switch (s) {
        case Severity::None: return 0.0;
        case Severity::Mild: return 2.0;
        case Severity::Moderate: return 5.0;
        case Severity::Severe: return 8.0;
        case Severity::VerySevere: return 10.0;
    }
    return 0.0;
}

bool parseSeverity(const std::string& word, Severity& out) {
    std::string norm;
    norm.reserve(word.size());
    for (unsigned char ch : word) {
        if (std::isspace(ch) && norm.empty()) continue;
        if (ch == ' ' || ch == '-') ch = '_';
        norm.push_back(static_cast<char>(std::tolower(ch)));
    }
    while (!norm.empty() && (norm.back() == '_' || std::isspace(static_cast<unsigned char>(norm.back())))) {
        norm.pop_back();
    }
    for (int i = 0; i < kSeverityCount; ++i) {
        Severity s = static_cast<Severity>(i);
        if (norm == severityName(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

double linguisticToNumeric(const std::string& word) {
    Severity s = Severity::None;
    if (!parseSeverity(word, s)) {
        return 0.0;
    }
    return severityValue(s);
}

Severity numericToSeverity(double value) {
    Severity best = Severity::None;
    double bestDist = std::abs(value - severityValue(best));
    for (int i = 1; i < kSeverityCount; ++i) {
        Severity s = static_cast<Severity>(i);
        double dist = std::abs(value - severityValue(s));
        if (dist <= bestDist) {
            best = s;
            bestDist = dist;
        }
    }
    return best;
}

std::vector<double> toNumeric(const std::vector<std::string>& words) {
    std::vector<double> out;
    out.reserve(words.size());
    for (const auto& w : words) {
        out.push_back(linguisticToNumeric(w));
    }
    return out;
}

std::vector<double> padSymptoms(std::vector<double> values) {
    // Extra values beyond the fifth are dropped.
    values.resize(kSymptomInputs, 0.0);
    return values;
}
