#pragma once

#include <string>
#include <vector>

#include "model/types.hpp"

/** @brief Number of symptom inputs the fuzzy engine consumes. */
constexpr int kSymptomInputs = 5;

/** @brief Lower and upper bound of the symptom universe. */
constexpr double kSymptomMin = 0.0;
constexpr double kSymptomMax = 10.0;

/**
 * @brief Fixed numeric value of a severity word:
 * none=0, mild=2, moderate=5, severe=8, very_severe=10.
 */
double severityValue(Severity s);

/**
 * @brief Parse "none", "mild", "moderate", "severe", "very_severe"
 * (case-insensitive, spaces or dashes accepted in place of '_').
 * @return false for unknown words; out is left untouched.
 */
bool parseSeverity(const std::string& word, Severity& out);

/** @brief Numeric value of a word; unknown words count as none (0). */
double linguisticToNumeric(const std::string& word);

/** @brief Severity whose constant lies nearest to value (ties go to the more severe). */
Severity numericToSeverity(double value);

/** @brief Convert a list of words, keeping order. */
std::vector<double> toNumeric(const std::vector<std::string>& words);

/**
 * @brief Zero-pad or truncate to exactly kSymptomInputs entries.
 */
std::vector<double> padSymptoms(std::vector<double> values);
