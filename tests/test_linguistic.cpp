/**
 * @file test_linguistic.cpp
 * @brief Test: severity words, numeric scale, padding and membership functions.
 */

#include <cmath>
#include <cstdio>
#include <vector>

#include "triage/fuzzy_variables.hpp"
#include "triage/linguistic.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

static void testScale() {
    check(severityValue(Severity::None) == 0.0, "none = 0");
    check(severityValue(Severity::Mild) == 2.0, "mild = 2");
    check(severityValue(Severity::Moderate) == 5.0, "moderate = 5");
    check(severityValue(Severity::Severe) == 8.0, "severe = 8");
    check(severityValue(Severity::VerySevere) == 10.0, "very_severe = 10");
}

static void testParse() {
    Severity s = Severity::None;
    check(parseSeverity("Very Severe", s) && s == Severity::VerySevere, "spaces and case ignored");
    check(parseSeverity("very-severe", s) && s == Severity::VerySevere, "dash accepted");
    check(parseSeverity("MODERATE", s) && s == Severity::Moderate, "upper case accepted");
    check(!parseSeverity("excruciating", s), "unknown word rejected");
    check(linguisticToNumeric("severe") == 8.0, "severe converts to 8");
    check(linguisticToNumeric("excruciating") == 0.0, "unknown word degrades to none");
    check(linguisticToNumeric("") == 0.0, "empty word degrades to none");

    std::vector<double> values = toNumeric({"mild", "bogus", "very_severe"});
    check(values == std::vector<double>({2.0, 0.0, 10.0}), "word list conversion");
}

static void testNearestSeverity() {
    check(numericToSeverity(0.4) == Severity::None, "0.4 -> none");
    check(numericToSeverity(3.5) == Severity::Moderate, "tie 3.5 -> moderate");
    check(numericToSeverity(7.0) == Severity::Severe, "7 -> severe");
    check(numericToSeverity(9.0) == Severity::VerySevere, "tie 9 -> very_severe");
    check(numericToSeverity(-3.0) == Severity::None, "below range -> none");
    check(numericToSeverity(42.0) == Severity::VerySevere, "above range -> very_severe");
}

static void testPadding() {
    std::vector<double> padded = padSymptoms({8.0, 5.0});
    check(padded == std::vector<double>({8.0, 5.0, 0.0, 0.0, 0.0}), "short vector zero-padded");
    check(padSymptoms({}).size() == 5, "empty vector padded");
    std::vector<double> truncated = padSymptoms({1, 2, 3, 4, 5, 6, 7});
    check(truncated == std::vector<double>({1, 2, 3, 4, 5}), "values beyond the fifth dropped");
}

static void testMemberships() {
    FuzzyVariable symptom = makeSymptomVariable("pain");
    check(symptom.terms().size() == 5, "five linguistic sets");
    bool partition = true;
    for (double x = 0.0; x <= 10.0; x += 0.25) {
        double sum = 0.0;
        for (double d : symptom.degrees(x)) sum += d;
        if (std::fabs(sum - 1.0) > 1e-9) partition = false;
    }
    check(partition, "degrees sum to one across the universe");

    check(symptom.degree(0, 0.0) == 1.0, "none peaks at 0");
    check(symptom.degree(4, 10.0) == 1.0, "very_severe peaks at 10");
    check(symptom.degree(2, 5.0) == 1.0, "moderate peaks at 5");
    check(std::fabs(symptom.degree(3, 8.0) - 0.8) < 1e-9, "severe(8) = 0.8");
    check(std::fabs(symptom.degree(4, 8.0) - 0.2) < 1e-9, "very_severe(8) = 0.2");
    check(symptom.degree(0, -5.0) == 1.0, "values below the universe are clamped");

    FuzzifiedInputs in = fuzzifySymptoms({10.0, 0.0, 5.0, 0.0, 0.0});
    check(in[0][4] == 1.0 && in[2][2] == 1.0 && in[1][0] == 1.0, "fuzzified rows");

    FuzzyVariable score = makeTriageScoreVariable();
    check(score.lo() == 1.0 && score.hi() == 5.0, "score universe is [1, 5]");
    check(score.degree(0, 1.0) == 1.0 && score.degree(4, 5.0) == 1.0, "RED at 1, BLUE at 5");
    check(std::fabs(score.degree(1, 2.5) - 0.5) < 1e-9, "ORANGE(2.5) = 0.5");
}

int main() {
    printf("[test_linguistic] START\n");
    testScale();
    testParse();
    testNearestSeverity();
    testPadding();
    testMemberships();
    if (failures > 0) {
        printf("[test_linguistic] FAIL\n");
        return 1;
    }
    printf("[test_linguistic] PASS\n");
    return 0;
}
