/**
 * @file test_config.cpp
 * @brief Test: config file parsing, validation and time-of-day arrival rates.
 */

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

#include "model/config.hpp"
#include "roles/patient_generator.hpp"

static int failures = 0;

static void check(bool ok, const char* what) {
    if (!ok) {
        printf("  FAIL: %s\n", what);
        ++failures;
    }
}

static std::string writeTemp(const std::string& name, const std::string& body) {
    std::string path = "/tmp/edsim_test_" + name + ".cfg";
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}

static void testDefaults() {
    Config cfg = defaultConfig();
    std::string err;
    check(validateConfig(cfg, err), "defaults are valid");
    check(cfg.waitTargetMinutes[0] == 0.0 && cfg.waitTargetMinutes[4] == 240.0, "default wait targets");
    check(cfg.fuzzyOutputStep == 1.0, "default output step");
    check(std::string(arrivalPatternName(cfg.arrivalPattern)) == "constant", "default pattern");
}

static void testParseFile() {
    std::string path = writeTemp("good",
        "# emergency department\n"
        "\n"
        "simulationDurationMinutes = 600\n"
        "warmupMinutes=30\n"
        "doctors = 2\n"
        "arrivalPattern = day_night\n"
        "peakStartHour = 22\n"
        "peakEndHour = 6\n"
        "waitTarget.YELLOW = 45\n"
        "admitProb.blue = 0\n"
        "someFutureKey = 1\n"
        "logPath = /tmp/edsim.log\n");
    Config cfg;
    std::string err;
    bool ok = parseConfigFile(path, cfg, err);
    check(ok, "well-formed file parses");
    if (!ok) printf("    %s\n", err.c_str());
    check(cfg.simulationDurationMinutes == 600.0, "duration read");
    check(cfg.warmupMinutes == 30.0, "warm-up read without spaces");
    check(cfg.doctors == 2, "doctors read");
    check(cfg.cubicles == defaultConfig().cubicles, "missing keys keep defaults");
    check(cfg.arrivalPattern == ArrivalPattern::DayNight, "pattern read");
    check(cfg.waitTargetMinutes[2] == 45.0, "per-category key");
    check(cfg.admitProbability[4] == 0.0, "category label is case-insensitive");
    check(cfg.logPath == "/tmp/edsim.log", "string value read");
    std::remove(path.c_str());
}

static void testParseErrors() {
    Config cfg;
    std::string err;

    std::string path = writeTemp("bad_value", "doctors = four\n");
    check(!parseConfigFile(path, cfg, err), "non-numeric value rejected");
    check(err.find("doctors") != std::string::npos, "error names the key");
    std::remove(path.c_str());

    path = writeTemp("trailing", "doctors = 4x\n");
    check(!parseConfigFile(path, cfg, err), "trailing characters rejected");
    std::remove(path.c_str());

    path = writeTemp("no_equals", "doctors 4\n");
    err.clear();
    check(!parseConfigFile(path, cfg, err), "line without '=' rejected");
    check(err.find("Line 1") != std::string::npos, "error names the line");
    std::remove(path.c_str());

    path = writeTemp("bad_pattern", "arrivalPattern = weekly\n");
    check(!parseConfigFile(path, cfg, err), "unknown pattern rejected");
    std::remove(path.c_str());

    path = writeTemp("invalid", "cubicles = 0\n");
    check(!parseConfigFile(path, cfg, err), "parsed file still validated");
    std::remove(path.c_str());

    check(!parseConfigFile("/tmp/edsim_test_missing_file.cfg", cfg, err), "missing file rejected");
    check(err.find("Cannot open") != std::string::npos, "missing file message");
}

static void testValidation() {
    std::string err;

    Config cfg = defaultConfig();
    cfg.doctors = 0;
    check(!validateConfig(cfg, err), "zero doctors rejected");

    cfg = defaultConfig();
    cfg.waitTargetMinutes[3] = 30.0;
    check(!validateConfig(cfg, err), "non-ascending wait targets rejected");

    cfg = defaultConfig();
    cfg.admitProbability[0] = 1.2;
    check(!validateConfig(cfg, err), "probability above one rejected");

    cfg = defaultConfig();
    cfg.warmupMinutes = cfg.simulationDurationMinutes;
    check(!validateConfig(cfg, err), "warm-up covering the whole run rejected");

    cfg = defaultConfig();
    cfg.fuzzyOutputStep = 0.0;
    check(!validateConfig(cfg, err), "output step 0 rejected");
    cfg.fuzzyOutputStep = 0.5;
    check(!validateConfig(cfg, err), "fractional output step rejected");

    cfg = defaultConfig();
    cfg.arrivalRatePerHour = 0.0;
    check(validateConfig(cfg, err), "rate 0 is allowed");
}

static void testNonFiniteValues() {
    const char* lines[] = {
        "admitProb.RED = nan\n",
        "arrivalRatePerHour = inf\n",
        "simulationDurationMinutes = nan\n",
        "waitTarget.ORANGE = NaN\n",
        "bedHoldMean = -inf\n",
    };
    int rejected = 0;
    for (const char* line : lines) {
        std::string path = writeTemp("non_finite", line);
        Config cfg;
        std::string err;
        if (!parseConfigFile(path, cfg, err)) ++rejected;
        std::remove(path.c_str());
    }
    check(rejected == 5, "nan and inf values rejected in files");

    std::string err;
    Config cfg = defaultConfig();
    cfg.admitProbability[0] = std::nan("");
    check(!validateConfig(cfg, err), "NaN probability rejected");
    check(err.find("admitProb.RED") != std::string::npos, "error names the field");

    cfg = defaultConfig();
    cfg.simulationDurationMinutes = std::numeric_limits<double>::infinity();
    check(!validateConfig(cfg, err), "infinite duration rejected");

    cfg = defaultConfig();
    cfg.triageDelayStd = std::nan("");
    check(!validateConfig(cfg, err), "NaN spread rejected");
}

static void testRateFactor() {
    Config cfg = defaultConfig();
    check(ArrivalProcess::rateFactor(cfg, 123.0) == 1.0, "constant pattern");

    cfg.arrivalPattern = ArrivalPattern::DayNight;
    cfg.peakStartHour = 8;
    cfg.peakEndHour = 20;
    check(ArrivalProcess::rateFactor(cfg, 9 * 60.0) == cfg.peakFactor, "09:00 is peak");
    check(ArrivalProcess::rateFactor(cfg, 20 * 60.0) == cfg.offPeakFactor, "20:00 is off-peak");
    check(ArrivalProcess::rateFactor(cfg, (24 + 10) * 60.0) == cfg.peakFactor, "second day wraps");

    cfg.peakStartHour = 22;
    cfg.peakEndHour = 6;
    check(ArrivalProcess::rateFactor(cfg, 23 * 60.0) == cfg.peakFactor, "window over midnight, late");
    check(ArrivalProcess::rateFactor(cfg, 2 * 60.0) == cfg.peakFactor, "window over midnight, early");
    check(ArrivalProcess::rateFactor(cfg, 12 * 60.0) == cfg.offPeakFactor, "window over midnight, noon");
}

int main() {
    printf("[test_config] START\n");
    testDefaults();
    testParseFile();
    testParseErrors();
    testValidation();
    testNonFiniteValues();
    testRateFactor();
    if (failures > 0) {
        printf("[test_config] FAIL\n");
        return 1;
    }
    printf("[test_config] PASS\n");
    return 0;
}
