#pragma once

#include <string>

#include "model/types.hpp"

/**
 * @brief Scalar run parameters. All times are simulated minutes.
 */
struct Config {
    double simulationDurationMinutes;
    double warmupMinutes;        // patients arriving earlier are excluded from statistics
    double arrivalEndMinutes;    // 0 means arrivals continue until the horizon
    unsigned int randomSeed;

    double arrivalRatePerHour;
    ArrivalPattern arrivalPattern;
    int peakStartHour;           // day_night: [peakStartHour, peakEndHour) uses peakFactor
    int peakEndHour;
    double peakFactor;
    double offPeakFactor;

    int triageNurses;
    int doctors;
    int cubicles;
    int beds;

    double triageDelayMean;
    double triageDelayStd;
    double triageDelayMin;

    double snapshotIntervalMinutes;
    double abandonCheckIntervalMinutes;
    double abandonPatienceMinutes;   // 0 disables abandonment

    double bedHoldMean;
    double bedHoldStd;

    double fuzzyOutputStep;          // discretization of the output universe [1, 5]; must be 1

    CategoryTable<double> waitTargetMinutes;
    CategoryTable<double> consultMeanMinutes;
    CategoryTable<double> consultStdMinutes;
    CategoryTable<double> admitProbability;

    std::string logPath;             // empty: timestamped ed_run_<epoch>.log
    std::string summaryPath;         // empty: timestamped ed_summary_<epoch>.txt
};

/** @brief Configuration with every key at its documented default. */
Config defaultConfig();

/**
 * @brief Load key=value pairs from a config file on top of defaultConfig().
 *
 * Blank lines and lines starting with '#' are skipped, unknown keys are ignored.
 * @param path path to config file.
 * @param cfg destination structure to fill.
 * @param err error message on failure.
 * @return true if parsed and validated, false otherwise.
 */
bool parseConfigFile(const std::string& path, Config& cfg, std::string& err);

/**
 * @brief Apply a single key=value assignment.
 * @return false with err set when the value is malformed.
 */
bool applyConfigValue(Config& cfg, const std::string& key, const std::string& value, std::string& err);

/**
 * @brief Reject configurations that cannot be simulated.
 * @return true when cfg is usable, false with err describing the first problem.
 */
bool validateConfig(const Config& cfg, std::string& err);

const char* arrivalPatternName(ArrivalPattern pattern);
