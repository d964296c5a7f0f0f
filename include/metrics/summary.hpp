#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "model/types.hpp"

/**
 * @brief Descriptive statistics of one sample (all zero when empty).
 */
struct DistributionStats {
    int count{0};
    double mean{0.0};
    double median{0.0};
    double stddev{0.0};   // population standard deviation
    double min{0.0};
    double max{0.0};
    double p95{0.0};
};

/** @brief Statistics of values; percentiles interpolate linearly between ranks. */
DistributionStats summarizeDistribution(std::vector<double> values);

/** @brief Linear-interpolated percentile of sorted values, q in [0, 100]. */
double percentileOfSorted(const std::vector<double>& sorted, double q);

struct PoolStats {
    std::string name;
    int capacity{0};
    int peakHeld{0};
    double averageUtilization{0.0};
};

/**
 * @brief Everything the end-of-run summary prints.
 */
struct SummaryPayload {
    double simulationDurationMinutes{0.0};
    double warmupMinutes{0.0};
    unsigned int randomSeed{0};
    std::string triageSystem;
    std::string arrivalPattern;
    double arrivalRatePerHour{0.0};

    int totalArrivals{0};
    int totalDepartures{0};
    int admitted{0};
    int discharged{0};
    int leftWithoutBeingSeen{0};
    int stillInSystem{0};
    double admissionRate{0.0};
    double lwbsRate{0.0};

    CategoryTable<int> triaged{};
    CategoryTable<DistributionStats> waitByCategory{};
    CategoryTable<int> waitTargetBreaches{};
    CategoryTable<double> waitTargetMinutes{};
    DistributionStats consultation;
    DistributionStats systemTime;
    int fourHourBreaches{0};

    std::vector<PoolStats> pools;
    int snapshotCount{0};
    int peakPatientsInSystem{0};
    CategoryTable<int> peakQueueLengths{};
};

/**
 * @brief Render the summary as plain text.
 * @return false if the stream went bad while writing.
 */
bool writeSummaryText(const SummaryPayload& payload, std::ostream& out);

/**
 * @brief Write the summary to a file (truncating).
 * @return false if the file could not be opened or written.
 */
bool writeSummary(const SummaryPayload& payload, const std::string& path);
