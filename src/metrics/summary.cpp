#include "metrics/summary.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>

#include "util/error.hpp"

double percentileOfSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    double rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = static_cast<size_t>(std::ceil(rank));
    double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

DistributionStats summarizeDistribution(std::vector<double> values) {
    DistributionStats stats;
    if (values.empty()) {
        return stats;
    }
    std::sort(values.begin(), values.end());
    double n = static_cast<double>(values.size());
    stats.count = static_cast<int>(values.size());
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    double sq = 0.0;
    for (double v : values) {
        sq += (v - stats.mean) * (v - stats.mean);
    }
    stats.stddev = std::sqrt(sq / n);
    stats.min = values.front();
    stats.max = values.back();
    stats.median = percentileOfSorted(values, 50.0);
    stats.p95 = percentileOfSorted(values, 95.0);
    return stats;
}

namespace {
void writeDistribution(std::ostream& out, const std::string& indent, const DistributionStats& d) {
    if (d.count == 0) {
        out << indent << "n=0\n";
        return;
    }
    out << indent << "n=" << d.count
        << " mean=" << d.mean
        << " median=" << d.median
        << " std=" << d.stddev
        << " min=" << d.min
        << " max=" << d.max
        << " p95=" << d.p95 << "\n";
}

double percent(double ratio) {
    return ratio * 100.0;
}
} // namespace

bool writeSummaryText(const SummaryPayload& payload, std::ostream& out) {
    out << std::fixed << std::setprecision(2);
    out << "ED Simulation Summary\n";
    out << "=====================\n";
    out << "Simulation duration (minutes): " << payload.simulationDurationMinutes << "\n";
    out << "Warm-up (minutes): " << payload.warmupMinutes << "\n";
    out << "Random seed: " << payload.randomSeed << "\n";
    out << "Triage system: " << payload.triageSystem << "\n";
    out << "Arrival pattern: " << payload.arrivalPattern << " at " << payload.arrivalRatePerHour << "/h\n";
    out << "Patients:\n";
    out << "  Arrivals:    " << payload.totalArrivals << "\n";
    out << "  Departures:  " << payload.totalDepartures << "\n";
    out << "  Admitted:    " << payload.admitted << "\n";
    out << "  Discharged:  " << payload.discharged << "\n";
    out << "  LWBS:        " << payload.leftWithoutBeingSeen << "\n";
    out << "  In system at end: " << payload.stillInSystem << "\n";
    out << "  Admission rate: " << percent(payload.admissionRate) << "%\n";
    out << "  LWBS rate:      " << percent(payload.lwbsRate) << "%\n";
    out << "Triage categories:\n";
    for (int i = 0; i < kCategoryCount; ++i) {
        out << "  " << std::left << std::setw(7) << categoryName(categoryFromIndex(i)) << std::right
            << payload.triaged[i] << "\n";
    }
    out << "Wait for consultation by category (minutes):\n";
    for (int i = 0; i < kCategoryCount; ++i) {
        out << "  " << categoryName(categoryFromIndex(i)) << " (target " << payload.waitTargetMinutes[i]
            << ", breaches " << payload.waitTargetBreaches[i] << "):\n";
        writeDistribution(out, "    ", payload.waitByCategory[i]);
    }
    out << "Consultation time (minutes):\n";
    writeDistribution(out, "  ", payload.consultation);
    out << "Time in system (minutes):\n";
    writeDistribution(out, "  ", payload.systemTime);
    out << "4-hour breaches: " << payload.fourHourBreaches << "\n";
    out << "Resource utilization:\n";
    for (const auto& pool : payload.pools) {
        out << "  " << pool.name << ": capacity=" << pool.capacity
            << " peak=" << pool.peakHeld
            << " average=" << percent(pool.averageUtilization) << "%\n";
    }
    out << "Snapshots: " << payload.snapshotCount << "\n";
    out << "Peak patients in system: " << payload.peakPatientsInSystem << "\n";
    out << "Peak queue lengths: ";
    for (int i = 0; i < kCategoryCount; ++i) {
        if (i > 0) out << " ";
        out << categoryName(categoryFromIndex(i)) << "=" << payload.peakQueueLengths[i];
    }
    out << "\n";
    return static_cast<bool>(out);
}

bool writeSummary(const SummaryPayload& payload, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        logErrno("summary file open failed");
        return false;
    }
    return writeSummaryText(payload, out);
}
