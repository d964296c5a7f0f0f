#include "director.hpp"

#include <ctime>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "logging/logger.hpp"
#include "metrics/summary.hpp"

namespace {
std::string timestampedPath(const std::string& prefix, const std::string& extension) {
    return prefix + std::to_string(static_cast<long long>(std::time(nullptr))) + extension;
}

/** @brief Detaches the log sink and context when the run scope ends. */
struct LogSinkGuard {
    explicit LogSinkGuard(Logger& logger) { setLogSink(&logger); }
    ~LogSinkGuard() {
        clearLogMetricsContext();
        setLogSink(nullptr);
    }
    LogSinkGuard(const LogSinkGuard&) = delete;
    LogSinkGuard& operator=(const LogSinkGuard&) = delete;
};
} // namespace

// Director entry point (see header for details).
int Director::run(const Config& config) {
    lastSummaryPath_.clear();
    lastLogPath_.clear();
    department_.reset();

    std::string err;
    if (!validateConfig(config, err)) {
        std::cerr << "Config error: " << err << "\n";
        return 1;
    }

    std::string logPath = config.logPath.empty() ? timestampedPath("ed_run_", ".log") : config.logPath;
    Logger logger;
    if (!logger.openFile(logPath)) {
        return 1;
    }
    lastLogPath_ = logPath;
    LogSinkGuard sinkGuard(logger);

    try {
        department_ = std::make_unique<Department>(config, std::move(source_));
        if (external_) {
            department_->useExternalTriage(external_);
        }
        setLogMetricsContext(department_->logMetricsContext());
        logEvent(Role::Director, 0.0,
                 "Director starting (duration=" + std::to_string(config.simulationDurationMinutes) +
                 ", warmup=" + std::to_string(config.warmupMinutes) +
                 ", seed=" + std::to_string(config.randomSeed) + ")");
        department_->run();
    } catch (const std::exception& ex) {
        double at = department_ ? department_->context().now() : 0.0;
        logEvent(Role::Director, at, std::string("Simulation aborted: ") + ex.what());
        std::cerr << "Simulation aborted: " << ex.what() << "\n";
        return 1;
    }

    double endTime = department_->context().now();
    logEvent(Role::Director, endTime,
             "Horizon reached: " + std::to_string(department_->patientsInSystem()) + " patients still inside");

    // write final summary before the logger shuts down
    std::string summaryPath = config.summaryPath.empty() ? timestampedPath("ed_summary_", ".txt")
                                                         : config.summaryPath;
    if (writeSummary(department_->summary(), summaryPath)) {
        logEvent(Role::Director, endTime, "Summary saved: " + summaryPath);
        lastSummaryPath_ = summaryPath;
    }
    logEvent(Role::Director, endTime, "END");
    return 0;
}

SystemSnapshot Director::status() const {
    if (!department_) {
        return SystemSnapshot{};
    }
    return department_->status();
}
