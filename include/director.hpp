#pragma once

#include <memory>
#include <string>

#include "department.hpp"
#include "model/config.hpp"

/**
 * @brief Entry point of a simulation run: log file, department, summary file.
 */
class Director {
public:
    Director() = default;

    /**
     * @brief Records for the next run; a synthetic population when never set.
     */
    void setPatientSource(std::unique_ptr<PatientSource> source) { source_ = std::move(source); }

    /**
     * @brief Triage the next run through an external collaborator.
     */
    void setExternalTriage(ExternalTriage::Callback callback) { external_ = std::move(callback); }

    /**
     * @brief Run one simulation to the configured horizon.
     * @param config configuration; rejected before anything is scheduled if invalid.
     * @return 0 on success, non-zero on failure.
     */
    int run(const Config& config);

    /**
     * @brief Department state at the end of the last run (empty before any run).
     */
    SystemSnapshot status() const;

    /** @brief Department of the last run, nullptr before any run. */
    const Department* department() const { return department_.get(); }

    /**
     * @brief Path to the most recently written summary file (text variant).
     * @return empty if no summary was produced during the last run.
     */
    const std::string& lastSummaryPath() const { return lastSummaryPath_; }
    /**
     * @brief Path to the log file used in the last run.
     */
    const std::string& lastLogPath() const { return lastLogPath_; }

private:
    std::unique_ptr<PatientSource> source_;
    ExternalTriage::Callback external_;
    std::unique_ptr<Department> department_;
    std::string lastSummaryPath_;
    std::string lastLogPath_;
};
