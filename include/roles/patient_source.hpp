#pragma once

#include <string>
#include <utility>
#include <vector>

#include "model/patient.hpp"
#include "util/random.hpp"

/**
 * @brief Opaque provider of patient descriptions for the arrival process.
 */
class PatientSource {
public:
    virtual ~PatientSource() = default;

    /** @brief Description of the next arriving patient. */
    virtual PatientRecord next(RandomGenerator& rng) = 0;
};

/**
 * @brief Synthetic ED population: mixed age bands, weighted chief
 * complaints, vital signs with occasional abnormal draws, history tags.
 */
class SyntheticPatientSource : public PatientSource {
public:
    SyntheticPatientSource();

    PatientRecord next(RandomGenerator& rng) override;

    const std::vector<std::pair<std::string, double>>& complaints() const { return complaints_; }

private:
    int drawAge(RandomGenerator& rng) const;
    void drawVitals(PatientRecord& record, RandomGenerator& rng) const;
    void drawHistory(PatientRecord& record, RandomGenerator& rng) const;

    std::vector<std::pair<std::string, double>> complaints_;
    std::vector<std::pair<std::string, double>> conditions_;
};

/**
 * @brief Replays a fixed list of records in order, starting over at the end.
 */
class ScriptedPatientSource : public PatientSource {
public:
    /** @throws std::invalid_argument when records is empty. */
    explicit ScriptedPatientSource(std::vector<PatientRecord> records);

    PatientRecord next(RandomGenerator& rng) override;

private:
    std::vector<PatientRecord> records_;
    size_t cursor_ = 0;
};
