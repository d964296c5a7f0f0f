#pragma once

#include <functional>
#include <string>

#include "triage/triage_system.hpp"

/**
 * @brief Raw answer of an external triage collaborator.
 */
struct ExternalVerdict {
    std::string category;   // "RED" .. "BLUE", any case
    int priority{0};        // 1..5
    std::string waitTime;   // "Immediate", "10 min", "2 hours", "60"
};

/**
 * @brief Adapter over an external triage callback.
 *
 * Malformed answers (unknown category, priority outside 1..5, priority
 * contradicting the category, or a callback that throws) are replaced by
 * the verdict of the fallback system.
 */
class ExternalTriage : public TriageSystem {
public:
    using Callback = std::function<ExternalVerdict(const Patient&)>;

    /**
     * @param fallback must outlive this adapter.
     * @param waitTargets used when the wait-time string cannot be parsed.
     */
    ExternalTriage(Callback callback, TriageSystem& fallback, CategoryTable<double> waitTargets);

    TriageVerdict assess(const Patient& patient) override;

    const char* name() const override { return "external"; }

    /** @brief Verdicts taken from the fallback system so far. */
    int fallbackCount() const { return fallbacks_; }

private:
    TriageVerdict fallbackVerdict(const Patient& patient, const std::string& reason);

    Callback callback_;
    TriageSystem& fallback_;
    CategoryTable<double> waitTargets_;
    int fallbacks_ = 0;
};

/**
 * @brief Parse a wait-time string into minutes.
 * @return false if text is not a recognizable duration.
 */
bool parseWaitMinutes(const std::string& text, double& minutes);
