#pragma once

#include <string>
#include <vector>

/**
 * @brief Named checklist of up to five discriminating symptoms for one
 * presenting complaint.
 */
struct Flowchart {
    std::string name;
    std::string group;                  // respiratory, trauma, ...
    std::vector<std::string> symptoms;  // at most kSymptomInputs
    std::vector<std::string> keywords;  // whole-word phrases; a trailing '*' makes the last word a stem
    std::string childVariant;           // used instead for patients under 16, may be empty
};

/** @brief Name of the flowchart used when no keyword matches. */
extern const char* const kFallbackFlowchart;

/** @brief Built-in table of Manchester flowcharts. */
std::vector<Flowchart> defaultFlowcharts();

/**
 * @brief Picks a flowchart for a free-text chief complaint.
 *
 * Matching is case-insensitive and works on whole words, so "heartburn"
 * does not match "burn" and "year" does not match "ear". A keyword ending
 * in '*' matches any word it prefixes ("vomit*" matches "vomiting"). The
 * longest matching keyword wins, ties go to the earlier table entry.
 */
class FlowchartSelector {
public:
    /** @brief Selector over defaultFlowcharts(). */
    FlowchartSelector();

    /**
     * @throws std::invalid_argument if fallback is not in the table or a
     *         flowchart lists more than five symptoms.
     */
    FlowchartSelector(std::vector<Flowchart> table, const std::string& fallback);

    /**
     * @brief Flowchart for a complaint; never fails.
     * @param age patient age in years, -1 if unknown.
     */
    const Flowchart& select(const std::string& complaint, int age = -1) const;

    /** @brief Lookup by name; nullptr if absent. */
    const Flowchart* find(const std::string& name) const;

    const Flowchart& fallback() const { return table_[fallbackIndex_]; }
    const std::vector<Flowchart>& flowcharts() const { return table_; }
    size_t size() const { return table_.size(); }

private:
    std::vector<Flowchart> table_;
    size_t fallbackIndex_;
};
