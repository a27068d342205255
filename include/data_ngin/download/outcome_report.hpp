// include/data_ngin/download/outcome_report.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "data_ngin/core/error.hpp"
#include "data_ngin/download/batch_orchestrator.hpp"

namespace data_ngin {

/**
 * @brief Counts per terminal status for one run
 */
struct OutcomeSummary {
    size_t written{0};
    size_t no_data{0};
    size_t rejected{0};
    size_t failed{0};

    size_t total() const {
        return written + no_data + rejected + failed;
    }
};

/**
 * @brief Turns an outcome list into summaries, JSON and an exit status
 */
class OutcomeReport {
public:
    explicit OutcomeReport(OutcomeList outcomes) : outcomes_(std::move(outcomes)) {}

    const OutcomeList& outcomes() const {
        return outcomes_;
    }

    OutcomeSummary summarize() const;

    /**
     * @brief {"summary": {...}, "outcomes": [{"ticker", "security_type", "market",
     * "status", "detail", "observations"}, ...]}
     */
    nlohmann::json to_json() const;

    Result<void> save(const std::string& filepath) const;

    /**
     * @brief Process exit status for a completed run
     *
     * 0 when something was written or every instrument simply had no data,
     * 2 when nothing was written and at least one instrument failed or was
     * rejected.
     */
    int exit_code() const;

private:
    OutcomeList outcomes_;
};

}  // namespace data_ngin
