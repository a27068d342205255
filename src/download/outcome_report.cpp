// src/download/outcome_report.cpp

#include "data_ngin/download/outcome_report.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace data_ngin {

OutcomeSummary OutcomeReport::summarize() const {
    OutcomeSummary summary;
    for (const auto& outcome : outcomes_) {
        switch (outcome.status) {
            case OutcomeStatus::WRITTEN:
                summary.written++;
                break;
            case OutcomeStatus::NO_DATA:
                summary.no_data++;
                break;
            case OutcomeStatus::REJECTED:
                summary.rejected++;
                break;
            case OutcomeStatus::FAILED:
                summary.failed++;
                break;
        }
    }
    return summary;
}

nlohmann::json OutcomeReport::to_json() const {
    OutcomeSummary summary = summarize();

    nlohmann::json j;
    j["summary"] = {{"written", summary.written},
                    {"no_data", summary.no_data},
                    {"rejected", summary.rejected},
                    {"failed", summary.failed},
                    {"total", summary.total()}};

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& outcome : outcomes_) {
        entries.push_back({{"ticker", outcome.instrument.get_ticker()},
                           {"security_type", to_string(outcome.instrument.get_security_type())},
                           {"market", outcome.instrument.get_market()},
                           {"status", to_string(outcome.status)},
                           {"detail", outcome.detail},
                           {"observations", outcome.observation_count}});
    }
    j["outcomes"] = entries;
    return j;
}

Result<void> OutcomeReport::save(const std::string& filepath) const {
    try {
        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open report for writing: " + filepath,
                                    "OutcomeReport");
        }
        file << std::setw(4) << to_json() << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving report: ") + e.what(), "OutcomeReport");
    }
}

int OutcomeReport::exit_code() const {
    OutcomeSummary summary = summarize();
    if (summary.written > 0) {
        return 0;
    }
    return (summary.failed + summary.rejected) > 0 ? 2 : 0;
}

}  // namespace data_ngin
