#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "data_ngin/download/outcome_report.hpp"

using namespace data_ngin;

class OutcomeReportTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::filesystem::remove_all(report_dir);
    }

    Outcome outcome(const std::string& ticker, OutcomeStatus status, size_t count = 0) {
        Outcome o;
        o.instrument = Instrument(ticker, SecurityType::EQUITY, "usa");
        o.status = status;
        o.detail = to_string(status);
        o.observation_count = count;
        return o;
    }

    std::filesystem::path report_dir =
        std::filesystem::temp_directory_path() / "data_ngin_report_test";
};

TEST_F(OutcomeReportTest, SummarizeCountsEachStatus) {
    OutcomeReport report({outcome("AAPL", OutcomeStatus::WRITTEN, 390),
                          outcome("MSFT", OutcomeStatus::WRITTEN, 390),
                          outcome("TSLA", OutcomeStatus::NO_DATA),
                          outcome("XYZ", OutcomeStatus::REJECTED),
                          outcome("GOOG", OutcomeStatus::FAILED)});

    OutcomeSummary summary = report.summarize();
    EXPECT_EQ(summary.written, 2u);
    EXPECT_EQ(summary.no_data, 1u);
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.total(), 5u);
}

TEST_F(OutcomeReportTest, ExitCodePolicy) {
    EXPECT_EQ(OutcomeReport({}).exit_code(), 0);
    EXPECT_EQ(OutcomeReport({outcome("AAPL", OutcomeStatus::WRITTEN, 1),
                             outcome("MSFT", OutcomeStatus::FAILED)})
                  .exit_code(),
              0);
    EXPECT_EQ(OutcomeReport({outcome("TSLA", OutcomeStatus::NO_DATA)}).exit_code(), 0);
    EXPECT_EQ(OutcomeReport({outcome("MSFT", OutcomeStatus::FAILED),
                             outcome("TSLA", OutcomeStatus::NO_DATA)})
                  .exit_code(),
              2);
    EXPECT_EQ(OutcomeReport({outcome("XYZ", OutcomeStatus::REJECTED)}).exit_code(), 2);
}

TEST_F(OutcomeReportTest, JsonKeepsCompletionOrder) {
    OutcomeReport report({outcome("MSFT", OutcomeStatus::NO_DATA),
                          outcome("AAPL", OutcomeStatus::WRITTEN, 390)});

    nlohmann::json j = report.to_json();
    ASSERT_EQ(j["outcomes"].size(), 2u);
    EXPECT_EQ(j["outcomes"][0]["ticker"], "MSFT");
    EXPECT_EQ(j["outcomes"][0]["status"], "NoData");
    EXPECT_EQ(j["outcomes"][1]["ticker"], "AAPL");
    EXPECT_EQ(j["outcomes"][1]["status"], "Written");
    EXPECT_EQ(j["outcomes"][1]["observations"], 390);
    EXPECT_EQ(j["outcomes"][1]["security_type"], "Equity");
    EXPECT_EQ(j["summary"]["total"], 2);
}

TEST_F(OutcomeReportTest, SaveCreatesParentDirectories) {
    OutcomeReport report({outcome("AAPL", OutcomeStatus::WRITTEN, 3)});
    std::filesystem::path path = report_dir / "nested" / "report.json";

    auto saved = report.save(path.string());
    ASSERT_TRUE(saved.is_ok()) << saved.error()->what();
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream file(path);
    nlohmann::json loaded;
    file >> loaded;
    EXPECT_EQ(loaded, report.to_json());
}
