// include/data_ngin/download/batch_orchestrator.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "data_ngin/core/config_base.hpp"
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/types.hpp"
#include "data_ngin/data/provider_gateway.hpp"
#include "data_ngin/download/request_planner.hpp"
#include "data_ngin/instruments/instrument.hpp"
#include "data_ngin/storage/store_writer.hpp"

namespace data_ngin {

/**
 * @brief Run parameters for one download batch
 *
 * Tokens are kept raw; the orchestrator validates them once before any
 * instrument is touched.
 */
struct DownloadParameters : public ConfigBase {
    std::vector<std::string> tickers;
    std::string security_type;  // empty means Equity
    std::string resolution;     // empty means Minute
    std::string market;         // empty means usa
    Timestamp range_start{};
    std::optional<Timestamp> range_end;  // nullopt means process start time
    size_t max_concurrency{1};

    // Dates are serialized in the exact command line format
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Terminal state of one instrument
 */
enum class OutcomeStatus {
    WRITTEN,
    NO_DATA,
    REJECTED,
    FAILED
};

std::string to_string(OutcomeStatus status);

/**
 * @brief Per-instrument result record
 */
struct Outcome {
    Instrument instrument;
    OutcomeStatus status{OutcomeStatus::FAILED};
    std::string detail;
    size_t observation_count{0};
};

using OutcomeList = std::vector<Outcome>;

/**
 * @brief Append-only outcome log shared by the worker threads
 */
class OutcomeLog {
public:
    void append(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }

    OutcomeList snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_.size();
    }

private:
    mutable std::mutex mutex_;
    OutcomeList outcomes_;
};

/**
 * @brief Cooperative stop signal, checked before each fetch
 */
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Drives resolve, plan, fetch, sequence and write for every ticker
 *
 * Invalid run parameters fail the whole run before any instrument is
 * processed. Everything that goes wrong for a single instrument becomes
 * that instrument's Outcome and never stops the others.
 */
class BatchOrchestrator {
public:
    BatchOrchestrator(std::shared_ptr<ProviderGateway> gateway,
                      std::shared_ptr<StoreWriter> writer,
                      RequestPlanner planner = RequestPlanner());
    virtual ~BatchOrchestrator() = default;

    /**
     * @brief Process the batch
     *
     * Blank tickers are skipped without an outcome; a ticker listed more
     * than once is processed once. Outcomes are listed in completion order.
     *
     * @param params Run parameters
     * @param cancel Optional stop signal; once set no further instrument is
     * started and the outcomes recorded so far are returned
     * @return CONFIGURATION_ERROR or UNSUPPORTED_COMBINATION for invalid
     * run parameters, otherwise one outcome per processed instrument
     */
    Result<OutcomeList> run(const DownloadParameters& params,
                            const CancellationToken* cancel = nullptr);

protected:
    /**
     * @brief Start one pool thread
     * @throws std::system_error when the thread cannot be created
     */
    virtual std::thread launch_worker(std::function<void()> work);

private:
    /**
     * @brief Validate run parameters and plan every request, touching nothing
     */
    Result<std::vector<FetchRequest>> prepare(const DownloadParameters& params) const;

    Outcome process(const FetchRequest& request);

    void run_sequential(const std::vector<FetchRequest>& requests, OutcomeLog& log,
                        const CancellationToken* cancel);
    void run_parallel(const std::vector<FetchRequest>& requests, size_t workers,
                      OutcomeLog& log, const CancellationToken* cancel);

    std::shared_ptr<ProviderGateway> gateway_;
    std::shared_ptr<StoreWriter> writer_;
    RequestPlanner planner_;
};

}  // namespace data_ngin
