// src/download/batch_orchestrator.cpp

#include "data_ngin/download/batch_orchestrator.hpp"
#include <algorithm>
#include <system_error>
#include <unordered_set>
#include "data_ngin/core/time_utils.hpp"
#include "data_ngin/download/sequencer.hpp"
#include "data_ngin/instruments/instrument_resolver.hpp"

namespace data_ngin {

std::string to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::WRITTEN:
            return "Written";
        case OutcomeStatus::NO_DATA:
            return "NoData";
        case OutcomeStatus::REJECTED:
            return "Rejected";
        case OutcomeStatus::FAILED:
            return "Failed";
        default:
            return "Unknown";
    }
}

nlohmann::json DownloadParameters::to_json() const {
    nlohmann::json j;
    j["tickers"] = tickers;
    j["security_type"] = security_type;
    j["resolution"] = resolution;
    j["market"] = market;
    j["from_date"] =
        core::format_utc(UtcTimestamp::specify_utc(range_start), core::kDateTimeExactFormat);
    if (range_end) {
        j["to_date"] =
            core::format_utc(UtcTimestamp::specify_utc(*range_end), core::kDateTimeExactFormat);
    }
    j["max_concurrency"] = max_concurrency;
    return j;
}

void DownloadParameters::from_json(const nlohmann::json& j) {
    if (j.contains("tickers"))
        tickers = j.at("tickers").get<std::vector<std::string>>();
    if (j.contains("security_type"))
        security_type = j.at("security_type").get<std::string>();
    if (j.contains("resolution"))
        resolution = j.at("resolution").get<std::string>();
    if (j.contains("market"))
        market = j.at("market").get<std::string>();
    if (j.contains("from_date")) {
        auto parsed = core::parse_exact(j.at("from_date").get<std::string>());
        range_start = parsed.value();  // throws DataError on a malformed date
    }
    if (j.contains("to_date")) {
        auto parsed = core::parse_exact(j.at("to_date").get<std::string>());
        range_end = parsed.value();
    }
    if (j.contains("max_concurrency"))
        max_concurrency = j.at("max_concurrency").get<size_t>();
}

BatchOrchestrator::BatchOrchestrator(std::shared_ptr<ProviderGateway> gateway,
                                     std::shared_ptr<StoreWriter> writer, RequestPlanner planner)
    : gateway_(std::move(gateway)), writer_(std::move(writer)), planner_(std::move(planner)) {}

Result<std::vector<FetchRequest>> BatchOrchestrator::prepare(
    const DownloadParameters& params) const {
    if (!gateway_ || !writer_) {
        return make_error<std::vector<FetchRequest>>(
            ErrorCode::CONFIGURATION_ERROR, "Gateway and writer must both be provided",
            "BatchOrchestrator");
    }

    if (params.tickers.empty()) {
        return make_error<std::vector<FetchRequest>>(
            ErrorCode::CONFIGURATION_ERROR, "At least one ticker is required", "BatchOrchestrator");
    }

    auto security_type = InstrumentResolver::parse_security_type(params.security_type);
    if (security_type.is_error()) {
        return forward_error<std::vector<FetchRequest>>(security_type, "BatchOrchestrator");
    }

    auto resolution = RequestPlanner::parse_resolution(params.resolution);
    if (resolution.is_error()) {
        return forward_error<std::vector<FetchRequest>>(resolution, "BatchOrchestrator");
    }

    const Timestamp range_end = params.range_end.value_or(RequestPlanner::process_start_time());
    auto range_check = RequestPlanner::validate_range(params.range_start, range_end);
    if (range_check.is_error()) {
        return forward_error<std::vector<FetchRequest>>(range_check, "BatchOrchestrator");
    }

    std::vector<FetchRequest> requests;
    std::unordered_set<std::string> seen;
    for (const auto& raw : params.tickers) {
        if (InstrumentResolver::trim_ticker(raw).empty()) {
            continue;
        }

        Instrument instrument =
            InstrumentResolver::resolve(raw, security_type.value(), params.market);
        if (!seen.insert(instrument.get_ticker()).second) {
            continue;
        }

        auto request = planner_.plan(instrument, resolution.value(), params.range_start, range_end);
        if (request.is_error()) {
            return forward_error<std::vector<FetchRequest>>(request, "BatchOrchestrator");
        }
        requests.push_back(request.value());
    }

    return Result<std::vector<FetchRequest>>(std::move(requests));
}

Outcome BatchOrchestrator::process(const FetchRequest& request) {
    Outcome outcome;
    outcome.instrument = request.instrument;

    try {
        auto fetched = gateway_->fetch(request);
        if (fetched.is_error()) {
            const DataError* err = fetched.error();
            outcome.status = err->code() == ErrorCode::INVALID_ARGUMENT ? OutcomeStatus::REJECTED
                                                                        : OutcomeStatus::FAILED;
            outcome.detail = err->to_string();
            return outcome;
        }

        FetchResult data = fetched.take_value();
        if (!data) {
            outcome.status = OutcomeStatus::NO_DATA;
            outcome.detail = "No data returned for " + request.instrument.to_string();
            return outcome;
        }

        auto batch = Sequencer::sequence(request.instrument, request.resolution,
                                         request.tick_type, std::move(*data));
        if (batch.is_error()) {
            outcome.status = batch.error()->code() == ErrorCode::EMPTY_RESULT
                                 ? OutcomeStatus::NO_DATA
                                 : OutcomeStatus::FAILED;
            outcome.detail = batch.error()->what();
            return outcome;
        }

        auto written = writer_->write(batch.value());
        if (written.is_error()) {
            outcome.status = OutcomeStatus::FAILED;
            outcome.detail = written.error()->to_string();
            return outcome;
        }

        outcome.status = OutcomeStatus::WRITTEN;
        outcome.observation_count = batch.value().size();
        outcome.detail = "Wrote " + std::to_string(outcome.observation_count) + " " +
                         to_string(request.tick_type) + " observations at " +
                         to_string(request.resolution) + " resolution";
    } catch (const std::exception& e) {
        outcome.status = OutcomeStatus::FAILED;
        outcome.detail = std::string("Unexpected exception: ") + e.what();
    }

    return outcome;
}

void BatchOrchestrator::run_sequential(const std::vector<FetchRequest>& requests,
                                       OutcomeLog& log, const CancellationToken* cancel) {
    for (const auto& request : requests) {
        if (cancel && cancel->is_cancelled()) {
            return;
        }
        log.append(process(request));
    }
}

void BatchOrchestrator::run_parallel(const std::vector<FetchRequest>& requests, size_t workers,
                                     OutcomeLog& log, const CancellationToken* cancel) {
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            if (cancel && cancel->is_cancelled()) {
                return;
            }
            size_t index = next.fetch_add(1);
            if (index >= requests.size()) {
                return;
            }
            log.append(process(requests[index]));
        }
    };

    // The calling thread is the last worker, so the queue drains even when
    // no extra thread could be started
    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    try {
        for (size_t i = 1; i < workers; ++i) {
            threads.push_back(launch_worker(worker));
        }
    } catch (const std::system_error&) {
        // Run with the threads already started
    }

    worker();
    for (auto& thread : threads) {
        thread.join();
    }
}

std::thread BatchOrchestrator::launch_worker(std::function<void()> work) {
    return std::thread(std::move(work));
}

Result<OutcomeList> BatchOrchestrator::run(const DownloadParameters& params,
                                           const CancellationToken* cancel) {
    auto prepared = prepare(params);
    if (prepared.is_error()) {
        return forward_error<OutcomeList>(prepared, "BatchOrchestrator");
    }

    const auto& requests = prepared.value();
    OutcomeLog log;

    size_t workers = std::min(std::max<size_t>(params.max_concurrency, 1), requests.size());
    if (workers <= 1) {
        run_sequential(requests, log, cancel);
    } else {
        run_parallel(requests, workers, log, cancel);
    }

    return Result<OutcomeList>(log.snapshot());
}

}  // namespace data_ngin
