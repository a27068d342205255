// src/storage/lean_store_writer.cpp

#include "data_ngin/storage/lean_store_writer.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cctype>
#include <map>
#include "data_ngin/core/logger.hpp"
#include "data_ngin/core/time_utils.hpp"

namespace data_ngin {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<std::vector<double>> row_values(const Observation& obs, TickType tick_type) {
    if (const auto* trade = std::get_if<TradeBar>(&obs.payload)) {
        return Result<std::vector<double>>(std::vector<double>{
            trade->price.open, trade->price.high, trade->price.low, trade->price.close,
            trade->volume});
    }
    if (const auto* quote = std::get_if<QuoteBar>(&obs.payload)) {
        return Result<std::vector<double>>(std::vector<double>{
            quote->bid.open, quote->bid.high, quote->bid.low, quote->bid.close,
            quote->last_bid_size, quote->ask.open, quote->ask.high, quote->ask.low,
            quote->ask.close, quote->last_ask_size});
    }
    if (const auto* tick = std::get_if<Tick>(&obs.payload)) {
        if (tick_type == TickType::QUOTE) {
            return Result<std::vector<double>>(std::vector<double>{
                tick->bid_price, tick->bid_size, tick->ask_price, tick->ask_size});
        }
        return Result<std::vector<double>>(std::vector<double>{tick->value, tick->quantity});
    }
    return make_error<std::vector<double>>(ErrorCode::WRITE_FAILURE, "Unknown payload",
                                           "LeanStoreWriter");
}

}  // namespace

LeanStoreWriter::LeanStoreWriter(std::string data_folder) : root_(std::move(data_folder)) {}

std::vector<std::string> LeanStoreWriter::value_columns(const Observation& sample,
                                                        TickType tick_type) {
    if (sample.is_trade_bar()) {
        return {"open", "high", "low", "close", "volume"};
    }
    if (sample.is_quote_bar()) {
        return {"bid_open", "bid_high", "bid_low", "bid_close", "last_bid_size",
                "ask_open", "ask_high", "ask_low", "ask_close", "last_ask_size"};
    }
    if (tick_type == TickType::QUOTE) {
        return {"bid_price", "bid_size", "ask_price", "ask_size"};
    }
    return {"value", "quantity"};
}

std::filesystem::path LeanStoreWriter::partition_path(const Instrument& instrument,
                                                      Resolution resolution, TickType tick_type,
                                                      const UtcTimestamp& day) const {
    std::filesystem::path dir = root_ / lower(to_string(instrument.get_security_type())) /
                                instrument.get_market() / lower(to_string(resolution));
    const std::string ticker = lower(instrument.get_ticker());

    if (!is_intraday(resolution)) {
        return dir / (ticker + ".csv");
    }
    return dir / ticker /
           (core::format_utc(day, "%Y%m%d") + "_" + lower(to_string(tick_type)) + ".csv");
}

Result<std::shared_ptr<arrow::Table>> LeanStoreWriter::build_table(
    const std::vector<const Observation*>& rows, Resolution resolution,
    TickType tick_type) const {
    using TableResult = Result<std::shared_ptr<arrow::Table>>;

    const std::vector<std::string> columns = value_columns(*rows.front(), tick_type);
    const bool intraday = is_intraday(resolution);
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::Int64Builder millis_builder(pool);
    arrow::StringBuilder stamp_builder(pool);
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> value_builders;
    for (size_t i = 0; i < columns.size(); ++i) {
        value_builders.push_back(std::make_unique<arrow::DoubleBuilder>(pool));
    }

    auto builder_error = [](const std::string& operation, const arrow::Status& status) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::WRITE_FAILURE,
            "Arrow builder error during " + operation + ": " + status.ToString(),
            "LeanStoreWriter");
    };

    const int64_t count = static_cast<int64_t>(rows.size());
    arrow::Status status = intraday ? millis_builder.Reserve(count) : stamp_builder.Reserve(count);
    if (!status.ok()) {
        return builder_error("reserve", status);
    }
    for (auto& builder : value_builders) {
        status = builder->Reserve(count);
        if (!status.ok()) {
            return builder_error("reserve", status);
        }
    }

    for (const Observation* obs : rows) {
        auto values = row_values(*obs, tick_type);
        if (values.is_error()) {
            return forward_error<std::shared_ptr<arrow::Table>>(values, "LeanStoreWriter");
        }
        if (values.value().size() != columns.size()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::WRITE_FAILURE, "Batch mixes payload kinds", "LeanStoreWriter");
        }

        status = intraday ? millis_builder.Append(core::millis_since_midnight(obs->time))
                          : stamp_builder.Append(core::format_utc(obs->time, "%Y%m%d %H:%M"));
        if (!status.ok()) {
            return builder_error("append", status);
        }
        for (size_t i = 0; i < columns.size(); ++i) {
            status = value_builders[i]->Append(values.value()[i]);
            if (!status.ok()) {
                return builder_error("append", status);
            }
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays(columns.size() + 1);

    fields.push_back(arrow::field("time", intraday ? arrow::int64() : arrow::utf8()));
    status = intraday ? millis_builder.Finish(&arrays[0]) : stamp_builder.Finish(&arrays[0]);
    if (!status.ok()) {
        return builder_error("finish", status);
    }
    for (size_t i = 0; i < columns.size(); ++i) {
        fields.push_back(arrow::field(columns[i], arrow::float64()));
        status = value_builders[i]->Finish(&arrays[i + 1]);
        if (!status.ok()) {
            return builder_error("finish", status);
        }
    }

    return TableResult(arrow::Table::Make(arrow::schema(fields), arrays));
}

Result<void> LeanStoreWriter::write_partition(const std::shared_ptr<arrow::Table>& table,
                                              const std::filesystem::path& target) const {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return make_error<void>(ErrorCode::WRITE_FAILURE,
                                "Failed to create directory " + target.parent_path().string() +
                                    ": " + ec.message(),
                                "LeanStoreWriter");
    }

    std::filesystem::path staging = target;
    staging += ".tmp";

    auto stream = arrow::io::FileOutputStream::Open(staging.string());
    if (!stream.ok()) {
        return make_error<void>(ErrorCode::WRITE_FAILURE,
                                "Failed to open " + staging.string() + ": " +
                                    stream.status().ToString(),
                                "LeanStoreWriter");
    }
    std::shared_ptr<arrow::io::FileOutputStream> out = *stream;

    arrow::csv::WriteOptions options = arrow::csv::WriteOptions::Defaults();
    options.include_header = false;
    options.quoting_style = arrow::csv::QuotingStyle::None;

    arrow::Status status = arrow::csv::WriteCSV(*table, options, out.get());
    arrow::Status close_status = out->Close();
    if (!status.ok() || !close_status.ok()) {
        std::filesystem::remove(staging, ec);
        return make_error<void>(ErrorCode::WRITE_FAILURE,
                                "Failed to encode " + target.string() + ": " +
                                    (status.ok() ? close_status : status).ToString(),
                                "LeanStoreWriter");
    }

    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return make_error<void>(ErrorCode::WRITE_FAILURE,
                                "Failed to replace " + target.string() + ": " + ec.message(),
                                "LeanStoreWriter");
    }
    return Result<void>();
}

Result<void> LeanStoreWriter::write(const OrderedBatch& batch) {
    if (batch.empty()) {
        return make_error<void>(ErrorCode::WRITE_FAILURE, "Refusing to write an empty batch",
                                "LeanStoreWriter");
    }

    // Partition key: start of the UTC day for intraday data, a single key otherwise
    std::map<long long, std::vector<const Observation*>> partitions;
    for (const auto& obs : batch.observations()) {
        long long key =
            is_intraday(batch.resolution()) ? core::to_epoch_millis(core::utc_day_start(obs.time))
                                            : 0;
        partitions[key].push_back(&obs);
    }

    try {
        for (const auto& [key, rows] : partitions) {
            auto table = build_table(rows, batch.resolution(), batch.tick_type());
            if (table.is_error()) {
                return forward_error<void>(table, "LeanStoreWriter");
            }

            auto target = partition_path(batch.instrument(), batch.resolution(),
                                         batch.tick_type(), rows.front()->time);
            auto written = write_partition(table.value(), target);
            if (written.is_error()) {
                return written;
            }
            DEBUG("Wrote " << rows.size() << " rows to " << target.string());
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::WRITE_FAILURE,
                                std::string("Error writing partitions: ") + e.what(),
                                "LeanStoreWriter");
    }

    INFO("Stored " << batch.size() << " " << to_string(batch.tick_type()) << " rows for "
                   << batch.instrument() << " in " << partitions.size() << " partition(s)");
    return Result<void>();
}

}  // namespace data_ngin
