// include/data_ngin/storage/lean_store_writer.hpp
#pragma once

#include <arrow/api.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "data_ngin/core/error.hpp"
#include "data_ngin/storage/store_writer.hpp"

namespace data_ngin {

/**
 * @brief Store writer producing the LEAN directory layout
 *
 * <root>/<securitytype>/<market>/<resolution>/<ticker>/<yyyyMMdd>_<ticktype>.csv
 * for tick, second and minute data, one file per UTC day, and
 * <root>/<securitytype>/<market>/<resolution>/<ticker>.csv for hour and
 * daily data. Intraday rows start with milliseconds since midnight, the
 * others with "yyyyMMdd HH:mm". Files carry no header.
 *
 * Every partition touched by a batch is replaced as a whole: rows are
 * encoded to a temporary file which is then renamed over the target.
 */
class LeanStoreWriter : public StoreWriter {
public:
    explicit LeanStoreWriter(std::string data_folder);

    Result<void> write(const OrderedBatch& batch) override;

    std::string name() const override {
        return "lean";
    }

    const std::filesystem::path& root() const {
        return root_;
    }

    /**
     * @brief File holding the partition that contains day
     * @param day Any instant within the partition; ignored for hour/daily data
     */
    std::filesystem::path partition_path(const Instrument& instrument, Resolution resolution,
                                         TickType tick_type, const UtcTimestamp& day) const;

    /**
     * @brief Column names after the leading time column, by payload and tick type
     */
    static std::vector<std::string> value_columns(const Observation& sample, TickType tick_type);

private:
    Result<std::shared_ptr<arrow::Table>> build_table(const std::vector<const Observation*>& rows,
                                                      Resolution resolution,
                                                      TickType tick_type) const;

    Result<void> write_partition(const std::shared_ptr<arrow::Table>& table,
                                 const std::filesystem::path& target) const;

    std::filesystem::path root_;
};

}  // namespace data_ngin
