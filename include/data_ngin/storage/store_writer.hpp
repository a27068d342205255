// include/data_ngin/storage/store_writer.hpp
#pragma once

#include <string>
#include "data_ngin/core/error.hpp"
#include "data_ngin/download/sequencer.hpp"

namespace data_ngin {

/**
 * @brief Abstract interface to the partitioned data store
 *
 * Implementations own partition layout and encoding. They are handed only
 * validated batches: non-empty and ordered by end_time.
 */
class StoreWriter {
public:
    virtual ~StoreWriter() = default;

    /**
     * @brief Persist one batch, creating or overwriting its partitions
     * @return WRITE_FAILURE when the batch could not be persisted
     */
    virtual Result<void> write(const OrderedBatch& batch) = 0;

    virtual std::string name() const = 0;
};

}  // namespace data_ngin
