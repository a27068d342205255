// include/data_ngin/download/sequencer.hpp
#pragma once

#include <utility>
#include <vector>
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/types.hpp"
#include "data_ngin/data/observation.hpp"
#include "data_ngin/instruments/instrument.hpp"

namespace data_ngin {

class Sequencer;

/**
 * @brief Observations of one instrument ready to be written
 *
 * Only the Sequencer builds a non-empty batch, so holders can rely on the
 * observations being non-empty and non-decreasing by end_time.
 */
class OrderedBatch {
public:
    OrderedBatch() = default;

    const Instrument& instrument() const {
        return instrument_;
    }
    Resolution resolution() const {
        return resolution_;
    }
    TickType tick_type() const {
        return tick_type_;
    }
    const std::vector<Observation>& observations() const {
        return observations_;
    }
    size_t size() const {
        return observations_.size();
    }
    bool empty() const {
        return observations_.empty();
    }

    const Observation& front() const {
        return observations_.front();
    }
    const Observation& back() const {
        return observations_.back();
    }

private:
    friend class Sequencer;

    OrderedBatch(Instrument instrument, Resolution resolution, TickType tick_type,
                 std::vector<Observation> observations)
        : instrument_(std::move(instrument)),
          resolution_(resolution),
          tick_type_(tick_type),
          observations_(std::move(observations)) {}

    Instrument instrument_;
    Resolution resolution_{Resolution::MINUTE};
    TickType tick_type_{TickType::TRADE};
    std::vector<Observation> observations_;
};

/**
 * @brief Orders raw provider output chronologically
 */
class Sequencer {
public:
    /**
     * @brief Stable sort by end_time ascending
     *
     * Observations sharing an end_time keep their arrival order; nothing is
     * dropped or duplicated.
     *
     * @return EMPTY_RESULT when there is nothing to sequence
     */
    static Result<OrderedBatch> sequence(const Instrument& instrument, Resolution resolution,
                                         TickType tick_type,
                                         std::vector<Observation> observations);
};

}  // namespace data_ngin
