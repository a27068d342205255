// src/download/sequencer.cpp

#include "data_ngin/download/sequencer.hpp"
#include <algorithm>

namespace data_ngin {

Result<OrderedBatch> Sequencer::sequence(const Instrument& instrument, Resolution resolution,
                                         TickType tick_type,
                                         std::vector<Observation> observations) {
    if (observations.empty()) {
        return make_error<OrderedBatch>(ErrorCode::EMPTY_RESULT,
                                        "Empty data set for " + instrument.to_string(),
                                        "Sequencer");
    }

    std::stable_sort(observations.begin(), observations.end(),
                     [](const Observation& a, const Observation& b) {
                         return a.end_time < b.end_time;
                     });

    return Result<OrderedBatch>(
        OrderedBatch(instrument, resolution, tick_type, std::move(observations)));
}

}  // namespace data_ngin
