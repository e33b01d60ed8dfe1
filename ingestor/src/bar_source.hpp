#pragma once

#include "bars.hpp"
#include "schema.hpp"
#include <vector>

// Upstream historical data. Implementations throw TransientFetchError or
// PermanentFetchError.
class BarSource {
public:
    virtual ~BarSource() = default;
    virtual std::vector<RawBar> fetch_bars(const SeriesKey& key, int64_t start, int64_t end) = 0;
};
