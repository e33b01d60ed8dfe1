#pragma once

#include <cstdint>
#include <optional>

// One stored OHLCV bar. open_interest is only persisted by derivative layouts.
struct Bar {
    int64_t timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;
    int64_t open_interest = 0;
};

// Row as it arrives from upstream, before validation.
struct RawBar {
    std::optional<int64_t> timestamp;
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> close;
    std::optional<int64_t> volume;
    std::optional<int64_t> open_interest;
};
