#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tdchart {

// One OHLC(V) sample. Series are ordered by strictly increasing timestamp_ms;
// low <= min(open, close) <= max(open, close) <= high is expected but not enforced.
struct Bar {
    int64_t timestamp_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::optional<int64_t> volume;

    bool isBullish() const { return close > open; }
};

using BarSeries = std::vector<Bar>;
using BarSpan = std::span<const Bar>;

} // namespace tdchart
