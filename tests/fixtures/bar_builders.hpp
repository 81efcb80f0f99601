#pragma once
#include "marketdata/model/Bar.h"
#include <vector>

namespace tdchart::test {

inline constexpr int64_t kStartMs = 1700000000000LL;
inline constexpr int64_t kStepMs = 60000LL;

/// Bar with a tight range around the close: high = close + 1, low = close - 1
inline Bar makeBar(size_t index, double close, double spread = 1.0) {
    Bar bar;
    bar.timestamp_ms = kStartMs + static_cast<int64_t>(index) * kStepMs;
    bar.open = close;
    bar.close = close;
    bar.high = close + spread;
    bar.low = close - spread;
    bar.volume = 1000;
    return bar;
}

inline BarSeries barsFromCloses(const std::vector<double>& closes) {
    BarSeries bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        bars.push_back(makeBar(i, closes[i]));
    }
    return bars;
}

/// Strictly rising closes: every bar from index 4 qualifies as a sell setup bar
inline BarSeries risingBars(size_t count, double start = 100.0, double step = 1.0) {
    std::vector<double> closes;
    for (size_t i = 0; i < count; ++i) closes.push_back(start + step * static_cast<double>(i));
    return barsFromCloses(closes);
}

inline BarSeries fallingBars(size_t count, double start = 200.0, double step = 1.0) {
    return risingBars(count, start, -step);
}

} // namespace tdchart::test
