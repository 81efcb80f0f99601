#include "IOverlayStrategy.hpp"
#include <algorithm>
#include <cmath>

namespace tdchart {

PaintRange IOverlayStrategy::calculatePaintRange(const VisibleRange& range, size_t count) {
    PaintRange paint;
    if (count == 0 || !std::isfinite(range.from) || !std::isfinite(range.to)) {
        return paint;
    }

    // Clamp in floating point first so far off-screen ranges never overflow the cast
    const double lastIndex = static_cast<double>(count - 1);
    const double first = std::clamp(std::floor(range.from) - 1.0, 0.0, lastIndex + 1.0);
    const double last = std::clamp(std::ceil(range.to) + 1.0, -1.0, lastIndex);

    paint.first = static_cast<long long>(first);
    paint.last = static_cast<long long>(last);
    return paint;
}

double IOverlayStrategy::calculateFontSize(double barWidth) {
    if (!std::isfinite(barWidth)) return kMinFontPx;
    return std::clamp(barWidth * kFontToBarWidth, kMinFontPx, kMaxFontPx);
}

} // namespace tdchart
