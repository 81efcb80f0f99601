#include "CoordinateSystem.h"
#include "TdChartLogging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tdchart {

double CoordinateSystem::priceToPixel(double price, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        tLog_RenderN(50, "Invalid viewport:" << viewportDebugString(viewport));
        return std::numeric_limits<double>::quiet_NaN();
    }

    double normalizedPrice = normalizePrice(price, viewport);
    return viewport.pane.top + (1.0 - normalizedPrice) * viewport.pane.height;  // Flip Y for screen coordinates
}

double CoordinateSystem::pixelToPrice(double y, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double normalizedPrice = 1.0 - ((y - viewport.pane.top) / viewport.pane.height);
    return viewport.priceMin + normalizedPrice * (viewport.priceMax - viewport.priceMin);
}

double CoordinateSystem::barCenterX(double index, const VisibleRange& range, const PaneBounding& pane, double barWidth) {
    const double relativeIndex = index - range.from;
    return pane.left + (relativeIndex + 0.5) * barWidth;
}

std::optional<long long> CoordinateSystem::barIndexAtX(double x, const VisibleRange& range, const PaneBounding& pane, double barWidth) {
    if (!(barWidth > EPSILON) || !std::isfinite(x)) {
        return std::nullopt;
    }
    const double index = std::floor(range.from + (x - pane.left) / barWidth);
    if (!std::isfinite(index)) {
        return std::nullopt;
    }
    return static_cast<long long>(index);
}

std::optional<Viewport> CoordinateSystem::fitViewport(BarSpan bars, const VisibleRange& range,
                                                      const PaneBounding& pane, double marginRatio) {
    if (bars.empty() || !std::isfinite(range.from) || !std::isfinite(range.to) || range.to < range.from) {
        return std::nullopt;
    }

    const double lastIndex = static_cast<double>(bars.size() - 1);
    const double first = std::max(0.0, std::floor(range.from));
    const double last = std::min(lastIndex, std::ceil(range.to));
    if (first > last) {
        return std::nullopt;
    }

    double priceMin = std::numeric_limits<double>::max();
    double priceMax = std::numeric_limits<double>::lowest();
    const auto end = static_cast<size_t>(last);
    for (auto i = static_cast<size_t>(first); i <= end; ++i) {
        if (!std::isfinite(bars[i].low) || !std::isfinite(bars[i].high)) continue;
        priceMin = std::min(priceMin, bars[i].low);
        priceMax = std::max(priceMax, bars[i].high);
    }
    if (priceMin > priceMax) {
        return std::nullopt;
    }

    const double margin = std::max((priceMax - priceMin) * marginRatio, 1e-6);
    return Viewport{priceMin - margin, priceMax + margin, pane};
}

bool CoordinateSystem::validateViewport(const Viewport& viewport) {
    return std::isfinite(viewport.priceMin) && std::isfinite(viewport.priceMax) &&
           viewport.priceMax - viewport.priceMin > EPSILON &&
           viewport.pane.height > EPSILON;
}

QString CoordinateSystem::viewportDebugString(const Viewport& viewport) {
    return QString("Viewport{price: %1-%2, pane: %3,%4 %5x%6}")
        .arg(viewport.priceMin)
        .arg(viewport.priceMax)
        .arg(viewport.pane.left)
        .arg(viewport.pane.top)
        .arg(viewport.pane.width)
        .arg(viewport.pane.height);
}

double CoordinateSystem::normalizePrice(double price, const Viewport& viewport) {
    double priceRange = viewport.priceMax - viewport.priceMin;
    if (priceRange <= EPSILON) return 0.0;

    return (price - viewport.priceMin) / priceRange;
}

} // namespace tdchart
