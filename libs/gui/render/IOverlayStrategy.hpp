#pragma once
#include "OverlayTypes.hpp"
#include <QColor>

namespace tdchart {

class ILabelCanvas;

/**
 * A pluggable price-pane overlay. Implementations paint one frame through the
 * canvas and keep no state between calls.
 */
class IOverlayStrategy {
public:
    virtual ~IOverlayStrategy() = default;

    // Returns false when there was nothing to paint.
    virtual bool draw(ILabelCanvas& canvas, const OverlayFrame& frame) const = 0;
    virtual QColor calculateColor(int count, bool isSell) const = 0;
    virtual const char* getStrategyName() const = 0;

    static constexpr double kMinFontPx = 11.0;
    static constexpr double kMaxFontPx = 18.0;
    static constexpr double kFontToBarWidth = 0.75;

    static PaintRange calculatePaintRange(const VisibleRange& range, size_t count);
    static double calculateFontSize(double barWidth);
};

} // namespace tdchart
