#include "TdSetupOverlayStrategy.hpp"
#include "../ILabelCanvas.hpp"
#include "../../TdChartLogging.hpp"
#include <algorithm>
#include <cmath>

namespace tdchart {

bool TdSetupOverlayStrategy::draw(ILabelCanvas& canvas, const OverlayFrame& frame) const {
    if (frame.results.empty()) {
        return false;
    }

    const PaintRange range = calculatePaintRange(frame.visibleRange, frame.results.size());
    const double barWidth = frame.barWidth;
    const double left = frame.bounding.left;
    const double right = frame.bounding.right();
    const double top = frame.bounding.top;
    const double bottom = frame.bounding.bottom();
    const double fontSize = calculateFontSize(barWidth);

    canvas.save();
    canvas.setFont(fontSize, true);

    int labels = 0;
    for (long long index = range.first; index <= range.last; ++index) {
        const auto position = static_cast<size_t>(index);
        if (position >= frame.results.size() || position >= frame.bars.size()) {
            continue;
        }
        const SetupResult& setup = frame.results[position];
        const Bar& bar = frame.bars[position];

        const double x = CoordinateSystem::barCenterX(static_cast<double>(index), frame.visibleRange,
                                                      frame.bounding, barWidth);
        if (!std::isfinite(x) || x < left - barWidth || x > right + barWidth) {
            continue;
        }

        if (setup.sellSetup) {
            const double highPx = toPixel(frame.priceAxis, sellAnchorPrice(bar), top);
            const double y = std::max(top + fontSize * 0.6, highPx - fontSize * 0.8);
            canvas.setFillColor(calculateColor(*setup.sellSetup, true));
            canvas.fillText(QString::number(*setup.sellSetup), QPointF(x, y));
            ++labels;
        }

        if (setup.buySetup) {
            const double lowPx = toPixel(frame.priceAxis, buyAnchorPrice(bar), bottom);
            const double y = std::min(bottom - fontSize * 0.6, lowPx + fontSize * 0.8);
            canvas.setFillColor(calculateColor(*setup.buySetup, false));
            canvas.fillText(QString::number(*setup.buySetup), QPointF(x, y));
            ++labels;
        }
    }

    canvas.restore();
    tLog_Render("TdSetup overlay:" << labels << "labels over bars" << range.first << "-" << range.last);
    return true;
}

QColor TdSetupOverlayStrategy::calculateColor(int count, bool isSell) const {
    // Completion mode only ever emits finished setups
    if (m_variant.emit == EmitMode::CompletionIndexOnly || count >= kSetupCompleteCount) {
        return m_palette.highlight;
    }
    return isSell ? m_palette.sell : m_palette.buy;
}

double TdSetupOverlayStrategy::sellAnchorPrice(const Bar& bar) const {
    if (m_variant.emit == EmitMode::CompletionIndexOnly) {
        return std::max(bar.high, bar.close);
    }
    return bar.high;
}

double TdSetupOverlayStrategy::buyAnchorPrice(const Bar& bar) const {
    if (m_variant.emit == EmitMode::CompletionIndexOnly) {
        return std::min(bar.low, bar.close);
    }
    return bar.low;
}

double TdSetupOverlayStrategy::toPixel(const IPriceAxis* axis, double price, double fallback) const {
    if (!axis) {
        return fallback;
    }
    const double pixel = axis->convertToPixel(price);
    return std::isfinite(pixel) ? pixel : fallback;
}

} // namespace tdchart
