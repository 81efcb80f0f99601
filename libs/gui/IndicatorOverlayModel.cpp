#include "IndicatorOverlayModel.h"
#include "TdChartLogging.hpp"
#include <QElapsedTimer>
#include <stdexcept>

namespace tdchart {

IndicatorOverlayModel::IndicatorOverlayModel(std::shared_ptr<const IndicatorDescriptor> descriptor, QObject* parent)
    : QObject(parent)
    , m_descriptor(std::move(descriptor)) {
    if (!m_descriptor || !m_descriptor->isComplete()) {
        throw std::invalid_argument("IndicatorOverlayModel requires a complete indicator descriptor");
    }
}

void IndicatorOverlayModel::setBars(BarSeries bars) {
    m_bars = std::move(bars);
    recompute();
}

bool IndicatorOverlayModel::appendBar(const Bar& bar) {
    if (!m_bars.empty()) {
        const int64_t lastTimestamp = m_bars.back().timestamp_ms;
        if (bar.timestamp_ms < lastTimestamp) {
            tLog_Warning("IndicatorOverlayModel: Ignored out-of-order bar" << bar.timestamp_ms
                         << "before" << lastTimestamp);
            return false;
        }
        if (bar.timestamp_ms == lastTimestamp) {
            m_bars.back() = bar;
            recompute();
            return true;
        }
    }
    m_bars.push_back(bar);
    recompute();
    return true;
}

bool IndicatorOverlayModel::drawFrame(ILabelCanvas& canvas,
                                      const VisibleRange& visibleRange,
                                      const PaneBounding& bounding,
                                      const IPriceAxis* priceAxis,
                                      double barWidth) const {
    OverlayFrame frame;
    frame.results = m_results;
    frame.bars = m_bars;
    frame.visibleRange = visibleRange;
    frame.bounding = bounding;
    frame.priceAxis = priceAxis;
    frame.barWidth = barWidth;
    return m_descriptor->draw(canvas, frame);
}

TooltipPayload IndicatorOverlayModel::tooltipAt(std::optional<long long> cursorIndex) const {
    return m_descriptor->tooltip(m_results, cursorIndex);
}

void IndicatorOverlayModel::recompute() {
    QElapsedTimer timer;
    timer.start();

    // Always from scratch; results are never patched in place
    m_results = m_descriptor->calc(m_bars);

    tLog_Data("Recomputed" << QString::fromStdString(m_descriptor->name) << "over" << m_bars.size()
              << "bars in" << timer.nsecsElapsed() / 1000 << "us");
    emit resultsChanged(static_cast<int>(m_results.size()));
}

} // namespace tdchart
