/*
TdChart — IndicatorOverlayModel
Role: Host-side glue binding one indicator descriptor to one bar series.
Inputs/Outputs: Receives bar series changes; caches the indicator result; forwards frames and cursor queries.
Threading: Lives on the GUI thread.
Performance: One full recompute per series change; draw and tooltip read the cached results by reference.
Integration: A chart pane owns one model per enabled indicator.
Observability: Recomputes are logged on the data category.
Related: IndicatorOverlayModel.cpp, IndicatorDescriptor.hpp, IndicatorRegistry.hpp.
Assumptions: Appended bars never go back in time.
*/
#pragma once
#include "indicators/IndicatorDescriptor.hpp"
#include <QObject>
#include <memory>

namespace tdchart {

class IndicatorOverlayModel : public QObject {
    Q_OBJECT

public:
    explicit IndicatorOverlayModel(std::shared_ptr<const IndicatorDescriptor> descriptor,
                                   QObject* parent = nullptr);

    // Full reload.
    void setBars(BarSeries bars);

    /**
     * Append a new bar, or replace the last one when the timestamp matches (live update).
     * Returns false and leaves the series untouched when the bar is older than the last one.
     */
    bool appendBar(const Bar& bar);

    const BarSeries& bars() const { return m_bars; }
    SetupSpan results() const { return m_results; }
    const IndicatorDescriptor& descriptor() const { return *m_descriptor; }

    bool drawFrame(ILabelCanvas& canvas,
                   const VisibleRange& visibleRange,
                   const PaneBounding& bounding,
                   const IPriceAxis* priceAxis,
                   double barWidth) const;

    TooltipPayload tooltipAt(std::optional<long long> cursorIndex) const;

signals:
    void resultsChanged(int barCount);

private:
    void recompute();

    std::shared_ptr<const IndicatorDescriptor> m_descriptor;
    BarSeries m_bars;
    SetupResults m_results;
};

} // namespace tdchart
