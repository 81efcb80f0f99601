#pragma once
#include "../CoordinateSystem.h"
#include "../../core/indicators/TdSetupTypes.hpp"
#include "../../core/marketdata/model/Bar.h"

namespace tdchart {

// Everything an overlay needs for one frame. Spans reference host-owned data
// that must outlive the draw call.
struct OverlayFrame {
    SetupSpan results;
    BarSpan bars;
    VisibleRange visibleRange;
    PaneBounding bounding;
    const IPriceAxis* priceAxis = nullptr;  // null: labels fall back to the pane edge
    double barWidth = 0.0;
};

// Inclusive index window an overlay walks, padded one bar each side.
struct PaintRange {
    long long first = 0;
    long long last = -1;

    bool empty() const { return last < first; }
    long long size() const { return empty() ? 0 : last - first + 1; }
};

} // namespace tdchart
