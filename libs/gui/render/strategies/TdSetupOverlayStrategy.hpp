/*
TdChart — TdSetupOverlayStrategy
Role: Paints TD Setup counts above (sell) and below (buy) each visible bar.
Inputs/Outputs: Implements IOverlayStrategy; turns an OverlayFrame into fillText calls on an ILabelCanvas.
Threading: Called on the GUI thread once per frame; const and stateless.
Performance: Walks only the visible index window plus one bar of padding on each side.
Integration: Wired into an IndicatorDescriptor's draw callback by TdSetupIndicator.
Observability: Throttled frame summaries on the render category.
Related: TdSetupOverlayStrategy.cpp, IOverlayStrategy.hpp, TdSetupCalculator.hpp.
Assumptions: results and bars in the frame are index-aligned.
*/
#pragma once
#include "../IOverlayStrategy.hpp"
#include "../../themes/TdSetupPalette.hpp"
#include <utility>

namespace tdchart {

class TdSetupOverlayStrategy : public IOverlayStrategy {
public:
    TdSetupOverlayStrategy(TdSetupVariant variant, TdSetupPalette palette)
        : m_variant(variant), m_palette(std::move(palette)) {}
    ~TdSetupOverlayStrategy() override = default;

    bool draw(ILabelCanvas& canvas, const OverlayFrame& frame) const override;
    QColor calculateColor(int count, bool isSell) const override;
    const char* getStrategyName() const override { return "TdSetupLabels"; }

    const TdSetupVariant& variant() const { return m_variant; }
    const TdSetupPalette& palette() const { return m_palette; }

private:
    double sellAnchorPrice(const Bar& bar) const;
    double buyAnchorPrice(const Bar& bar) const;
    double toPixel(const IPriceAxis* axis, double price, double fallback) const;

    TdSetupVariant m_variant;
    TdSetupPalette m_palette;
};

} // namespace tdchart
