/*
TdChart — CoordinateSystem
Role: Maps prices to pane pixels and bar indices to horizontal pixel centers.
Inputs/Outputs: Takes world values (price, fractional bar index) and pane geometry; outputs pixel coordinates.
Threading: Conversion methods are pure functions and thread-safe.
Performance: Simple arithmetic only.
Integration: IPriceAxis is the capability a host chart surface implements; ViewportPriceAxis is
             the linear implementation used by the CLI and tests.
Observability: Invalid viewports are reported on the render category.
Related: CoordinateSystem.cpp, TdSetupOverlayStrategy.hpp, OverlayTypes.hpp.
Assumptions: Linear price scale; y grows downwards from the pane top.
*/
#pragma once
#include "../core/marketdata/model/Bar.h"
#include <QString>
#include <optional>

namespace tdchart {

struct PaneBounding {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return left + width; }
    double bottom() const { return top + height; }
};

// Fractional bar-index window shown by the host.
struct VisibleRange {
    double from = 0.0;
    double to = 0.0;
};

struct Viewport {
    double priceMin = 0.0;
    double priceMax = 0.0;
    PaneBounding pane;
};

// Host-provided price to pixel conversion; the only coupling point to the chart surface.
class IPriceAxis {
public:
    virtual ~IPriceAxis() = default;
    virtual double convertToPixel(double price) const = 0;
};

class CoordinateSystem {
public:
    // NaN when the viewport is invalid so callers can fall back to a pane edge
    static double priceToPixel(double price, const Viewport& viewport);
    static double pixelToPrice(double y, const Viewport& viewport);

    static double barCenterX(double index, const VisibleRange& range, const PaneBounding& pane, double barWidth);
    static std::optional<long long> barIndexAtX(double x, const VisibleRange& range, const PaneBounding& pane, double barWidth);

    /**
     * Price scale fitted to the low/high of the bars inside range, padded by marginRatio.
     * The window is clamped to the series in floating point first.
     * @return nullopt when range is not finite, reversed or does not overlap the series
     */
    static std::optional<Viewport> fitViewport(BarSpan bars, const VisibleRange& range,
                                               const PaneBounding& pane, double marginRatio = 0.1);

    static bool validateViewport(const Viewport& viewport);
    static QString viewportDebugString(const Viewport& viewport);

private:
    static double normalizePrice(double price, const Viewport& viewport);
    static constexpr double EPSILON = 1e-10;
};

class ViewportPriceAxis : public IPriceAxis {
public:
    explicit ViewportPriceAxis(const Viewport& viewport) : m_viewport(viewport) {}

    double convertToPixel(double price) const override {
        return CoordinateSystem::priceToPixel(price, m_viewport);
    }

    const Viewport& viewport() const { return m_viewport; }

private:
    Viewport m_viewport;
};

} // namespace tdchart
