#pragma once
#include "../render/OverlayTypes.hpp"
#include "../../core/indicators/TdSetupTooltip.hpp"
#include <functional>
#include <optional>
#include <string>

namespace tdchart {

class ILabelCanvas;

enum class IndicatorSeries {
    Price,   // overlays the main candle pane
    Normal   // own sub-pane
};

// The registration unit a host chart surface consumes.
struct IndicatorDescriptor {
    using CalcFn = std::function<SetupResults(BarSpan)>;
    using DrawFn = std::function<bool(ILabelCanvas&, const OverlayFrame&)>;
    using TooltipFn = std::function<TooltipPayload(SetupSpan, std::optional<long long>)>;

    std::string name;
    std::string shortName;
    int precision = 0;
    IndicatorSeries series = IndicatorSeries::Price;

    CalcFn calc;
    DrawFn draw;
    TooltipFn tooltip;

    bool isComplete() const { return !name.empty() && calc && draw && tooltip; }
};

} // namespace tdchart
