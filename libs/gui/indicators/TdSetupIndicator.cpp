#include "TdSetupIndicator.hpp"
#include "IndicatorRegistry.hpp"
#include "../render/strategies/TdSetupOverlayStrategy.hpp"
#include "../TdChartLogging.hpp"
#include "../../core/indicators/TdSetupCalculator.hpp"
#include <memory>

namespace tdchart {

IndicatorDescriptor TdSetupIndicator::create(const TdSetupOptions& options) {
    auto calculator = std::make_shared<const TdSetupCalculator>(options.variant);
    auto overlay = std::make_shared<const TdSetupOverlayStrategy>(
        options.variant, TdSetupPalette::fromColors(options.colors, options.variant.closeOnly));

    IndicatorDescriptor descriptor;
    descriptor.name = options.name;
    descriptor.shortName = options.shortName.empty() ? options.name : options.shortName;
    descriptor.precision = 0;
    descriptor.series = IndicatorSeries::Price;

    descriptor.calc = [calculator](BarSpan bars) {
        return calculator->calculate(bars);
    };
    descriptor.draw = [overlay](ILabelCanvas& canvas, const OverlayFrame& frame) {
        return overlay->draw(canvas, frame);
    };
    descriptor.tooltip = [shortName = descriptor.shortName](SetupSpan results, std::optional<long long> cursorIndex) {
        return TdSetupTooltip::project(results, cursorIndex, shortName);
    };

    return descriptor;
}

int TdSetupIndicator::initializeCustomIndicators(IndicatorRegistry& registry,
                                                 const std::vector<TdSetupOptions>& options) {
    int added = 0;
    for (const auto& option : options) {
        if (registry.contains(option.name)) {
            continue;
        }
        if (registry.registerIndicator(create(option))) {
            ++added;
        }
    }
    tLog_App("TD Setup indicators initialized:" << added << "new," << registry.size() << "registered");
    return added;
}

} // namespace tdchart
