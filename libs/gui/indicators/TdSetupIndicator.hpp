#pragma once
#include "IndicatorDescriptor.hpp"
#include "../../core/config/IndicatorConfig.hpp"
#include <vector>

namespace tdchart {

class IndicatorRegistry;

class TdSetupIndicator {
public:
    // Wires calculator, overlay and tooltip for one variant into a descriptor.
    static IndicatorDescriptor create(const TdSetupOptions& options);

    /**
     * Register every configured TD Setup variant that the registry does not know yet.
     * Safe to call on every start-up.
     * @return number of indicators newly registered
     */
    static int initializeCustomIndicators(IndicatorRegistry& registry,
                                          const std::vector<TdSetupOptions>& options = IndicatorConfig::defaultTdSetupOptions());
};

} // namespace tdchart
