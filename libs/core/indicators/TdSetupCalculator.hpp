/*
TdChart — TdSetupCalculator
Role: Computes TD Setup counts (sequential 4-bar lookback comparison) over a bar series.
Inputs/Outputs: Takes a read-only span of bars and a variant; returns one SetupResult per bar.
Threading: Stateless; safe to call from any thread.
Performance: Single O(n) pass, O(1) state beyond the output vector.
Integration: Wrapped by TdSetupIndicator into an IndicatorDescriptor's calc callback.
Observability: No internal logging.
Related: TdSetupTypes.hpp, TdSetupTooltip.hpp, TdSetupOverlayStrategy.hpp.
Assumptions: The lookback is positional, not time-based; gaps in timestamps are irrelevant.
*/
#pragma once

#include "TdSetupTypes.hpp"
#include "../marketdata/model/Bar.h"

namespace tdchart {

class TdSetupCalculator {
public:
    explicit TdSetupCalculator(TdSetupVariant variant = {}) : m_variant(variant) {}

    // Never throws; an empty series yields an empty result.
    SetupResults calculate(BarSpan bars) const;

    const TdSetupVariant& variant() const { return m_variant; }

    static SetupResults calculate(BarSpan bars, const TdSetupVariant& variant) {
        return TdSetupCalculator(variant).calculate(bars);
    }

private:
    bool sellCondition(const Bar& current, const Bar& compared) const;
    bool buyCondition(const Bar& current, const Bar& compared) const;
    std::optional<int> emit(int streak) const;

    TdSetupVariant m_variant;
};

} // namespace tdchart
