#include "TdSetupCalculator.hpp"
#include <algorithm>
#include <cmath>

namespace tdchart {

namespace {

// Any comparison involving a non-finite price fails.
bool finite(double a, double b) { return std::isfinite(a) && std::isfinite(b); }

} // namespace

SetupResults TdSetupCalculator::calculate(BarSpan bars) const {
    SetupResults results;
    results.reserve(bars.size());

    int sellStreak = 0;
    int buyStreak = 0;

    for (size_t index = 0; index < bars.size(); ++index) {
        SetupResult result;

        if (index < static_cast<size_t>(kSetupLookback)) {
            sellStreak = 0;
            buyStreak = 0;
            results.push_back(result);
            continue;
        }

        const Bar& current = bars[index];
        const Bar& compared = bars[index - kSetupLookback];

        if (sellCondition(current, compared)) {
            ++sellStreak;
            result.sellSetup = emit(sellStreak);
        } else {
            sellStreak = 0;
        }

        if (buyCondition(current, compared)) {
            ++buyStreak;
            result.buySetup = emit(buyStreak);
        } else {
            buyStreak = 0;
        }

        results.push_back(result);
    }

    return results;
}

bool TdSetupCalculator::sellCondition(const Bar& current, const Bar& compared) const {
    const bool closeCondition = finite(current.close, compared.close) && current.close > compared.close;
    if (m_variant.closeOnly) return closeCondition;
    return closeCondition && finite(current.high, compared.high) && current.high >= compared.high;
}

bool TdSetupCalculator::buyCondition(const Bar& current, const Bar& compared) const {
    const bool closeCondition = finite(current.close, compared.close) && current.close < compared.close;
    if (m_variant.closeOnly) return closeCondition;
    return closeCondition && finite(current.low, compared.low) && current.low <= compared.low;
}

std::optional<int> TdSetupCalculator::emit(int streak) const {
    switch (m_variant.emit) {
        case EmitMode::Count:
            return std::min(streak, kSetupCompleteCount);
        case EmitMode::CompletionIndexOnly:
            if (streak == kSetupCompleteCount) return kSetupCompleteCount;
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace tdchart
