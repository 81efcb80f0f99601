#include "TdSetupTooltip.hpp"

namespace tdchart {

namespace {

std::string formatCount(const std::optional<int>& count) {
    return count ? std::to_string(*count) : std::string(TdSetupTooltip::kPlaceholder);
}

} // namespace

std::string TooltipPayload::valueFor(std::string_view title) const {
    for (const auto& entry : values) {
        if (entry.title == title) return entry.value;
    }
    return {};
}

std::optional<size_t> TdSetupTooltip::resolveIndex(SetupSpan results, std::optional<long long> cursorIndex) {
    if (results.empty()) return std::nullopt;
    if (cursorIndex && *cursorIndex >= 0 && static_cast<size_t>(*cursorIndex) < results.size()) {
        return static_cast<size_t>(*cursorIndex);
    }
    return results.size() - 1;
}

TooltipPayload TdSetupTooltip::project(SetupSpan results,
                                       std::optional<long long> cursorIndex,
                                       const std::string& shortName) {
    TooltipPayload payload;
    payload.name = shortName;

    std::optional<int> sell;
    std::optional<int> buy;
    if (auto target = resolveIndex(results, cursorIndex)) {
        sell = results[*target].sellSetup;
        buy = results[*target].buySetup;
    }

    payload.values.push_back({kSellTitle, formatCount(sell)});
    payload.values.push_back({kBuyTitle, formatCount(buy)});
    return payload;
}

} // namespace tdchart
