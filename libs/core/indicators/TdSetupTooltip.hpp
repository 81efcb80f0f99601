#pragma once

#include "TdSetupTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tdchart {

struct TooltipValue {
    std::string title;
    std::string value;

    bool operator==(const TooltipValue&) const = default;
};

struct TooltipPayload {
    std::string name;
    std::vector<TooltipValue> values;

    // Value text for a title, or empty when no such entry exists.
    std::string valueFor(std::string_view title) const;
};

/**
 * Builds the tooltip labels for the bar under the cursor.
 * Falls back to the last bar when the cursor is absent or outside the results.
 */
class TdSetupTooltip {
public:
    static constexpr const char* kPlaceholder = "--";
    static constexpr const char* kSellTitle = "Sell Setup";
    static constexpr const char* kBuyTitle = "Buy Setup";

    static TooltipPayload project(SetupSpan results,
                                  std::optional<long long> cursorIndex,
                                  const std::string& shortName = {});

    static std::optional<size_t> resolveIndex(SetupSpan results, std::optional<long long> cursorIndex);
};

} // namespace tdchart
