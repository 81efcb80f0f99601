#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tdchart {

// Per-bar TD Setup output, index-aligned with the input bars.
struct SetupResult {
    std::optional<int> sellSetup;
    std::optional<int> buySetup;

    bool empty() const { return !sellSetup && !buySetup; }
    bool operator==(const SetupResult&) const = default;
};

using SetupResults = std::vector<SetupResult>;
using SetupSpan = std::span<const SetupResult>;

enum class EmitMode {
    Count,                // saturating count on every bar of a streak
    CompletionIndexOnly   // a single 9 on the bar where the streak completes
};

struct TdSetupVariant {
    bool closeOnly = false;
    EmitMode emit = EmitMode::Count;

    bool operator==(const TdSetupVariant&) const = default;
};

inline constexpr int kSetupLookback = 4;
inline constexpr int kSetupCompleteCount = 9;

inline const char* toString(EmitMode mode) {
    switch (mode) {
        case EmitMode::Count:               return "count";
        case EmitMode::CompletionIndexOnly: return "completionIndexOnly";
    }
    return "count";
}

inline std::optional<EmitMode> emitModeFromString(std::string_view text) {
    if (text == "count") return EmitMode::Count;
    if (text == "completionIndexOnly") return EmitMode::CompletionIndexOnly;
    return std::nullopt;
}

} // namespace tdchart
