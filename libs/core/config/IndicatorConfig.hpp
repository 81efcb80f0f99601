/*
TdChart — IndicatorConfig
Role: The TD Setup indicator catalog: built-in variants plus optional JSON overrides.
Inputs/Outputs: Reads a JSON document (string or file); outputs the list of indicator options.
Threading: Pure functions; no shared state.
Integration: Consumed by initializeCustomIndicators() and the CLI.
Observability: Logs skipped or defaulted entries through Log.hpp.
Related: IndicatorConfig.cpp, TdSetupIndicator.hpp.
Assumptions: Indicator names are unique; an entry repeating a name overrides the earlier one.
*/
#pragma once

#include "../indicators/TdSetupTypes.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tdchart {

class IndicatorConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Hex colors ("#rrggbb" or "#aarrggbb") so the core stays free of GUI types.
struct TdSetupColors {
    std::string sell = "#f87171";
    std::string buy = "#4ade80";
    std::string highlight = "#facc15";

    bool operator==(const TdSetupColors&) const = default;
};

struct TdSetupOptions {
    std::string name;
    std::string shortName;
    TdSetupVariant variant;
    TdSetupColors colors;
};

namespace IndicatorConfig {

inline constexpr const char* kRangeAwareName = "TD_SETUP";
inline constexpr const char* kCloseOnlyName = "TD_SETUP_CLOSE";

// TD_SETUP (range-aware) and TD_SETUP_CLOSE (close-only), in that order.
std::vector<TdSetupOptions> defaultTdSetupOptions();

TdSetupColors defaultColors(bool closeOnly);

/**
 * Parse {"indicators": [...]} into options. Entries naming a known indicator
 * override it in place; other entries are appended. Missing fields keep defaults.
 * @throws IndicatorConfigError on malformed JSON or invalid field values
 */
std::vector<TdSetupOptions> parse(std::string_view json);

// @throws IndicatorConfigError when the file cannot be read or parsed
std::vector<TdSetupOptions> loadFile(const std::filesystem::path& path);

bool isValidHexColor(std::string_view text);

} // namespace IndicatorConfig
} // namespace tdchart
