/*
TdChart — BarCsvLoader
Role: Reads bar series from CSV text, either full OHLC(V) rows or price-only rows.
Inputs/Outputs: CSV text or file path in; per-symbol, timestamp-ordered bar series out.
Threading: Stateless static functions.
Observability: Skipped rows are logged as warnings through Log.hpp.
Related: Bar.h, MockBarFeed.hpp, apps/tdsetup_cli.
Assumptions: Comma separated, no quoted fields, first non-blank line is the header.
*/
#pragma once

#include "model/Bar.h"
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tdchart {

class BarCsvError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BarCsvData {
    std::map<std::string, BarSeries> series;
    size_t skippedRows = 0;

    std::vector<std::string> symbols() const;
    const BarSeries* find(const std::string& symbol) const;
};

class BarCsvLoader {
public:
    static constexpr const char* kDefaultSymbol = "DEFAULT";

    /**
     * Columns are matched case-insensitively. With open/high/low/close present
     * the rows are used as-is; otherwise a price column is required and bars are
     * synthesized from consecutive prices.
     * @throws BarCsvError for empty input, missing required columns or no valid rows
     */
    static BarCsvData parse(std::string_view text, const std::string& defaultSymbol = kDefaultSymbol);

    // @throws BarCsvError when the file cannot be read, or as parse()
    static BarCsvData loadFile(const std::filesystem::path& path, const std::string& defaultSymbol = kDefaultSymbol);

    // open = (previousClose + close) / 2, high/low bracket open and close.
    static BarSeries synthesizeFromCloses(const std::vector<std::pair<int64_t, double>>& closes);
};

} // namespace tdchart
