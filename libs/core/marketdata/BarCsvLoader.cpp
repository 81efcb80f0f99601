#include "BarCsvLoader.hpp"
#include "../Log.hpp"
#include "../ParseUtils.hpp"
#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

namespace tdchart {

namespace {

constexpr const char* kLogCat = "csv";
constexpr int kMissing = -1;

struct ColumnMap {
    int symbol = kMissing;
    int timestamp = kMissing;
    int price = kMissing;
    int open = kMissing;
    int high = kMissing;
    int low = kMissing;
    int close = kMissing;
    int volume = kMissing;

    bool hasOhlc() const { return open != kMissing && high != kMissing && low != kMissing && close != kMissing; }
};

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(ParseUtils::trim(line.substr(start)));
            break;
        }
        fields.push_back(ParseUtils::trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t newline = text.find('\n', start);
        auto line = text.substr(start, newline == std::string_view::npos ? std::string_view::npos : newline - start);
        if (!ParseUtils::trim(line).empty()) {
            lines.push_back(line);
        }
        if (newline == std::string_view::npos) break;
        start = newline + 1;
    }
    return lines;
}

ColumnMap mapColumns(const std::vector<std::string_view>& header) {
    ColumnMap map;
    for (int i = 0; i < static_cast<int>(header.size()); ++i) {
        const auto name = ParseUtils::toLower(header[i]);
        if (name == "symbol" || name == "ticker") map.symbol = i;
        else if (name == "publisheddate" || name == "timestamp" || name == "date" || name == "time") {
            if (map.timestamp == kMissing) map.timestamp = i;
        }
        else if (name == "price") map.price = i;
        else if (name == "open") map.open = i;
        else if (name == "high") map.high = i;
        else if (name == "low") map.low = i;
        else if (name == "close") map.close = i;
        else if (name == "volume") map.volume = i;
    }
    return map;
}

int maxIndex(const ColumnMap& map) {
    return std::max({map.symbol, map.timestamp, map.price, map.open, map.high, map.low, map.close});
}

std::optional<int64_t> parseVolume(std::string_view text) {
    if (auto integer = ParseUtils::parseInt64(text)) {
        if (*integer >= 0) return integer;
        return std::nullopt;
    }
    if (auto real = ParseUtils::parseDouble(text)) {
        if (*real >= 0.0) return static_cast<int64_t>(*real + 0.5);
    }
    return std::nullopt;
}

// Stable sort by timestamp, keeping the last row of any duplicated timestamp.
template<class Row, class Key>
void sortAndDedupe(std::vector<Row>& rows, Key timestampOf, const std::string& symbol, size_t& skipped) {
    std::stable_sort(rows.begin(), rows.end(),
                     [&](const Row& a, const Row& b) { return timestampOf(a) < timestampOf(b); });
    std::vector<Row> unique;
    unique.reserve(rows.size());
    for (auto& row : rows) {
        if (!unique.empty() && timestampOf(unique.back()) == timestampOf(row)) {
            LOG_W(kLogCat, "duplicate timestamp {} for {}, keeping the later row", timestampOf(row), symbol);
            unique.back() = row;
            ++skipped;
            continue;
        }
        unique.push_back(row);
    }
    rows.swap(unique);
}

} // namespace

std::vector<std::string> BarCsvData::symbols() const {
    std::vector<std::string> out;
    out.reserve(series.size());
    for (const auto& [symbol, bars] : series) out.push_back(symbol);
    return out;
}

const BarSeries* BarCsvData::find(const std::string& symbol) const {
    auto it = series.find(symbol);
    return it == series.end() ? nullptr : &it->second;
}

BarSeries BarCsvLoader::synthesizeFromCloses(const std::vector<std::pair<int64_t, double>>& closes) {
    BarSeries bars;
    bars.reserve(closes.size());
    double previousClose = closes.empty() ? 0.0 : closes.front().second;
    for (const auto& [timestamp, close] : closes) {
        Bar bar;
        bar.timestamp_ms = timestamp;
        bar.open = (previousClose + close) / 2.0;
        bar.close = close;
        bar.high = std::max(bar.open, close);
        bar.low = std::min(bar.open, close);
        bars.push_back(bar);
        previousClose = close;
    }
    return bars;
}

BarCsvData BarCsvLoader::parse(std::string_view text, const std::string& defaultSymbol) {
    const auto lines = splitLines(text);
    if (lines.empty()) {
        throw BarCsvError("CSV input is empty");
    }

    const ColumnMap columns = mapColumns(splitFields(lines.front()));
    const bool ohlcMode = columns.hasOhlc();
    if (columns.timestamp == kMissing || (!ohlcMode && columns.price == kMissing)) {
        throw BarCsvError("CSV header must include a date column (publisheddate/timestamp/date) "
                          "and either price or open,high,low,close columns");
    }

    BarCsvData data;
    std::map<std::string, BarSeries> ohlcRows;
    std::map<std::string, std::vector<std::pair<int64_t, double>>> closeRows;
    const int required = maxIndex(columns);

    for (size_t lineIndex = 1; lineIndex < lines.size(); ++lineIndex) {
        const size_t lineNumber = lineIndex + 1;
        const auto fields = splitFields(lines[lineIndex]);
        if (static_cast<int>(fields.size()) <= required) {
            LOG_W(kLogCat, "row {} skipped: expected at least {} columns", lineNumber, required + 1);
            ++data.skippedRows;
            continue;
        }

        std::string symbol = defaultSymbol;
        if (columns.symbol != kMissing) {
            symbol = std::string(fields[columns.symbol]);
            if (symbol.empty()) {
                LOG_W(kLogCat, "row {} skipped: symbol is missing", lineNumber);
                ++data.skippedRows;
                continue;
            }
        }

        auto timestamp = ParseUtils::parseTimestampMs(fields[columns.timestamp]);
        if (!timestamp) {
            LOG_W(kLogCat, "row {} skipped: invalid date '{}'", lineNumber, fields[columns.timestamp]);
            ++data.skippedRows;
            continue;
        }

        if (!ohlcMode) {
            auto price = ParseUtils::parseDouble(fields[columns.price]);
            if (!price) {
                LOG_W(kLogCat, "row {} skipped: invalid price '{}'", lineNumber, fields[columns.price]);
                ++data.skippedRows;
                continue;
            }
            closeRows[symbol].emplace_back(*timestamp, *price);
            continue;
        }

        auto open = ParseUtils::parseDouble(fields[columns.open]);
        auto high = ParseUtils::parseDouble(fields[columns.high]);
        auto low = ParseUtils::parseDouble(fields[columns.low]);
        auto close = ParseUtils::parseDouble(fields[columns.close]);
        if (!open || !high || !low || !close) {
            LOG_W(kLogCat, "row {} skipped: invalid OHLC values", lineNumber);
            ++data.skippedRows;
            continue;
        }

        Bar bar;
        bar.timestamp_ms = *timestamp;
        bar.open = *open;
        bar.high = *high;
        bar.low = *low;
        bar.close = *close;
        if (columns.volume != kMissing && columns.volume < static_cast<int>(fields.size())) {
            bar.volume = parseVolume(fields[columns.volume]);
        }
        ohlcRows[symbol].push_back(bar);
    }

    for (auto& [symbol, bars] : ohlcRows) {
        sortAndDedupe(bars, [](const Bar& b) { return b.timestamp_ms; }, symbol, data.skippedRows);
        data.series[symbol] = std::move(bars);
    }
    for (auto& [symbol, closes] : closeRows) {
        sortAndDedupe(closes, [](const std::pair<int64_t, double>& c) { return c.first; }, symbol, data.skippedRows);
        data.series[symbol] = synthesizeFromCloses(closes);
    }

    if (data.series.empty()) {
        throw BarCsvError("no valid rows were found in the CSV input");
    }

    LOG_D(kLogCat, "parsed {} symbols ({} rows skipped)", data.series.size(), data.skippedRows);
    return data;
}

BarCsvData BarCsvLoader::loadFile(const std::filesystem::path& path, const std::string& defaultSymbol) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw BarCsvError("cannot open CSV file " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto data = parse(buffer.str(), defaultSymbol);
    LOG_I(kLogCat, "loaded {} symbols from {}", data.series.size(), path.string());
    return data;
}

} // namespace tdchart
