#pragma once

#include "model/Bar.h"
#include <cstdint>
#include <string>
#include <vector>

namespace tdchart {

struct MockSymbol {
    std::string ticker;
    std::string name;
    std::string market;
};

/**
 * Deterministic synthetic daily bars for demos and tests.
 * The same ticker, seed and length produce the same series on every platform:
 * seeding and draws use only the fixed mt19937 and seed_seq algorithms.
 */
class MockBarFeed {
public:
    static constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
    static constexpr size_t kDefaultLength = 520;
    static constexpr int64_t kDefaultStartMs = 1704067200000LL;  // 2024-01-01T00:00:00Z

    static const std::vector<MockSymbol>& symbols();

    static BarSeries generate(const std::string& ticker,
                              size_t length = kDefaultLength,
                              uint32_t seed = 42,
                              int64_t startMs = kDefaultStartMs);

    static double basePrice(const std::string& ticker);
    static double volatility(const std::string& ticker);
};

} // namespace tdchart
