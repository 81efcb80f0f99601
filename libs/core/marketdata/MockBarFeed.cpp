#include "MockBarFeed.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace tdchart {

namespace {

double roundCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

// FNV-1a, fixed so the seed does not depend on the standard library's std::hash
uint32_t tickerHash(const std::string& ticker) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : ticker) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

// [0, 1) from one raw mt19937 draw; distributions are implementation-defined
double unitDraw(std::mt19937& rng) {
    return static_cast<double>(rng()) / 4294967296.0;
}

} // namespace

const std::vector<MockSymbol>& MockBarFeed::symbols() {
    static const std::vector<MockSymbol> kSymbols = {
        {"ACME", "Acme Manufacturing", "Industrial"},
        {"BETA", "Beta Biotech", "Healthcare"},
        {"OMEGA", "Omega Energy", "Energy"},
        {"ZEUS", "Zeus Logistics", "Transportation"},
    };
    return kSymbols;
}

double MockBarFeed::basePrice(const std::string& ticker) {
    if (ticker.empty()) return 40.0;
    const auto first = static_cast<unsigned char>(ticker.front());
    return 40.0 + (first % 10) * 5.0 + (ticker.size() % 3) * 3.0;
}

double MockBarFeed::volatility(const std::string& ticker) {
    if (ticker.empty()) return 0.8;
    const auto last = static_cast<unsigned char>(ticker.back());
    return 0.8 + (last % 5) * 0.25;
}

BarSeries MockBarFeed::generate(const std::string& ticker, size_t length, uint32_t seed, int64_t startMs) {
    // Mix the ticker into the seed so symbols differ under one seed
    std::seed_seq seq{seed, tickerHash(ticker)};
    std::mt19937 rng(seq);

    const double base = basePrice(ticker);
    const double vol = volatility(ticker);
    double previousClose = base;

    BarSeries bars;
    bars.reserve(length);
    for (size_t index = 0; index < length; ++index) {
        const double seasonal = std::sin(static_cast<double>(index) / 18.0) * vol * 0.8;
        const double drift = static_cast<double>(index % 20) * 0.05;
        const double random = (unitDraw(rng) - 0.5) * vol;

        const double open = std::max(5.0, previousClose + random * 0.5);
        const double close = std::max(5.0, open + seasonal + random * 0.7 + drift * 0.1);
        const double high = std::max(open, close) + unitDraw(rng) * vol;
        const double low = std::max(2.0, std::min(open, close) - unitDraw(rng) * vol);
        const auto volume = static_cast<int64_t>(std::llround(50000.0 + unitDraw(rng) * 125000.0));

        previousClose = close;

        Bar bar;
        bar.timestamp_ms = startMs + static_cast<int64_t>(index) * kDayMs;
        bar.open = roundCents(open);
        bar.high = roundCents(high);
        bar.low = roundCents(low);
        bar.close = roundCents(close);
        bar.volume = volume;
        bars.push_back(bar);
    }
    return bars;
}

} // namespace tdchart
