#include "Log.hpp"
#include "config/IndicatorConfig.hpp"
#include "marketdata/BarCsvLoader.hpp"
#include "marketdata/MockBarFeed.hpp"
#include "CoordinateSystem.h"
#include "IndicatorOverlayModel.h"
#include "TdChartLogging.hpp"
#include "indicators/IndicatorRegistry.hpp"
#include "indicators/TdSetupIndicator.hpp"
#include "render/QPainterLabelCanvas.hpp"

#include <QCommandLineParser>
#include <QDateTime>
#include <QGuiApplication>
#include <QImage>
#include <QPainter>
#include <QTimeZone>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <exception>

using namespace tdchart;

namespace {

constexpr const char* kLogCat = "cli";

struct RenderRequest {
    QString path;
    int width = 1200;
    int height = 600;
    std::optional<double> from;
    std::optional<double> to;
};

std::string formatDate(int64_t timestamp_ms) {
    return QDateTime::fromMSecsSinceEpoch(timestamp_ms, QTimeZone::utc())
        .toString(QStringLiteral("yyyy-MM-dd"))
        .toStdString();
}

std::string formatCount(const std::optional<int>& count) {
    return count ? std::to_string(*count) : std::string("-");
}

BarSeries loadBars(const QCommandLineParser& parser, std::string& symbol) {
    const std::string requested = parser.value("symbol").toStdString();

    if (parser.isSet("csv")) {
        const auto data = BarCsvLoader::loadFile(parser.value("csv").toStdString());
        symbol = requested.empty() ? data.series.begin()->first : requested;
        const BarSeries* series = data.find(symbol);
        if (!series) {
            throw BarCsvError(fmt::format("symbol {} not found in {}", symbol, parser.value("csv").toStdString()));
        }
        return *series;
    }

    bool lengthOk = false;
    bool seedOk = false;
    const int length = parser.value("bars").toInt(&lengthOk);
    const uint seed = parser.value("seed").toUInt(&seedOk);
    if (!lengthOk || length < 0 || !seedOk) {
        throw std::invalid_argument("--bars and --seed must be non-negative integers");
    }
    symbol = requested.empty() ? MockBarFeed::symbols().front().ticker : requested;
    return MockBarFeed::generate(symbol, static_cast<size_t>(length), seed);
}

void printTable(const IndicatorOverlayModel& model, const std::string& symbol) {
    const auto& bars = model.bars();
    const auto results = model.results();

    fmt::print("{} {} ({} bars)\n", symbol, model.descriptor().shortName, bars.size());
    fmt::print("{:>6}  {:<10}  {:>10}  {:>4}  {:>4}\n", "index", "date", "close", "sell", "buy");
    for (size_t i = 0; i < bars.size(); ++i) {
        fmt::print("{:>6}  {:<10}  {:>10.2f}  {:>4}  {:>4}\n",
                   i, formatDate(bars[i].timestamp_ms), bars[i].close,
                   formatCount(results[i].sellSetup), formatCount(results[i].buySetup));
    }
}

void printTooltip(const TooltipPayload& payload) {
    fmt::print("\n{}\n", payload.name);
    for (const auto& entry : payload.values) {
        fmt::print("  {}: {}\n", entry.title, entry.value);
    }
}

bool renderOverlay(const IndicatorOverlayModel& model, const RenderRequest& request) {
    const auto& bars = model.bars();
    if (bars.empty()) {
        tLog_Warning("Nothing to render: series is empty");
        return false;
    }

    const double lastIndex = static_cast<double>(bars.size() - 1);
    const double to = request.to.value_or(lastIndex);
    const double from = request.from.value_or(std::max(0.0, to - 119.0));
    if (!std::isfinite(from) || !std::isfinite(to) || !(to >= from)) {
        throw std::invalid_argument("--to must not be before --from");
    }

    PaneBounding pane{0.0, 0.0, static_cast<double>(request.width), static_cast<double>(request.height)};
    const VisibleRange range{from, to};
    const double barWidth = pane.width / (to - from + 1.0);

    // Fit the price scale to the visible bars with a margin for the labels
    const auto viewport = CoordinateSystem::fitViewport(bars, range, pane);
    if (!viewport) {
        throw std::invalid_argument(fmt::format("--from/--to window does not overlap bars 0-{}", bars.size() - 1));
    }
    const ViewportPriceAxis axis(*viewport);

    QImage image(request.width, request.height, QImage::Format_ARGB32_Premultiplied);
    image.fill(QColor(QStringLiteral("#0f172a")));

    QPainter painter(&image);
    painter.setRenderHint(QPainter::TextAntialiasing);
    QPainterLabelCanvas canvas(painter);
    const bool painted = model.drawFrame(canvas, range, pane, &axis, barWidth);
    painter.end();

    if (!image.save(request.path)) {
        throw std::runtime_error(fmt::format("failed to write {}", request.path.toStdString()));
    }
    tLog_App("Rendered overlay to" << request.path << "bars" << from << "-" << to);
    return painted;
}

} // namespace

int main(int argc, char* argv[]) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("tdsetup_cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Computes TD Setup counts for a bar series and renders the count overlay.");
    parser.addHelpOption();
    parser.addOptions({
        {"csv", "Read bars from a CSV file instead of the mock feed.", "file"},
        {"symbol", "Symbol to use (default: first symbol).", "symbol"},
        {"config", "JSON file overriding the TD Setup indicator catalog.", "file"},
        {"indicator", "Registered indicator name.", "name", IndicatorConfig::kRangeAwareName},
        {"bars", "Mock series length.", "count", QString::number(MockBarFeed::kDefaultLength)},
        {"seed", "Mock series seed.", "seed", "42"},
        {"cursor", "Bar index for the tooltip (default: last bar).", "index"},
        {"render", "Render the overlay to an image file.", "png"},
        {"from", "First visible bar index for --render.", "index"},
        {"to", "Last visible bar index for --render.", "index"},
        {"width", "Image width in pixels.", "px", "1200"},
        {"height", "Image height in pixels.", "px", "600"},
        {"quiet", "Do not print the per-bar table."},
    });
    parser.process(app);

    try {
        const auto options = parser.isSet("config")
            ? IndicatorConfig::loadFile(parser.value("config").toStdString())
            : IndicatorConfig::defaultTdSetupOptions();

        auto& registry = IndicatorRegistry::instance();
        TdSetupIndicator::initializeCustomIndicators(registry, options);

        const std::string indicatorName = parser.value("indicator").toStdString();
        auto descriptor = registry.find(indicatorName);
        if (!descriptor) {
            std::string known;
            for (const auto& name : registry.supportedIndicators()) {
                known += (known.empty() ? "" : ", ") + name;
            }
            LOG_E(kLogCat, "unknown indicator {} (registered: {})", indicatorName, known);
            return 2;
        }

        std::string symbol;
        IndicatorOverlayModel model(descriptor);
        model.setBars(loadBars(parser, symbol));

        if (!parser.isSet("quiet")) {
            printTable(model, symbol);
        }

        std::optional<long long> cursor;
        if (parser.isSet("cursor")) {
            bool ok = false;
            const long long value = parser.value("cursor").toLongLong(&ok);
            if (!ok) {
                throw std::invalid_argument("--cursor must be an integer");
            }
            cursor = value;
        }
        printTooltip(model.tooltipAt(cursor));

        if (parser.isSet("render")) {
            RenderRequest request;
            request.path = parser.value("render");
            request.width = std::max(1, parser.value("width").toInt());
            request.height = std::max(1, parser.value("height").toInt());
            bool ok = false;
            if (parser.isSet("from")) {
                request.from = parser.value("from").toDouble(&ok);
                if (!ok) throw std::invalid_argument("--from must be a number");
            }
            if (parser.isSet("to")) {
                request.to = parser.value("to").toDouble(&ok);
                if (!ok) throw std::invalid_argument("--to must be a number");
            }
            if (!renderOverlay(model, request)) {
                LOG_W(kLogCat, "overlay had nothing to paint");
            }
        }
    } catch (const std::exception& e) {
        LOG_E(kLogCat, "{}", e.what());
        return 1;
    }

    return 0;
}
