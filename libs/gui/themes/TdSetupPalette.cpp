#include "TdSetupPalette.hpp"
#include "../TdChartLogging.hpp"

namespace tdchart {

namespace {

QColor toColor(const std::string& hex, const std::string& fallback) {
    QColor color(QString::fromStdString(hex));
    if (color.isValid()) {
        return color;
    }
    tLog_Warning("TdSetupPalette: invalid color" << QString::fromStdString(hex) << "- using" << QString::fromStdString(fallback));
    return QColor(QString::fromStdString(fallback));
}

} // namespace

TdSetupPalette TdSetupPalette::fromColors(const TdSetupColors& colors, bool closeOnly) {
    const TdSetupColors builtIn = IndicatorConfig::defaultColors(closeOnly);
    return TdSetupPalette{
        toColor(colors.sell, builtIn.sell),
        toColor(colors.buy, builtIn.buy),
        toColor(colors.highlight, builtIn.highlight),
    };
}

TdSetupPalette TdSetupPalette::defaults(bool closeOnly) {
    return fromColors(IndicatorConfig::defaultColors(closeOnly), closeOnly);
}

} // namespace tdchart
