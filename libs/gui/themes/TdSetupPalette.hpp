#pragma once
#include "../../core/config/IndicatorConfig.hpp"
#include <QColor>

namespace tdchart {

struct TdSetupPalette {
    QColor sell;
    QColor buy;
    QColor highlight;

    // Invalid hex entries fall back to the built-in color for the variant.
    static TdSetupPalette fromColors(const TdSetupColors& colors, bool closeOnly);
    static TdSetupPalette defaults(bool closeOnly);
};

} // namespace tdchart
