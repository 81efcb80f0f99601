#pragma once
#include <QColor>
#include <QPointF>
#include <QString>

namespace tdchart {

/**
 * Minimal text-drawing surface an overlay paints through.
 * The host owns the real canvas; overlays never keep a reference past one draw call.
 */
class ILabelCanvas {
public:
    virtual ~ILabelCanvas() = default;

    virtual void save() = 0;
    virtual void restore() = 0;

    virtual void setFont(double pixelSize, bool bold) = 0;
    virtual void setFillColor(const QColor& color) = 0;

    // Draws text centered horizontally and vertically on the anchor point.
    virtual void fillText(const QString& text, const QPointF& center) = 0;
};

} // namespace tdchart
