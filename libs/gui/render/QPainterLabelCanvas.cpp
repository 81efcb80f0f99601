#include "QPainterLabelCanvas.hpp"
#include <QFontMetricsF>
#include <QPainter>
#include <algorithm>
#include <cmath>
#include <utility>

namespace tdchart {

QPainterLabelCanvas::QPainterLabelCanvas(QPainter& painter, QString fontFamily)
    : m_painter(painter)
    , m_fontFamily(std::move(fontFamily)) {}

void QPainterLabelCanvas::save() {
    m_painter.save();
}

void QPainterLabelCanvas::restore() {
    m_painter.restore();
}

void QPainterLabelCanvas::setFont(double pixelSize, bool bold) {
    QFont font(m_fontFamily);
    font.setStyleHint(QFont::SansSerif);
    font.setPixelSize(std::max(1, static_cast<int>(std::lround(pixelSize))));
    font.setBold(bold);
    m_painter.setFont(font);
}

void QPainterLabelCanvas::setFillColor(const QColor& color) {
    // QPainter draws text with the pen color
    m_painter.setPen(color);
}

void QPainterLabelCanvas::fillText(const QString& text, const QPointF& center) {
    const QFontMetricsF metrics(m_painter.font());
    QRectF box = metrics.boundingRect(text);
    box.moveCenter(center);
    m_painter.drawText(box, Qt::AlignCenter, text);
}

} // namespace tdchart
