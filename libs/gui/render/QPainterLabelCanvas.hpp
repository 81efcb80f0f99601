#pragma once
#include "ILabelCanvas.hpp"
#include <QFont>

class QPainter;

namespace tdchart {

// ILabelCanvas on top of a caller-owned QPainter.
class QPainterLabelCanvas : public ILabelCanvas {
public:
    explicit QPainterLabelCanvas(QPainter& painter, QString fontFamily = QStringLiteral("Inter"));

    void save() override;
    void restore() override;
    void setFont(double pixelSize, bool bold) override;
    void setFillColor(const QColor& color) override;
    void fillText(const QString& text, const QPointF& center) override;

private:
    QPainter& m_painter;
    QString m_fontFamily;
};

} // namespace tdchart
